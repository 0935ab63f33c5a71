#include "vigil/policy/policy_source.h"

#include "vigil/policy/exceptions.h"

#include <algorithm>
#include <kj/debug.h>

namespace vigil::policy {

namespace {

constexpr kj::StringPtr kPolicyFilePrefix = "POL_"_kj;
constexpr kj::StringPtr kPolicyFileSuffix = ".json"_kj;

} // namespace

// ============================================================================
// DirectoryPolicySource
// ============================================================================

DirectoryPolicySource::DirectoryPolicySource(kj::StringPtr path)
    : description_(kj::str("directory ", path)), path_(kj::str(path)) {}

DirectoryPolicySource::DirectoryPolicySource(kj::Own<const kj::ReadableDirectory> directory,
                                             kj::StringPtr description)
    : description_(kj::str(description)), directory_(kj::mv(directory)) {}

bool DirectoryPolicySource::is_policy_file_name(kj::StringPtr name) {
  return name.size() > kPolicyFilePrefix.size() + kPolicyFileSuffix.size() &&
         name.startsWith(kPolicyFilePrefix) && name.endsWith(kPolicyFileSuffix);
}

kj::Own<const kj::ReadableDirectory> DirectoryPolicySource::open_directory() const {
  KJ_IF_SOME(directory, directory_) {
    return directory->clone();
  }
  KJ_IF_SOME(path, path_) {
    auto fs = kj::newDiskFilesystem();
    auto resolved = fs->getCurrentPath().evalNative(path);
    KJ_IF_SOME(directory, fs->getRoot().tryOpenSubdir(resolved)) {
      return kj::mv(directory);
    }
    throw PolicyRegistryError(kj::str("Policy directory not found: ", path));
  }
  KJ_UNREACHABLE;
}

kj::Array<PolicyDocument> DirectoryPolicySource::read() const {
  kj::Vector<PolicyDocument> documents;
  try {
    auto directory = open_directory();
    auto entries = directory->listEntries();
    kj::Vector<kj::StringPtr> names;
    for (auto& entry : entries) {
      if ((entry.type == kj::FsNode::Type::FILE || entry.type == kj::FsNode::Type::SYMLINK) &&
          is_policy_file_name(entry.name)) {
        names.add(entry.name);
      }
    }
    std::sort(names.begin(), names.end());

    for (auto name : names) {
      auto file = directory->openFile(kj::Path::parse(name));
      documents.add(PolicyDocument{kj::str(name), file->readAllText()});
    }
  } catch (const kj::Exception& e) {
    throw PolicyRegistryError(
        kj::str("Failed to read policy ", description_, ": ", e.getDescription()));
  }
  return documents.releaseAsArray();
}

kj::String DirectoryPolicySource::describe() const {
  return kj::str(description_);
}

// ============================================================================
// InMemoryPolicySource
// ============================================================================

InMemoryPolicySource& InMemoryPolicySource::add(kj::StringPtr origin, kj::StringPtr content) {
  documents_.add(PolicyDocument{kj::str(origin), kj::str(content)});
  return *this;
}

kj::Array<PolicyDocument> InMemoryPolicySource::read() const {
  return KJ_MAP(document, documents_) {
    return PolicyDocument{kj::str(document.origin), kj::str(document.content)};
  };
}

kj::String InMemoryPolicySource::describe() const {
  return kj::str("in-memory source (", documents_.size(), " documents)");
}

} // namespace vigil::policy
