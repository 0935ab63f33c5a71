#pragma once

#include <kj/array.h>
#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace vigil::policy {

/**
 * @brief One unit of rule-source text
 *
 * The content is a JSON object (one rule) or a JSON array of rule objects.
 */
struct PolicyDocument {
  kj::String origin; ///< File name or caller-chosen label, used in diagnostics
  kj::String content;
};

/**
 * @brief Where rule definitions come from
 *
 * Read once by PolicyRegistry::load(); implementations perform all of their
 * I/O inside read().
 */
class PolicySource {
public:
  virtual ~PolicySource() = default;

  /**
   * @brief Produce every document in a stable order
   * @throws PolicyRegistryError if the source is missing or cannot be read
   */
  [[nodiscard]] virtual kj::Array<PolicyDocument> read() const = 0;

  /// Human-readable description for log lines and errors
  [[nodiscard]] virtual kj::String describe() const = 0;
};

/**
 * @brief Every POL_*.json file of one directory, ordered by file name
 */
class DirectoryPolicySource final : public PolicySource {
public:
  /**
   * @param path Native path, relative paths resolve against the working directory
   */
  explicit DirectoryPolicySource(kj::StringPtr path);

  /**
   * @brief Read from an already opened directory
   */
  DirectoryPolicySource(kj::Own<const kj::ReadableDirectory> directory, kj::StringPtr description);

  [[nodiscard]] kj::Array<PolicyDocument> read() const override;
  [[nodiscard]] kj::String describe() const override;

  /// Whether a file name is picked up by the directory scan
  [[nodiscard]] static bool is_policy_file_name(kj::StringPtr name);

private:
  kj::Own<const kj::ReadableDirectory> open_directory() const;

  kj::String description_;
  kj::Maybe<kj::String> path_;
  kj::Maybe<kj::Own<const kj::ReadableDirectory>> directory_;
};

/**
 * @brief Documents supplied directly by the embedding application
 */
class InMemoryPolicySource final : public PolicySource {
public:
  InMemoryPolicySource() = default;

  InMemoryPolicySource& add(kj::StringPtr origin, kj::StringPtr content);

  [[nodiscard]] kj::Array<PolicyDocument> read() const override;
  [[nodiscard]] kj::String describe() const override;

private:
  kj::Vector<PolicyDocument> documents_;
};

} // namespace vigil::policy
