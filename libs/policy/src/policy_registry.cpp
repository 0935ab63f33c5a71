#include "vigil/policy/policy_registry.h"

#include "vigil/core/error.h"
#include "vigil/core/json.h"
#include "vigil/policy/exceptions.h"

#include <kj/map.h>
#include <kj/vector.h>

namespace vigil::policy {

namespace {

bool is_blank(kj::StringPtr text) {
  for (char c : text) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }
  return true;
}

} // namespace

PolicyRegistry::PolicyRegistry(kj::Own<PolicySource> source, core::Logger& logger)
    : source_(kj::mv(source)), logger_(logger) {}

kj::ArrayPtr<const Policy> PolicyRegistry::load() {
  auto lock = state_.lockExclusive();
  if (!lock->loaded) {
    // Built off to the side; published only once every definition is valid.
    auto policies = read_policies();
    lock->policies = kj::mv(policies);
    lock->loaded = true;
    logger_.info(kj::str("Loaded ", lock->policies.size(), " policies from ", source_->describe()));
  }
  return lock->policies.asPtr();
}

kj::Array<Policy> PolicyRegistry::get_all() {
  auto policies = load();
  auto copy = kj::heapArrayBuilder<Policy>(policies.size());
  for (const auto& policy : policies) {
    copy.add(policy);
  }
  return copy.finish();
}

kj::Maybe<const Policy&> PolicyRegistry::get_by_id(kj::StringPtr id) {
  for (const auto& policy : load()) {
    if (policy.id == id) {
      return policy;
    }
  }
  return kj::none;
}

size_t PolicyRegistry::size() const {
  return state_.lockExclusive()->policies.size();
}

bool PolicyRegistry::is_loaded() const {
  return state_.lockExclusive()->loaded;
}

kj::Array<Policy> PolicyRegistry::read_policies() const {
  auto documents = source_->read();
  if (documents.size() == 0) {
    throw PolicyRegistryError(kj::str("No policy files found in ", source_->describe()));
  }

  kj::Vector<Policy> policies;
  for (const auto& document : documents) {
    parse_document(document, policies);
  }
  if (policies.size() == 0) {
    throw PolicyRegistryError(kj::str("No policy definitions found in ", source_->describe()));
  }

  kj::HashMap<kj::StringPtr, kj::StringPtr> seen;
  for (const auto& policy : policies) {
    KJ_IF_SOME(first_origin, seen.find(policy.id)) {
      throw PolicyValidationError(kj::str("Duplicate policy ID: ", policy.id,
                                          " (first defined in ", first_origin, ")"),
                                  policy.id.asPtr(), policy.origin);
    }
    seen.insert(policy.id, policy.origin);
    report_suspicious(policy);
  }
  return policies.releaseAsArray();
}

void PolicyRegistry::parse_document(const PolicyDocument& document,
                                    kj::Vector<Policy>& out) const {
  if (is_blank(document.content)) {
    throw PolicyValidationError(kj::str("Policy file is empty: ", document.origin), kj::none,
                                document.origin);
  }

  core::JsonDocument doc;
  try {
    doc = core::JsonDocument::parse(document.content);
  } catch (const core::ParseException& e) {
    throw PolicyRegistryError(kj::str("Failed to parse ", document.origin, ": ", e.message()));
  }

  auto root = doc.root();
  if (root.is_array()) {
    if (root.size() == 0) {
      throw PolicyValidationError(kj::str("Policy file holds no definitions: ", document.origin),
                                  kj::none, document.origin);
    }
    root.for_each_array([&](const core::JsonValue& definition) {
      out.add(Policy::from_json(definition, document.origin));
    });
  } else if (root.is_object()) {
    out.add(Policy::from_json(root, document.origin));
  } else {
    throw PolicyValidationError(kj::str("Policy document must be an object or an array, found ",
                                        root.type_name()),
                                kj::none, document.origin);
  }
}

void PolicyRegistry::report_suspicious(const Policy& policy) const {
  if (policy.conditions.size() == 0) {
    logger_.warn(kj::str("Policy ", policy.id, " has no conditions and will never match"));
  }
  for (const auto& condition : policy.conditions) {
    if (condition.type == ConditionType::Unknown) {
      logger_.warn(kj::str("Policy ", policy.id, " has unknown condition '", condition.key,
                           "'; the policy will never match"));
    } else if (condition.pattern_error.size() > 0) {
      logger_.warn(kj::str("Policy ", policy.id, " has an invalid target_pattern '",
                           condition.operand, "': ", condition.pattern_error,
                           "; evaluating it fails closed"));
    }
  }
}

} // namespace vigil::policy
