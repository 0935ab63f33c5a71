#include "vigil/policy/policy.h"

#include "vigil/core/error.h"
#include "vigil/policy/exceptions.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace vigil::policy {

namespace {

struct ConditionKeyEntry {
  ConditionType type;
  kj::StringPtr key;
};

constexpr ConditionKeyEntry kConditionKeys[] = {
    {ConditionType::ActionType, "action_type"_kj},
    {ConditionType::ActionTypePrefix, "action_type_prefix"_kj},
    {ConditionType::TargetEquals, "target_equals"_kj},
    {ConditionType::TargetContains, "target_contains"_kj},
    {ConditionType::TargetPattern, "target_pattern"_kj},
    {ConditionType::MetadataKey, "metadata_key"_kj},
    {ConditionType::MetadataEquals, "metadata_value"_kj},
    {ConditionType::MetadataGreaterThan, "metadata_gt"_kj},
    {ConditionType::MetadataInList, "metadata_in_list"_kj},
    {ConditionType::MetadataNotInList, "metadata_not_in_list"_kj},
    {ConditionType::Always, "always"_kj},
};

kj::Maybe<AttributeValue> clone_maybe(const kj::Maybe<AttributeValue>& value) {
  KJ_IF_SOME(v, value) {
    return clone_value(v);
  }
  return kj::none;
}

kj::Array<AttributeValue> clone_values(const kj::Array<AttributeValue>& values) {
  return KJ_MAP(v, values) {
    return clone_value(v);
  };
}

// Parser state for one definition; every error names the policy and the document.
class DefinitionReader {
public:
  DefinitionReader(const core::JsonValue& definition, kj::StringPtr origin)
      : definition_(definition), origin_(origin) {}

  [[noreturn]] void fail(kj::StringPtr message) const {
    throw PolicyValidationError(message, policy_id_, origin_);
  }

  kj::StringPtr require_string(kj::StringPtr field) const {
    KJ_IF_SOME(value, definition_.get(field)) {
      KJ_IF_SOME(s, value.get_string_ptr()) {
        return s;
      }
      fail(kj::str("field '", field, "' must be a string, found ", value.type_name()));
    }
    fail(kj::str("missing required field '", field, "'"));
  }

  void set_policy_id(kj::StringPtr id) {
    policy_id_ = id;
  }

  Condition read_condition(kj::StringPtr key, const core::JsonValue& value) const {
    Condition condition;
    condition.key = kj::str(key);
    condition.type = condition_type_from_key(key);

    switch (condition.type) {
    case ConditionType::ActionType:
    case ConditionType::ActionTypePrefix:
    case ConditionType::TargetEquals:
    case ConditionType::TargetContains:
    case ConditionType::MetadataKey:
      condition.operand = kj::str(string_operand(key, value));
      break;

    case ConditionType::TargetPattern:
      condition.operand = kj::str(string_operand(key, value));
      try {
        condition.pattern = std::regex(condition.operand.cStr(), std::regex::ECMAScript);
      } catch (const std::regex_error& e) {
        // Kept; evaluating this condition fails the action closed.
        condition.pattern_error = kj::str(e.what());
      }
      break;

    case ConditionType::MetadataEquals: {
      auto spec = object_operand(key, value);
      condition.metadata_key = kj::str(metadata_key_of(key, spec));
      KJ_IF_SOME(expected, spec.get("value")) {
        if (expected.is_null()) {
          fail(kj::str("condition '", key, "' value must not be null"));
        }
        condition.expected = attribute_operand(key, expected);
      } else {
        fail(kj::str("condition '", key, "' is missing 'value'"));
      }
      break;
    }

    case ConditionType::MetadataGreaterThan: {
      auto spec = object_operand(key, value);
      condition.metadata_key = kj::str(metadata_key_of(key, spec));
      KJ_IF_SOME(threshold, spec.get("threshold")) {
        if (!threshold.is_number()) {
          fail(kj::str("condition '", key, "' threshold must be a number, found ",
                       threshold.type_name()));
        }
        condition.threshold = threshold.get_double();
      } else {
        fail(kj::str("condition '", key, "' is missing 'threshold'"));
      }
      break;
    }

    case ConditionType::MetadataInList:
    case ConditionType::MetadataNotInList: {
      auto spec = object_operand(key, value);
      condition.metadata_key = kj::str(metadata_key_of(key, spec));
      kj::Vector<AttributeValue> allowed;
      KJ_IF_SOME(list, spec.get("allowed")) {
        if (!list.is_array()) {
          fail(kj::str("condition '", key, "' allowed must be an array, found ",
                       list.type_name()));
        }
        list.for_each_array([&](const core::JsonValue& item) {
          if (item.is_array() || item.is_null()) {
            fail(kj::str("condition '", key, "' allowed entries must be scalars, found ",
                         item.type_name()));
          }
          allowed.add(attribute_operand(key, item));
        });
      }
      condition.allowed = allowed.releaseAsArray();
      break;
    }

    case ConditionType::Always:
      if (!value.is_bool()) {
        fail(kj::str("condition '", key, "' must be a boolean, found ", value.type_name()));
      }
      condition.flag = value.get_bool();
      break;

    case ConditionType::Unknown:
      break;
    }
    return condition;
  }

private:
  kj::StringPtr string_operand(kj::StringPtr key, const core::JsonValue& value) const {
    KJ_IF_SOME(s, value.get_string_ptr()) {
      return s;
    }
    fail(kj::str("condition '", key, "' must be a string, found ", value.type_name()));
  }

  core::JsonValue object_operand(kj::StringPtr key, const core::JsonValue& value) const {
    if (!value.is_object()) {
      fail(kj::str("condition '", key, "' must be an object, found ", value.type_name()));
    }
    return value;
  }

  kj::StringPtr metadata_key_of(kj::StringPtr key, const core::JsonValue& spec) const {
    KJ_IF_SOME(field, spec.get("key")) {
      KJ_IF_SOME(s, field.get_string_ptr()) {
        return s;
      }
      fail(kj::str("condition '", key, "' key must be a string, found ", field.type_name()));
    }
    fail(kj::str("condition '", key, "' is missing 'key'"));
  }

  AttributeValue attribute_operand(kj::StringPtr key, const core::JsonValue& value) const {
    try {
      return value_from_json(value, key);
    } catch (const core::ValidationException& e) {
      fail(e.message());
    }
  }

  const core::JsonValue& definition_;
  kj::StringPtr origin_;
  kj::Maybe<kj::StringPtr> policy_id_;
};

} // namespace

bool is_reserved_policy_id(kj::StringPtr id) {
  return id == kDefaultAllowPolicyId || id == kFailClosePolicyId;
}

kj::StringPtr to_string(PolicySeverity severity) {
  switch (severity) {
  case PolicySeverity::Allow:
    return "allow"_kj;
  case PolicySeverity::Deny:
    return "deny"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<PolicySeverity> parse_policy_severity(kj::StringPtr text) {
  if (text == "allow"_kj) {
    return PolicySeverity::Allow;
  }
  if (text == "deny"_kj) {
    return PolicySeverity::Deny;
  }
  return kj::none;
}

kj::StringPtr to_string(ConditionType type) {
  for (const auto& entry : kConditionKeys) {
    if (entry.type == type) {
      return entry.key;
    }
  }
  return "unknown"_kj;
}

ConditionType condition_type_from_key(kj::StringPtr key) {
  for (const auto& entry : kConditionKeys) {
    if (entry.key == key) {
      return entry.type;
    }
  }
  return ConditionType::Unknown;
}

// ============================================================================
// Condition
// ============================================================================

Condition::Condition(const Condition& other)
    : type(other.type), key(kj::str(other.key)), operand(kj::str(other.operand)),
      metadata_key(kj::str(other.metadata_key)), expected(clone_maybe(other.expected)),
      threshold(other.threshold), allowed(clone_values(other.allowed)), flag(other.flag),
      pattern(other.pattern), pattern_error(kj::str(other.pattern_error)) {}

Condition& Condition::operator=(const Condition& other) {
  if (this != &other) {
    *this = Condition(other);
  }
  return *this;
}

// ============================================================================
// Policy
// ============================================================================

Policy::Policy(const Policy& other)
    : id(kj::str(other.id)), name(kj::str(other.name)), description(kj::str(other.description)),
      severity(other.severity), origin(kj::str(other.origin)) {
  auto copy = kj::heapArrayBuilder<Condition>(other.conditions.size());
  for (const auto& condition : other.conditions) {
    copy.add(condition);
  }
  conditions = copy.finish();
}

Policy& Policy::operator=(const Policy& other) {
  if (this != &other) {
    *this = Policy(other);
  }
  return *this;
}

Policy Policy::from_json(const core::JsonValue& definition, kj::StringPtr origin) {
  DefinitionReader reader(definition, origin);
  if (!definition.is_object()) {
    reader.fail(kj::str("policy definition must be an object, found ", definition.type_name()));
  }
  if (definition.size() == 0) {
    reader.fail("policy definition is empty");
  }

  Policy policy;
  policy.id = kj::str(reader.require_string("id"));
  reader.set_policy_id(policy.id);

  if (!policy.id.startsWith(kPolicyIdPrefix)) {
    reader.fail(kj::str("policy id '", policy.id, "' must start with '", kPolicyIdPrefix, "'"));
  }
  if (is_reserved_policy_id(policy.id)) {
    reader.fail(kj::str("policy id '", policy.id, "' is reserved"));
  }

  policy.name = kj::str(reader.require_string("name"));
  policy.description = kj::str(reader.require_string("description"));

  auto severity = reader.require_string("severity");
  KJ_IF_SOME(parsed, parse_policy_severity(severity)) {
    policy.severity = parsed;
  } else {
    reader.fail(kj::str("severity must be \"allow\" or \"deny\", found \"", severity, "\""));
  }

  KJ_IF_SOME(conditions, definition.get("conditions")) {
    if (!conditions.is_object()) {
      reader.fail(kj::str("field 'conditions' must be an object, found ", conditions.type_name()));
    }
    kj::Vector<Condition> parsed;
    conditions.for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
      parsed.add(reader.read_condition(key, value));
    });
    policy.conditions = parsed.releaseAsArray();
  } else {
    reader.fail("missing required field 'conditions'");
  }

  policy.origin = kj::str(origin);
  return policy;
}

kj::String Policy::to_json() const {
  auto builder = core::JsonBuilder::object();
  builder.put("id", id.asPtr())
      .put("name", name.asPtr())
      .put("description", description.asPtr())
      .put("severity", to_string(severity));
  builder.put_object("conditions", [this](core::JsonBuilder& object) {
    for (const auto& condition : conditions) {
      switch (condition.type) {
      case ConditionType::ActionType:
      case ConditionType::ActionTypePrefix:
      case ConditionType::TargetEquals:
      case ConditionType::TargetContains:
      case ConditionType::TargetPattern:
      case ConditionType::MetadataKey:
        object.put(condition.key, condition.operand.asPtr());
        break;
      case ConditionType::MetadataEquals:
        object.put_object(condition.key, [&condition](core::JsonBuilder& spec) {
          spec.put("key", condition.metadata_key.asPtr());
          KJ_IF_SOME(expected, condition.expected) {
            put_json_value(spec, "value", expected);
          }
        });
        break;
      case ConditionType::MetadataGreaterThan:
        object.put_object(condition.key, [&condition](core::JsonBuilder& spec) {
          spec.put("key", condition.metadata_key.asPtr()).put("threshold", condition.threshold);
        });
        break;
      case ConditionType::MetadataInList:
      case ConditionType::MetadataNotInList:
        object.put_object(condition.key, [&condition](core::JsonBuilder& spec) {
          spec.put("key", condition.metadata_key.asPtr());
          spec.put_array("allowed", [&condition](core::JsonBuilder& list) {
            for (const auto& value : condition.allowed) {
              add_json_value(list, value);
            }
          });
        });
        break;
      case ConditionType::Always:
        object.put(condition.key, condition.flag);
        break;
      case ConditionType::Unknown:
        object.put(condition.key, nullptr);
        break;
      }
    }
  });
  return builder.build();
}

} // namespace vigil::policy
