#pragma once

#include "vigil/core/json.h"
#include "vigil/policy/attributes.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>
#include <regex>

namespace vigil::policy {

/// Prefix every policy id must carry
inline constexpr kj::StringPtr kPolicyIdPrefix = "POL_"_kj;

/// Policy id of the decision returned when no policy matched
inline constexpr kj::StringPtr kDefaultAllowPolicyId = "POL_000_default_allow"_kj;

/// Policy id of the decision returned when evaluation failed
inline constexpr kj::StringPtr kFailClosePolicyId = "POL_006_fail_close"_kj;

/**
 * @brief Whether an id belongs to the engine and may not be declared by a rule source
 */
[[nodiscard]] bool is_reserved_policy_id(kj::StringPtr id);

/**
 * @brief Outcome a policy prescribes when its conditions hold
 */
enum class PolicySeverity : std::uint8_t {
  Allow = 0,
  Deny = 1,
};

/// "allow" or "deny", the spelling used by rule sources
[[nodiscard]] kj::StringPtr to_string(PolicySeverity severity);
[[nodiscard]] kj::Maybe<PolicySeverity> parse_policy_severity(kj::StringPtr text);

/**
 * @brief Condition predicate enumeration
 *
 * The closed operator set of the condition language. Unknown is kept for keys
 * the loader did not recognize; it never matches.
 */
enum class ConditionType : std::uint8_t {
  ActionType = 0,          ///< action type equals
  ActionTypePrefix = 1,    ///< action type starts with
  TargetEquals = 2,        ///< target equals
  TargetContains = 3,      ///< target contains substring
  TargetPattern = 4,       ///< ECMAScript regex finds a match in target
  MetadataKey = 5,         ///< metadata key present
  MetadataEquals = 6,      ///< metadata value present and equal
  MetadataGreaterThan = 7, ///< numeric metadata value (absent = 0) above threshold
  MetadataInList = 8,      ///< metadata value present and in the list
  MetadataNotInList = 9,   ///< metadata value absent or not in the list
  Always = 10,             ///< matches when the flag is true
  Unknown = 255,
};

/// Rule-source key of a condition type, e.g. "target_pattern"
[[nodiscard]] kj::StringPtr to_string(ConditionType type);
[[nodiscard]] ConditionType condition_type_from_key(kj::StringPtr key);

/**
 * @brief One typed predicate of a policy
 *
 * Only the operands relevant to the type are populated. Regex patterns are
 * compiled once when the policy is loaded; a pattern that does not compile
 * is kept with its error and fails at evaluation time.
 */
struct Condition {
  ConditionType type{ConditionType::Unknown};
  kj::String key;     ///< Condition key as written in the rule source
  kj::String operand; ///< String operand of action/target/metadata_key conditions

  // Metadata conditions
  kj::String metadata_key;
  kj::Maybe<AttributeValue> expected; ///< metadata_value
  double threshold{0.0};              ///< metadata_gt
  kj::Array<AttributeValue> allowed;  ///< metadata_in_list / metadata_not_in_list

  bool flag{false}; ///< always

  // target_pattern
  kj::Maybe<std::regex> pattern;
  kj::String pattern_error;

  Condition() = default;
  Condition(Condition&&) = default;
  Condition& operator=(Condition&&) = default;

  // Copy constructor for deep copy
  Condition(const Condition& other);
  Condition& operator=(const Condition& other);
};

/**
 * @brief Immutable named rule
 *
 * Conditions are conjunctive and checked in source order. A policy with no
 * conditions never matches.
 */
struct Policy {
  kj::String id;
  kj::String name;
  kj::String description;
  PolicySeverity severity{PolicySeverity::Deny};
  kj::Array<Condition> conditions;
  kj::String origin; ///< Document the definition was loaded from

  Policy() = default;
  Policy(Policy&&) = default;
  Policy& operator=(Policy&&) = default;

  // Copy constructor for deep copy
  Policy(const Policy& other);
  Policy& operator=(const Policy& other);

  /**
   * @brief Parse one rule definition
   *
   * Requires string fields id, name, description and severity ("allow" or
   * "deny") and an object of conditions. Ids must carry the POL_ prefix and
   * must not be reserved. Known condition keys must have the documented value
   * shape; unknown keys are kept as never-matching conditions.
   *
   * @param origin Document name used in error messages
   * @throws PolicyValidationError on any violation
   */
  [[nodiscard]] static Policy from_json(const core::JsonValue& definition, kj::StringPtr origin);

  /**
   * @brief Serialize back to the rule-source form
   */
  [[nodiscard]] kj::String to_json() const;
};

} // namespace vigil::policy
