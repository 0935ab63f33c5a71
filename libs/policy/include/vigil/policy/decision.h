#pragma once

#include "vigil/core/json.h"
#include "vigil/policy/action.h"
#include "vigil/policy/attributes.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace vigil::policy {

enum class DecisionResult : std::uint8_t {
  Allow = 0,
  Deny = 1,
};

/**
 * @brief How strongly a decision binds the caller
 *
 * Derived from the result, never set independently: ALLOW is soft, DENY is hard.
 */
enum class DecisionSeverity : std::uint8_t {
  Soft = 0,
  Hard = 1,
};

/// "ALLOW" / "DENY"
[[nodiscard]] kj::StringPtr to_string(DecisionResult result);
[[nodiscard]] kj::Maybe<DecisionResult> parse_decision_result(kj::StringPtr text);

/// "soft" / "hard"
[[nodiscard]] kj::StringPtr to_string(DecisionSeverity severity);
[[nodiscard]] kj::Maybe<DecisionSeverity> parse_decision_severity(kj::StringPtr text);

[[nodiscard]] DecisionSeverity severity_for(DecisionResult result);

/**
 * @brief Serialization projection of a Decision
 *
 * The form handed to the agent runtime and to replay tooling. Absent
 * suggestion and alternative are written as JSON null.
 */
struct DecisionContract {
  kj::String decision_id;
  kj::String action_id;
  kj::String policy_id;
  DecisionResult result{DecisionResult::Deny};
  kj::String reason;
  kj::Maybe<kj::String> suggestion;
  kj::Maybe<AttributeMap> alternative;
  DecisionSeverity severity{DecisionSeverity::Hard};
  kj::String timestamp;

  void write_json(core::JsonBuilder& object) const;
  [[nodiscard]] kj::String to_json() const;

  /**
   * @throws core::ValidationException for missing fields, unknown result or
   *         severity strings, or a severity that contradicts the result
   */
  [[nodiscard]] static DecisionContract from_json(const core::JsonValue& object);
  [[nodiscard]] static DecisionContract from_json(kj::StringPtr json);

  bool operator==(const DecisionContract& other) const;
};

/**
 * @brief The outcome of adjudicating one Action
 *
 * Created exactly once per evaluation and immutable afterwards. A DENY always
 * carries a non-empty reason.
 */
class Decision final {
public:
  [[nodiscard]] static Decision allow(kj::StringPtr action_id, kj::StringPtr policy_id,
                                      kj::StringPtr reason);

  [[nodiscard]] static Decision deny(kj::StringPtr action_id, kj::StringPtr policy_id,
                                     kj::StringPtr reason,
                                     kj::Maybe<kj::StringPtr> suggestion = kj::none,
                                     kj::Maybe<AttributeMap> alternative = kj::none);

  /**
   * @throws core::ValidationException if an id is empty or a DENY has no reason
   */
  Decision(kj::String decision_id, kj::String action_id, kj::String policy_id,
           DecisionResult result, kj::String reason, kj::Maybe<kj::String> suggestion,
           kj::Maybe<AttributeMap> alternative, std::int64_t timestamp_ns);

  Decision(Decision&&) = default;
  Decision& operator=(Decision&&) = default;
  KJ_DISALLOW_COPY(Decision);

  [[nodiscard]] Decision clone() const;

  [[nodiscard]] kj::StringPtr decision_id() const {
    return decision_id_;
  }
  [[nodiscard]] kj::StringPtr action_id() const {
    return action_id_;
  }
  [[nodiscard]] kj::StringPtr policy_id() const {
    return policy_id_;
  }
  [[nodiscard]] DecisionResult result() const {
    return result_;
  }
  [[nodiscard]] bool is_allowed() const {
    return result_ == DecisionResult::Allow;
  }
  [[nodiscard]] bool is_denied() const {
    return result_ == DecisionResult::Deny;
  }
  [[nodiscard]] DecisionSeverity severity() const {
    return severity_for(result_);
  }
  [[nodiscard]] kj::StringPtr reason() const {
    return reason_;
  }
  [[nodiscard]] kj::Maybe<kj::StringPtr> suggestion() const;
  [[nodiscard]] kj::Maybe<const AttributeMap&> alternative() const;

  [[nodiscard]] std::int64_t timestamp_ns() const {
    return timestamp_ns_;
  }

  /// ISO-8601 UTC rendering of timestamp_ns()
  [[nodiscard]] kj::String timestamp() const;

  [[nodiscard]] DecisionContract to_contract() const;

  /**
   * @brief Compare everything except decision id and timestamp
   */
  [[nodiscard]] bool same_outcome(const Decision& other) const;

private:
  kj::String decision_id_;
  kj::String action_id_;
  kj::String policy_id_;
  DecisionResult result_;
  kj::String reason_;
  kj::Maybe<kj::String> suggestion_;
  kj::Maybe<AttributeMap> alternative_;
  std::int64_t timestamp_ns_;
};

/**
 * @brief Log and audit form of a decision, joined with the action it judged
 */
struct DecisionRecord {
  static constexpr kj::StringPtr kLogType = "policy_decision"_kj;

  kj::String decision_id;
  kj::String action_id;
  kj::String action_type;
  kj::String action_target;
  AttributeMap action_metadata;
  kj::String policy_id;
  DecisionResult result{DecisionResult::Deny};
  kj::String reason;
  kj::Maybe<kj::String> suggestion;
  kj::Maybe<AttributeMap> alternative;
  DecisionSeverity severity{DecisionSeverity::Hard};
  kj::String timestamp;

  [[nodiscard]] static DecisionRecord from(const Decision& decision, const Action& action);

  [[nodiscard]] DecisionRecord clone() const;

  void write_json(core::JsonBuilder& object) const;
  [[nodiscard]] kj::String to_json() const;
};

} // namespace vigil::policy
