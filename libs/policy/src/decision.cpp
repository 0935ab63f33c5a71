#include "vigil/policy/decision.h"

#include "vigil/core/error.h"
#include "vigil/core/id.h"
#include "vigil/core/time.h"

#include <kj/debug.h>

namespace vigil::policy {

namespace {

kj::Maybe<kj::String> copy_string(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(s, value) {
    return kj::str(s);
  }
  return kj::none;
}

kj::Maybe<AttributeMap> copy_map(const kj::Maybe<AttributeMap>& value) {
  KJ_IF_SOME(map, value) {
    return map.clone();
  }
  return kj::none;
}

void put_optional(core::JsonBuilder& object, const kj::Maybe<kj::String>& suggestion,
                  const kj::Maybe<AttributeMap>& alternative) {
  KJ_IF_SOME(s, suggestion) {
    object.put("suggestion", s.asPtr());
  } else {
    object.put("suggestion", nullptr);
  }
  KJ_IF_SOME(map, alternative) {
    object.put_object("alternative", [&map](core::JsonBuilder& nested) { map.write_json(nested); });
  } else {
    object.put("alternative", nullptr);
  }
}

kj::StringPtr require_field(const core::JsonValue& object, kj::StringPtr field) {
  KJ_IF_SOME(value, object.get(field)) {
    KJ_IF_SOME(s, value.get_string_ptr()) {
      return s;
    }
    throw core::ValidationException(
        kj::str("decision field '", field, "' must be a string, found ", value.type_name()));
  }
  throw core::ValidationException(kj::str("decision is missing field '", field, "'"));
}

} // namespace

kj::StringPtr to_string(DecisionResult result) {
  switch (result) {
  case DecisionResult::Allow:
    return "ALLOW"_kj;
  case DecisionResult::Deny:
    return "DENY"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<DecisionResult> parse_decision_result(kj::StringPtr text) {
  if (text == "ALLOW"_kj) {
    return DecisionResult::Allow;
  }
  if (text == "DENY"_kj) {
    return DecisionResult::Deny;
  }
  return kj::none;
}

kj::StringPtr to_string(DecisionSeverity severity) {
  switch (severity) {
  case DecisionSeverity::Soft:
    return "soft"_kj;
  case DecisionSeverity::Hard:
    return "hard"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<DecisionSeverity> parse_decision_severity(kj::StringPtr text) {
  if (text == "soft"_kj) {
    return DecisionSeverity::Soft;
  }
  if (text == "hard"_kj) {
    return DecisionSeverity::Hard;
  }
  return kj::none;
}

DecisionSeverity severity_for(DecisionResult result) {
  return result == DecisionResult::Deny ? DecisionSeverity::Hard : DecisionSeverity::Soft;
}

// ============================================================================
// DecisionContract
// ============================================================================

void DecisionContract::write_json(core::JsonBuilder& object) const {
  object.put("decision_id", decision_id.asPtr())
      .put("action_id", action_id.asPtr())
      .put("policy_id", policy_id.asPtr())
      .put("result", to_string(result))
      .put("reason", reason.asPtr());
  put_optional(object, suggestion, alternative);
  object.put("severity", to_string(severity)).put("timestamp", timestamp.asPtr());
}

kj::String DecisionContract::to_json() const {
  auto builder = core::JsonBuilder::object();
  write_json(builder);
  return builder.build();
}

DecisionContract DecisionContract::from_json(const core::JsonValue& object) {
  if (!object.is_object()) {
    throw core::ValidationException(
        kj::str("decision must be a JSON object, found ", object.type_name()));
  }

  DecisionContract contract;
  contract.decision_id = kj::str(require_field(object, "decision_id"));
  contract.action_id = kj::str(require_field(object, "action_id"));
  contract.policy_id = kj::str(require_field(object, "policy_id"));
  contract.reason = kj::str(require_field(object, "reason"));
  contract.timestamp = kj::str(require_field(object, "timestamp"));

  auto result = require_field(object, "result");
  KJ_IF_SOME(parsed, parse_decision_result(result)) {
    contract.result = parsed;
  } else {
    throw core::ValidationException(kj::str("unknown decision result '", result, "'"));
  }

  auto severity = require_field(object, "severity");
  KJ_IF_SOME(parsed, parse_decision_severity(severity)) {
    contract.severity = parsed;
  } else {
    throw core::ValidationException(kj::str("unknown decision severity '", severity, "'"));
  }
  if (contract.severity != severity_for(contract.result)) {
    throw core::ValidationException(
        kj::str("severity '", severity, "' contradicts result '", result, "'"));
  }

  KJ_IF_SOME(value, object.get("suggestion")) {
    if (!value.is_null()) {
      KJ_IF_SOME(s, value.get_string_ptr()) {
        contract.suggestion = kj::str(s);
      } else {
        throw core::ValidationException(
            kj::str("decision field 'suggestion' must be a string or null, found ",
                    value.type_name()));
      }
    }
  }
  KJ_IF_SOME(value, object.get("alternative")) {
    if (!value.is_null()) {
      contract.alternative = AttributeMap::from_json(value);
    }
  }
  return contract;
}

DecisionContract DecisionContract::from_json(kj::StringPtr json) {
  auto doc = core::JsonDocument::parse(json);
  return from_json(doc.root());
}

bool DecisionContract::operator==(const DecisionContract& other) const {
  if (decision_id != other.decision_id || action_id != other.action_id ||
      policy_id != other.policy_id || result != other.result || reason != other.reason ||
      severity != other.severity || timestamp != other.timestamp) {
    return false;
  }
  KJ_IF_SOME(mine, suggestion) {
    KJ_IF_SOME(theirs, other.suggestion) {
      if (mine != theirs) {
        return false;
      }
    } else {
      return false;
    }
  } else if (other.suggestion != kj::none) {
    return false;
  }
  KJ_IF_SOME(mine, alternative) {
    KJ_IF_SOME(theirs, other.alternative) {
      return mine == theirs;
    }
    return false;
  }
  return other.alternative == kj::none;
}

// ============================================================================
// Decision
// ============================================================================

Decision Decision::allow(kj::StringPtr action_id, kj::StringPtr policy_id, kj::StringPtr reason) {
  return Decision(core::generate_uuid_v4(), kj::str(action_id), kj::str(policy_id),
                  DecisionResult::Allow, kj::str(reason), kj::none, kj::none,
                  core::now_unix_ns());
}

Decision Decision::deny(kj::StringPtr action_id, kj::StringPtr policy_id, kj::StringPtr reason,
                        kj::Maybe<kj::StringPtr> suggestion,
                        kj::Maybe<AttributeMap> alternative) {
  kj::Maybe<kj::String> owned;
  KJ_IF_SOME(s, suggestion) {
    owned = kj::str(s);
  }
  return Decision(core::generate_uuid_v4(), kj::str(action_id), kj::str(policy_id),
                  DecisionResult::Deny, kj::str(reason), kj::mv(owned), kj::mv(alternative),
                  core::now_unix_ns());
}

Decision::Decision(kj::String decision_id, kj::String action_id, kj::String policy_id,
                   DecisionResult result, kj::String reason, kj::Maybe<kj::String> suggestion,
                   kj::Maybe<AttributeMap> alternative, std::int64_t timestamp_ns)
    : decision_id_(kj::mv(decision_id)), action_id_(kj::mv(action_id)),
      policy_id_(kj::mv(policy_id)), result_(result), reason_(kj::mv(reason)),
      suggestion_(kj::mv(suggestion)), alternative_(kj::mv(alternative)),
      timestamp_ns_(timestamp_ns) {
  if (decision_id_.size() == 0 || action_id_.size() == 0 || policy_id_.size() == 0) {
    throw core::ValidationException("decision ids must not be empty");
  }
  if (result_ == DecisionResult::Deny && reason_.size() == 0) {
    throw core::ValidationException("a DENY decision requires a reason");
  }
}

Decision Decision::clone() const {
  return Decision(kj::str(decision_id_), kj::str(action_id_), kj::str(policy_id_), result_,
                  kj::str(reason_), copy_string(suggestion_), copy_map(alternative_),
                  timestamp_ns_);
}

kj::Maybe<kj::StringPtr> Decision::suggestion() const {
  KJ_IF_SOME(s, suggestion_) {
    return s.asPtr();
  }
  return kj::none;
}

kj::Maybe<const AttributeMap&> Decision::alternative() const {
  KJ_IF_SOME(map, alternative_) {
    return map;
  }
  return kj::none;
}

kj::String Decision::timestamp() const {
  return core::to_utc_iso8601(timestamp_ns_);
}

DecisionContract Decision::to_contract() const {
  DecisionContract contract;
  contract.decision_id = kj::str(decision_id_);
  contract.action_id = kj::str(action_id_);
  contract.policy_id = kj::str(policy_id_);
  contract.result = result_;
  contract.reason = kj::str(reason_);
  contract.suggestion = copy_string(suggestion_);
  contract.alternative = copy_map(alternative_);
  contract.severity = severity();
  contract.timestamp = timestamp();
  return contract;
}

bool Decision::same_outcome(const Decision& other) const {
  auto mine = to_contract();
  auto theirs = other.to_contract();
  mine.decision_id = kj::str(theirs.decision_id);
  mine.timestamp = kj::str(theirs.timestamp);
  return mine == theirs;
}

// ============================================================================
// DecisionRecord
// ============================================================================

DecisionRecord DecisionRecord::from(const Decision& decision, const Action& action) {
  DecisionRecord record;
  record.decision_id = kj::str(decision.decision_id());
  record.action_id = kj::str(action.id());
  record.action_type = kj::str(action.type());
  record.action_target = kj::str(action.target());
  record.action_metadata = action.metadata().clone();
  record.policy_id = kj::str(decision.policy_id());
  record.result = decision.result();
  record.reason = kj::str(decision.reason());
  KJ_IF_SOME(s, decision.suggestion()) {
    record.suggestion = kj::str(s);
  }
  KJ_IF_SOME(map, decision.alternative()) {
    record.alternative = map.clone();
  }
  record.severity = decision.severity();
  record.timestamp = decision.timestamp();
  return record;
}

DecisionRecord DecisionRecord::clone() const {
  DecisionRecord copy;
  copy.decision_id = kj::str(decision_id);
  copy.action_id = kj::str(action_id);
  copy.action_type = kj::str(action_type);
  copy.action_target = kj::str(action_target);
  copy.action_metadata = action_metadata.clone();
  copy.policy_id = kj::str(policy_id);
  copy.result = result;
  copy.reason = kj::str(reason);
  copy.suggestion = copy_string(suggestion);
  copy.alternative = copy_map(alternative);
  copy.severity = severity;
  copy.timestamp = kj::str(timestamp);
  return copy;
}

void DecisionRecord::write_json(core::JsonBuilder& object) const {
  object.put("log_type", kLogType)
      .put("decision_id", decision_id.asPtr())
      .put("action_id", action_id.asPtr())
      .put("action_type", action_type.asPtr())
      .put("action_target", action_target.asPtr())
      .put_object("action_metadata",
                  [this](core::JsonBuilder& nested) { action_metadata.write_json(nested); })
      .put("policy_id", policy_id.asPtr())
      .put("result", to_string(result))
      .put("reason", reason.asPtr());
  put_optional(object, suggestion, alternative);
  object.put("severity", to_string(severity)).put("timestamp", timestamp.asPtr());
}

kj::String DecisionRecord::to_json() const {
  auto builder = core::JsonBuilder::object();
  write_json(builder);
  return builder.build();
}

} // namespace vigil::policy
