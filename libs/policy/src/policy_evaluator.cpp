#include "vigil/policy/policy_evaluator.h"

#include "vigil/core/error.h"
#include "vigil/policy/exceptions.h"
#include "vigil/policy/replan_hints.h"

#include <exception>
#include <kj/debug.h>
#include <kj/exception.h>
#include <regex>

namespace vigil::policy {

namespace {

bool in_list(const AttributeValue& value, kj::ArrayPtr<const AttributeValue> allowed) {
  for (const auto& candidate : allowed) {
    if (values_equal(value, candidate)) {
      return true;
    }
  }
  return false;
}

} // namespace

kj::Maybe<Decision> PolicyEvaluator::evaluate(const Action& action, const Policy& policy) const {
  if (!matches(action, policy)) {
    return kj::none;
  }
  return decide(action, policy);
}

bool PolicyEvaluator::matches(const Action& action, const Policy& policy) const {
  if (policy.conditions.size() == 0) {
    return false;
  }

  for (const auto& condition : policy.conditions) {
    bool satisfied = false;
    try {
      satisfied = check_condition(action, condition, policy.id);
    } catch (const PolicyEvaluationError&) {
      throw;
    } catch (const std::regex_error& e) {
      throw PolicyEvaluationError(kj::str("Regex evaluation failed for '", condition.key, "'"),
                                  policy.id.asPtr(), "std::regex_error", e.what());
    } catch (const core::VigilException& e) {
      throw PolicyEvaluationError(kj::str("Condition '", condition.key, "' failed"),
                                  policy.id.asPtr(), e.kind(), e.message());
    } catch (const kj::Exception& e) {
      throw PolicyEvaluationError(kj::str("Condition '", condition.key, "' failed"),
                                  policy.id.asPtr(), "kj::Exception", e.getDescription());
    } catch (const std::exception& e) {
      throw PolicyEvaluationError(kj::str("Condition '", condition.key, "' failed"),
                                  policy.id.asPtr(), "std::exception", e.what());
    }
    if (!satisfied) {
      return false;
    }
  }
  return true;
}

Decision PolicyEvaluator::decide(const Action& action, const Policy& policy) {
  if (policy.severity == PolicySeverity::Deny) {
    return Decision::deny(action.id(), policy.id,
                          kj::str("Policy ", policy.name, ": ", policy.description),
                          replan_suggestion(policy.id), replan_alternative(policy.id));
  }
  return Decision::allow(action.id(), policy.id,
                         kj::str("Policy ", policy.name, ": conditions met, action allowed"));
}

bool PolicyEvaluator::check_condition(const Action& action, const Condition& condition,
                                      kj::StringPtr policy_id) {
  const auto& metadata = action.metadata();

  switch (condition.type) {
  case ConditionType::ActionType:
    return action.type() == condition.operand;

  case ConditionType::ActionTypePrefix:
    return action.type().startsWith(condition.operand);

  case ConditionType::TargetEquals:
    return action.target() == condition.operand;

  case ConditionType::TargetContains:
    return condition.operand.size() == 0 || action.target().contains(condition.operand);

  case ConditionType::TargetPattern: {
    KJ_IF_SOME(pattern, condition.pattern) {
      auto target = action.target();
      return std::regex_search(target.begin(), target.end(), pattern);
    }
    throw PolicyEvaluationError(
        kj::str("Invalid target_pattern '", condition.operand, "'"), policy_id,
        "std::regex_error", condition.pattern_error);
  }

  case ConditionType::MetadataKey:
    return metadata.contains(condition.operand);

  case ConditionType::MetadataEquals: {
    KJ_IF_SOME(value, metadata.get(condition.metadata_key)) {
      KJ_IF_SOME(expected, condition.expected) {
        return values_equal(value, expected);
      }
    }
    return false;
  }

  case ConditionType::MetadataGreaterThan: {
    KJ_IF_SOME(value, metadata.get(condition.metadata_key)) {
      KJ_IF_SOME(number, numeric_value(value)) {
        return number > condition.threshold;
      }
      throw PolicyEvaluationError(
          kj::str("metadata '", condition.metadata_key, "' is not numeric"), policy_id,
          "TypeMismatch",
          kj::str("expected a number, found ", value_type_name(value), " ", describe_value(value)));
    }
    return 0.0 > condition.threshold;
  }

  case ConditionType::MetadataInList: {
    KJ_IF_SOME(value, metadata.get(condition.metadata_key)) {
      return in_list(value, condition.allowed);
    }
    return false;
  }

  case ConditionType::MetadataNotInList: {
    KJ_IF_SOME(value, metadata.get(condition.metadata_key)) {
      return !in_list(value, condition.allowed);
    }
    return true;
  }

  case ConditionType::Always:
    return condition.flag;

  case ConditionType::Unknown:
    return false;
  }
  KJ_UNREACHABLE;
}

} // namespace vigil::policy
