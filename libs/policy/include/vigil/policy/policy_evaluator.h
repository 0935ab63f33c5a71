#pragma once

#include "vigil/policy/action.h"
#include "vigil/policy/decision.h"
#include "vigil/policy/policy.h"

#include <kj/common.h>

namespace vigil::policy {

/**
 * @brief Checks one action against one policy
 *
 * Stateless and free of I/O; the same inputs always produce the same outcome.
 * Safe to share between threads.
 */
class PolicyEvaluator final {
public:
  PolicyEvaluator() = default;

  /**
   * @brief Evaluate a policy against an action
   * @return A decision when every condition holds, none otherwise
   * @throws PolicyEvaluationError if any condition fails to evaluate
   */
  [[nodiscard]] kj::Maybe<Decision> evaluate(const Action& action, const Policy& policy) const;

  /**
   * @brief Whether every condition of the policy holds; false for no conditions
   * @throws PolicyEvaluationError if any condition fails to evaluate
   */
  [[nodiscard]] bool matches(const Action& action, const Policy& policy) const;

  /**
   * @brief Decision a matched policy produces, with reason and replan hint
   */
  [[nodiscard]] static Decision decide(const Action& action, const Policy& policy);

private:
  static bool check_condition(const Action& action, const Condition& condition,
                              kj::StringPtr policy_id);
};

} // namespace vigil::policy
