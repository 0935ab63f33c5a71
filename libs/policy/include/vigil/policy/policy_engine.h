#pragma once

#include "vigil/policy/action.h"
#include "vigil/policy/decision.h"
#include "vigil/policy/decision_logger.h"
#include "vigil/policy/exceptions.h"
#include "vigil/policy/policy_evaluator.h"
#include "vigil/policy/policy_registry.h"

#include <atomic>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace vigil::policy {

enum class TraceOutcome : std::uint8_t {
  Match = 0,
  NoMatch = 1,
  Error = 2,
};

[[nodiscard]] kj::StringPtr to_string(TraceOutcome outcome);

/**
 * @brief Outcome of one policy in an explain() run
 */
struct PolicyTrace {
  kj::String policy_id;
  kj::String policy_name;
  PolicySeverity severity;
  TraceOutcome outcome;
  kj::String detail;
};

/**
 * @brief Snapshot of the engine's counters
 */
struct EngineStats {
  std::uint64_t evaluations = 0;
  std::uint64_t allows = 0;
  std::uint64_t denials = 0;       ///< includes fail-close denials
  std::uint64_t fail_closes = 0;
  std::uint64_t sink_failures = 0; ///< decision log or audit writes that raised
};

/**
 * @brief The adjudication entry point
 *
 * Walks the registry's policies in load order. The first matching DENY policy
 * wins immediately; otherwise the first matching ALLOW policy wins; otherwise
 * the action is allowed by default. Any failure while evaluating turns into a
 * DENY tagged with the fail-close policy id.
 *
 * Every decision is handed to the decision logger and, when attached, the
 * audit trail before it is returned. Safe for concurrent callers.
 */
class PolicyEngine final {
public:
  /**
   * @brief Construct and load the registry
   * @throws PolicyRegistryError or PolicyValidationError if the registry fails to load
   */
  PolicyEngine(PolicyRegistry& registry, DecisionLogger& decision_logger,
               kj::Maybe<AuditTrail&> audit_trail = kj::none);

  KJ_DISALLOW_COPY_AND_MOVE(PolicyEngine);

  /**
   * @brief Adjudicate an action
   *
   * Always returns exactly one decision and does not throw. Sink failures are
   * reported on KJ's log channel and counted in stats().
   */
  Decision evaluate(const Action& action);

  /**
   * @brief evaluate() for callers that prefer exceptions
   * @throws PolicyDenied when the decision is DENY
   */
  Decision enforce(const Action& action);

  /**
   * @brief Per-policy outcome in registry order, without producing a decision
   *
   * Unlike evaluate() this does not stop at the first DENY and does not log.
   */
  [[nodiscard]] kj::Vector<PolicyTrace> explain(const Action& action) const;

  [[nodiscard]] EngineStats stats() const;

  [[nodiscard]] kj::ArrayPtr<const Policy> policies() const {
    return policies_;
  }

private:
  Decision adjudicate(const Action& action) const;
  Decision fail_close(const Action& action, const FailCloseError& error);
  void publish(const Decision& decision, const Action& action);
  void count(const Decision& decision);

  PolicyEvaluator evaluator_;
  DecisionLogger& decision_logger_;
  kj::Maybe<AuditTrail&> audit_trail_;
  kj::ArrayPtr<const Policy> policies_;

  std::atomic<std::uint64_t> evaluations_{0};
  std::atomic<std::uint64_t> allows_{0};
  std::atomic<std::uint64_t> denials_{0};
  std::atomic<std::uint64_t> fail_closes_{0};
  std::atomic<std::uint64_t> sink_failures_{0};
};

} // namespace vigil::policy
