#include "vigil/policy/policy_engine.h"

#include "vigil/core/error.h"
#include "vigil/policy/replan_hints.h"

#include <exception>
#include <kj/debug.h>
#include <kj/exception.h>

namespace vigil::policy {

namespace {

constexpr kj::StringPtr kDefaultAllowReason = "No policy matched; default allow"_kj;

} // namespace

kj::StringPtr to_string(TraceOutcome outcome) {
  switch (outcome) {
  case TraceOutcome::Match:
    return "match"_kj;
  case TraceOutcome::NoMatch:
    return "no_match"_kj;
  case TraceOutcome::Error:
    return "error"_kj;
  }
  KJ_UNREACHABLE;
}

PolicyEngine::PolicyEngine(PolicyRegistry& registry, DecisionLogger& decision_logger,
                           kj::Maybe<AuditTrail&> audit_trail)
    : decision_logger_(decision_logger), audit_trail_(audit_trail),
      policies_(registry.load()) {}

Decision PolicyEngine::evaluate(const Action& action) {
  evaluations_.fetch_add(1, std::memory_order_relaxed);

  auto decision = [&]() -> Decision {
    try {
      return adjudicate(action);
    } catch (const PolicyEvaluationError& e) {
      return fail_close(action, FailCloseError(kj::str("Policy evaluation failed: ", e.describe()),
                                               e.kind(), e.describe(), e.policy_id()));
    } catch (const core::VigilException& e) {
      return fail_close(action, FailCloseError(kj::str("Policy evaluation failed: ", e.message()),
                                               e.kind(), e.message(), kj::none));
    } catch (const kj::Exception& e) {
      return fail_close(action,
                        FailCloseError(kj::str("Policy evaluation failed: ", e.getDescription()),
                                       "kj::Exception", e.getDescription(), kj::none));
    } catch (const std::exception& e) {
      return fail_close(action, FailCloseError(kj::str("Policy evaluation failed: ", e.what()),
                                               "std::exception", e.what(), kj::none));
    }
  }();

  count(decision);
  publish(decision, action);
  return decision;
}

Decision PolicyEngine::enforce(const Action& action) {
  auto decision = evaluate(action);
  if (decision.is_denied()) {
    throw PolicyDenied(decision.reason(), decision.policy_id(), decision.action_id(),
                       decision.suggestion());
  }
  return decision;
}

kj::Vector<PolicyTrace> PolicyEngine::explain(const Action& action) const {
  kj::Vector<PolicyTrace> traces(policies_.size());
  for (const auto& policy : policies_) {
    PolicyTrace trace{kj::str(policy.id), kj::str(policy.name), policy.severity,
                      TraceOutcome::NoMatch, kj::String()};
    try {
      if (evaluator_.matches(action, policy)) {
        trace.outcome = TraceOutcome::Match;
        trace.detail = kj::str("conditions met, policy would ", to_string(policy.severity));
      } else if (policy.conditions.size() == 0) {
        trace.detail = kj::str("policy has no conditions");
      } else {
        trace.detail = kj::str("conditions not met");
      }
    } catch (const PolicyEvaluationError& e) {
      trace.outcome = TraceOutcome::Error;
      trace.detail = e.describe();
    }
    traces.add(kj::mv(trace));
  }
  return traces;
}

EngineStats PolicyEngine::stats() const {
  EngineStats stats;
  stats.evaluations = evaluations_.load(std::memory_order_relaxed);
  stats.allows = allows_.load(std::memory_order_relaxed);
  stats.denials = denials_.load(std::memory_order_relaxed);
  stats.fail_closes = fail_closes_.load(std::memory_order_relaxed);
  stats.sink_failures = sink_failures_.load(std::memory_order_relaxed);
  return stats;
}

Decision PolicyEngine::adjudicate(const Action& action) const {
  kj::Maybe<Decision> first_allow;
  for (const auto& policy : policies_) {
    auto outcome = evaluator_.evaluate(action, policy);
    KJ_IF_SOME(decision, outcome) {
      if (decision.is_denied()) {
        return kj::mv(decision);
      }
      if (first_allow == kj::none) {
        first_allow = kj::mv(decision);
      }
    }
  }
  KJ_IF_SOME(decision, first_allow) {
    return kj::mv(decision);
  }
  return Decision::allow(action.id(), kDefaultAllowPolicyId, kDefaultAllowReason);
}

Decision PolicyEngine::fail_close(const Action& action, const FailCloseError& error) {
  fail_closes_.fetch_add(1, std::memory_order_relaxed);

  auto failed = error.failed_policy_id().orDefault("unknown policy"_kj);
  auto reason = kj::str("Fail-close: evaluation of ", failed, " failed (", error.original_kind(),
                        ": ", error.original_error(), ")");

  try {
    decision_logger_.logger().error(
        kj::str("Fail-close DENY for action ", action.id(), ": ", error.describe()));
  } catch (const core::VigilException& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "fail-close log write failed", e.kind(), e.message());
  } catch (const kj::Exception& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "fail-close log write failed", e.getDescription());
  } catch (const std::exception& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "fail-close log write failed", e.what());
  }

  return Decision::deny(action.id(), kFailClosePolicyId, reason,
                        replan_suggestion(kFailClosePolicyId),
                        replan_alternative(kFailClosePolicyId));
}

void PolicyEngine::publish(const Decision& decision, const Action& action) {
  try {
    decision_logger_.log(decision, action);
  } catch (const core::VigilException& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "decision log write failed", decision.decision_id(), e.kind(), e.message());
  } catch (const kj::Exception& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "decision log write failed", decision.decision_id(), e.getDescription());
  } catch (const std::exception& e) {
    sink_failures_.fetch_add(1, std::memory_order_relaxed);
    KJ_LOG(ERROR, "decision log write failed", decision.decision_id(), e.what());
  }

  KJ_IF_SOME(trail, audit_trail_) {
    try {
      trail.record(decision, action);
    } catch (const core::VigilException& e) {
      sink_failures_.fetch_add(1, std::memory_order_relaxed);
      KJ_LOG(ERROR, "audit trail write failed", decision.decision_id(), e.kind(), e.message());
    } catch (const kj::Exception& e) {
      sink_failures_.fetch_add(1, std::memory_order_relaxed);
      KJ_LOG(ERROR, "audit trail write failed", decision.decision_id(), e.getDescription());
    } catch (const std::exception& e) {
      sink_failures_.fetch_add(1, std::memory_order_relaxed);
      KJ_LOG(ERROR, "audit trail write failed", decision.decision_id(), e.what());
    }
  }
}

void PolicyEngine::count(const Decision& decision) {
  if (decision.is_denied()) {
    denials_.fetch_add(1, std::memory_order_relaxed);
  } else {
    allows_.fetch_add(1, std::memory_order_relaxed);
  }
}

} // namespace vigil::policy
