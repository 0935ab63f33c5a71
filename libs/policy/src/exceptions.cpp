#include "vigil/policy/exceptions.h"

#include "vigil/policy/policy.h"

namespace vigil::policy {

namespace {

kj::Maybe<kj::String> copy_maybe(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(s, value) {
    return kj::str(s);
  }
  return kj::none;
}

kj::Maybe<kj::String> copy_maybe(kj::Maybe<kj::StringPtr> value) {
  KJ_IF_SOME(s, value) {
    return kj::str(s);
  }
  return kj::none;
}

kj::Maybe<kj::StringPtr> as_ptr(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(s, value) {
    return s.asPtr();
  }
  return kj::none;
}

} // namespace

// ============================================================================
// PolicyError
// ============================================================================

PolicyError::PolicyError(kj::StringPtr message, kj::Maybe<kj::StringPtr> policy_id,
                         const std::source_location& location)
    : core::VigilException(message, kj::Exception::Type::FAILED, location),
      policy_id_(copy_maybe(policy_id)) {}

PolicyError::PolicyError(const PolicyError& other)
    : core::VigilException(other), policy_id_(copy_maybe(other.policy_id_)) {}

kj::Maybe<kj::StringPtr> PolicyError::policy_id() const {
  return as_ptr(policy_id_);
}

kj::String PolicyError::describe_prefix() const {
  KJ_IF_SOME(id, policy_id_) {
    return kj::str(kind(), "[", id, "]: ", message_);
  }
  return kj::str(kind(), ": ", message_);
}

kj::String PolicyError::describe() const {
  return describe_prefix();
}

// ============================================================================
// PolicyDenied
// ============================================================================

PolicyDenied::PolicyDenied(kj::StringPtr message, kj::StringPtr policy_id,
                           kj::StringPtr action_id, kj::Maybe<kj::StringPtr> suggestion,
                           const std::source_location& location)
    : PolicyError(message, policy_id, location), action_id_(kj::str(action_id)),
      suggestion_(copy_maybe(suggestion)) {}

PolicyDenied::PolicyDenied(const PolicyDenied& other)
    : PolicyError(other), action_id_(kj::str(other.action_id_)),
      suggestion_(copy_maybe(other.suggestion_)) {}

kj::Maybe<kj::StringPtr> PolicyDenied::suggestion() const {
  return as_ptr(suggestion_);
}

kj::String PolicyDenied::describe() const {
  return kj::str(describe_prefix(), " (action=", action_id_, ")");
}

// ============================================================================
// PolicyEvaluationError
// ============================================================================

PolicyEvaluationError::PolicyEvaluationError(kj::StringPtr message,
                                             kj::Maybe<kj::StringPtr> policy_id,
                                             kj::StringPtr cause_kind, kj::StringPtr cause,
                                             const std::source_location& location)
    : PolicyError(message, policy_id, location), cause_kind_(kj::str(cause_kind)),
      cause_(kj::str(cause)) {}

PolicyEvaluationError::PolicyEvaluationError(const PolicyEvaluationError& other)
    : PolicyError(other), cause_kind_(kj::str(other.cause_kind_)), cause_(kj::str(other.cause_)) {}

kj::String PolicyEvaluationError::describe() const {
  if (cause_.size() == 0) {
    return describe_prefix();
  }
  return kj::str(describe_prefix(), " (caused by ", cause_kind_, ": ", cause_, ")");
}

// ============================================================================
// PolicyValidationError
// ============================================================================

PolicyValidationError::PolicyValidationError(kj::StringPtr message,
                                             kj::Maybe<kj::StringPtr> policy_id,
                                             kj::StringPtr origin,
                                             const std::source_location& location)
    : PolicyError(message, policy_id, location), origin_(kj::str(origin)) {}

PolicyValidationError::PolicyValidationError(const PolicyValidationError& other)
    : PolicyError(other), origin_(kj::str(other.origin_)) {}

kj::String PolicyValidationError::describe() const {
  return kj::str(describe_prefix(), " (in ", origin_, ")");
}

// ============================================================================
// FailCloseError
// ============================================================================

FailCloseError::FailCloseError(kj::StringPtr message, kj::StringPtr original_kind,
                               kj::StringPtr original_error,
                               kj::Maybe<kj::StringPtr> failed_policy_id,
                               const std::source_location& location)
    : PolicyError(message, kFailClosePolicyId, location), original_kind_(kj::str(original_kind)),
      original_error_(kj::str(original_error)), failed_policy_id_(copy_maybe(failed_policy_id)) {}

FailCloseError::FailCloseError(const FailCloseError& other)
    : PolicyError(other), original_kind_(kj::str(other.original_kind_)),
      original_error_(kj::str(other.original_error_)),
      failed_policy_id_(copy_maybe(other.failed_policy_id_)) {}

kj::Maybe<kj::StringPtr> FailCloseError::failed_policy_id() const {
  return as_ptr(failed_policy_id_);
}

kj::String FailCloseError::describe() const {
  return kj::str(kind(), ": ", message_, " (original: ", original_kind_, ")");
}

} // namespace vigil::policy
