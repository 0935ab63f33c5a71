#pragma once

#include "vigil/core/error.h"

#include <kj/common.h>
#include <kj/string.h>
#include <source_location>

namespace vigil::policy {

/**
 * @brief Base class of every policy failure
 *
 * Each failure path of the adjudication pipeline has its own type, and each
 * type leans toward denial: load failures stop the engine from starting,
 * evaluation failures become fail-close denials.
 */
class PolicyError : public core::VigilException {
public:
  explicit PolicyError(kj::StringPtr message, kj::Maybe<kj::StringPtr> policy_id = kj::none,
                       const std::source_location& location = std::source_location::current());

  PolicyError(const PolicyError& other);
  PolicyError(PolicyError&&) = default;

  [[nodiscard]] kj::Maybe<kj::StringPtr> policy_id() const;

  /**
   * @brief One-line rendering: Kind[policy_id]: message plus type-specific detail
   */
  [[nodiscard]] virtual kj::String describe() const;

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "PolicyError"_kj;
  }

protected:
  kj::String describe_prefix() const;

  kj::Maybe<kj::String> policy_id_;
};

/**
 * @brief A DENY policy matched
 *
 * Expected outcome rather than a fault; raised by PolicyEngine::enforce() for
 * callers that prefer exceptions over inspecting the Decision.
 */
class PolicyDenied : public PolicyError {
public:
  PolicyDenied(kj::StringPtr message, kj::StringPtr policy_id, kj::StringPtr action_id,
               kj::Maybe<kj::StringPtr> suggestion = kj::none,
               const std::source_location& location = std::source_location::current());

  PolicyDenied(const PolicyDenied& other);
  PolicyDenied(PolicyDenied&&) = default;

  [[nodiscard]] kj::StringPtr action_id() const {
    return action_id_;
  }
  [[nodiscard]] kj::Maybe<kj::StringPtr> suggestion() const;

  [[nodiscard]] kj::String describe() const override;
  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "PolicyDenied"_kj;
  }

private:
  kj::String action_id_;
  kj::Maybe<kj::String> suggestion_;
};

/**
 * @brief A single policy failed to evaluate
 *
 * The cause is kept as its kind and message so the error can be copied and
 * logged without holding on to the original exception object.
 */
class PolicyEvaluationError : public PolicyError {
public:
  PolicyEvaluationError(kj::StringPtr message, kj::Maybe<kj::StringPtr> policy_id,
                        kj::StringPtr cause_kind, kj::StringPtr cause,
                        const std::source_location& location = std::source_location::current());

  PolicyEvaluationError(const PolicyEvaluationError& other);
  PolicyEvaluationError(PolicyEvaluationError&&) = default;

  [[nodiscard]] kj::StringPtr cause_kind() const {
    return cause_kind_;
  }
  [[nodiscard]] kj::StringPtr cause() const {
    return cause_;
  }

  [[nodiscard]] kj::String describe() const override;
  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "PolicyEvaluationError"_kj;
  }

private:
  kj::String cause_kind_;
  kj::String cause_;
};

/**
 * @brief Structural failure while loading the rule set; fatal at startup
 */
class PolicyRegistryError : public PolicyError {
public:
  explicit PolicyRegistryError(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : PolicyError(message, kj::none, location) {}

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "PolicyRegistryError"_kj;
  }
};

/**
 * @brief One malformed rule definition, surfaced during load
 */
class PolicyValidationError : public PolicyError {
public:
  PolicyValidationError(kj::StringPtr message, kj::Maybe<kj::StringPtr> policy_id,
                        kj::StringPtr origin,
                        const std::source_location& location = std::source_location::current());

  PolicyValidationError(const PolicyValidationError& other);
  PolicyValidationError(PolicyValidationError&&) = default;

  /**
   * @brief Document the definition came from
   */
  [[nodiscard]] kj::StringPtr origin() const {
    return origin_;
  }

  [[nodiscard]] kj::String describe() const override;
  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "PolicyValidationError"_kj;
  }

private:
  kj::String origin_;
};

/**
 * @brief Internal wrapper the engine converts into the fail-close DENY
 *
 * Always tagged with the fail-close policy id; the policy whose evaluation
 * failed, if known, is kept separately.
 */
class FailCloseError : public PolicyError {
public:
  FailCloseError(kj::StringPtr message, kj::StringPtr original_kind,
                 kj::StringPtr original_error, kj::Maybe<kj::StringPtr> failed_policy_id,
                 const std::source_location& location = std::source_location::current());

  FailCloseError(const FailCloseError& other);
  FailCloseError(FailCloseError&&) = default;

  [[nodiscard]] kj::StringPtr original_kind() const {
    return original_kind_;
  }
  [[nodiscard]] kj::StringPtr original_error() const {
    return original_error_;
  }
  [[nodiscard]] kj::Maybe<kj::StringPtr> failed_policy_id() const;

  [[nodiscard]] kj::String describe() const override;
  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "FailCloseError"_kj;
  }

private:
  kj::String original_kind_;
  kj::String original_error_;
  kj::Maybe<kj::String> failed_policy_id_;
};

} // namespace vigil::policy
