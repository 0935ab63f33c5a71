#pragma once

#include "vigil/core/logger.h"
#include "vigil/policy/policy.h"
#include "vigil/policy/policy_source.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>

namespace vigil::policy {

/**
 * @brief Immutable, load-once set of policies
 *
 * load() reads the source, validates every definition and publishes the
 * whole set at once. A failure publishes nothing. After the first successful
 * load the set is frozen: later calls return it without touching the source,
 * and references into it stay valid for the registry's lifetime.
 *
 * Thread-safe. Concurrent callers of load() observe either no set or the
 * complete set.
 */
class PolicyRegistry final {
public:
  explicit PolicyRegistry(kj::Own<PolicySource> source,
                          core::Logger& logger = core::global_logger());

  KJ_DISALLOW_COPY_AND_MOVE(PolicyRegistry);

  /**
   * @brief Load and freeze the policy set
   * @return The policies in load order
   * @throws PolicyRegistryError if the source is missing, unreadable, empty or
   *         holds a document that is not valid JSON
   * @throws PolicyValidationError for a malformed definition or a duplicate id
   */
  kj::ArrayPtr<const Policy> load();

  /**
   * @brief Copy of every policy in load order; loads on first use
   */
  [[nodiscard]] kj::Array<Policy> get_all();

  /**
   * @brief Policy with the given id; loads on first use
   */
  [[nodiscard]] kj::Maybe<const Policy&> get_by_id(kj::StringPtr id);

  /**
   * @brief Number of loaded policies, 0 before load
   */
  [[nodiscard]] size_t size() const;

  [[nodiscard]] bool is_loaded() const;

  [[nodiscard]] const PolicySource& source() const {
    return *source_;
  }

private:
  struct State {
    bool loaded = false;
    kj::Array<Policy> policies;
  };

  kj::Array<Policy> read_policies() const;
  void parse_document(const PolicyDocument& document, kj::Vector<Policy>& out) const;
  void report_suspicious(const Policy& policy) const;

  kj::Own<PolicySource> source_;
  core::Logger& logger_;
  kj::MutexGuarded<State> state_;
};

} // namespace vigil::policy
