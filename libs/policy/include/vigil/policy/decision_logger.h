#pragma once

#include "vigil/core/logger.h"
#include "vigil/policy/action.h"
#include "vigil/policy/decision.h"

#include <atomic>
#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/mutex.h>
#include <kj/vector.h>

namespace vigil::policy {

/**
 * @brief Writes one structured DecisionRecord per decision
 *
 * Each record goes to the logger as a single entry, so records from
 * concurrent evaluations never interleave. Output failures propagate.
 */
class DecisionLogger final {
public:
  static constexpr kj::StringPtr kMessage = "policy_decision"_kj;

  explicit DecisionLogger(core::Logger& logger = core::global_logger(),
                          core::LogLevel level = core::LogLevel::Info);

  KJ_DISALLOW_COPY_AND_MOVE(DecisionLogger);

  /**
   * @throws whatever the logger's outputs raise, e.g. core::ResourceException
   */
  void log(const Decision& decision, const Action& action);

  void set_level(core::LogLevel level);
  [[nodiscard]] core::LogLevel level() const;

  [[nodiscard]] std::uint64_t records_written() const {
    return records_written_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] core::Logger& logger() {
    return logger_;
  }

private:
  core::Logger& logger_;
  std::atomic<core::LogLevel> level_;
  std::atomic<std::uint64_t> records_written_{0};
};

/**
 * @brief Bounded in-memory history of decisions
 *
 * Fixed-capacity ring: once full, each new record evicts the oldest. Queries
 * return copies in chronological order.
 */
class AuditTrail final {
public:
  static constexpr size_t kDefaultMaxEntries = 1000;

  /**
   * @throws core::ValidationException if max_entries is 0
   */
  explicit AuditTrail(size_t max_entries = kDefaultMaxEntries);

  KJ_DISALLOW_COPY_AND_MOVE(AuditTrail);

  void record(const Decision& decision, const Action& action);

  [[nodiscard]] kj::Array<DecisionRecord> get_all() const;
  [[nodiscard]] kj::Array<DecisionRecord> get_denied() const;
  [[nodiscard]] kj::Array<DecisionRecord> get_by_policy(kj::StringPtr policy_id) const;

  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t capacity() const {
    return capacity_;
  }

  /// Records evicted since construction or the last clear()
  [[nodiscard]] std::uint64_t evicted() const;

  void clear();

private:
  struct Ring {
    kj::Vector<DecisionRecord> entries;
    size_t head = 0; // index of the oldest entry once full
    std::uint64_t evicted = 0;
  };

  kj::Array<DecisionRecord> collect(kj::Function<bool(const DecisionRecord&)> filter) const;

  size_t capacity_;
  kj::MutexGuarded<Ring> ring_;
};

} // namespace vigil::policy
