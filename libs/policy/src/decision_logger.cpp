#include "vigil/policy/decision_logger.h"

#include "vigil/core/error.h"

namespace vigil::policy {

// ============================================================================
// DecisionLogger
// ============================================================================

DecisionLogger::DecisionLogger(core::Logger& logger, core::LogLevel level)
    : logger_(logger), level_(level) {}

void DecisionLogger::log(const Decision& decision, const Action& action) {
  auto record = DecisionRecord::from(decision, action);
  logger_.log_json(level_.load(std::memory_order_relaxed), kMessage, record.to_json());
  records_written_.fetch_add(1, std::memory_order_relaxed);
}

void DecisionLogger::set_level(core::LogLevel level) {
  level_.store(level, std::memory_order_relaxed);
}

core::LogLevel DecisionLogger::level() const {
  return level_.load(std::memory_order_relaxed);
}

// ============================================================================
// AuditTrail
// ============================================================================

AuditTrail::AuditTrail(size_t max_entries) : capacity_(max_entries) {
  if (max_entries == 0) {
    throw core::ValidationException("audit trail capacity must be greater than 0");
  }
}

void AuditTrail::record(const Decision& decision, const Action& action) {
  auto record = DecisionRecord::from(decision, action);
  auto lock = ring_.lockExclusive();
  if (lock->entries.size() < capacity_) {
    lock->entries.add(kj::mv(record));
    return;
  }
  lock->entries[lock->head] = kj::mv(record);
  lock->head = (lock->head + 1) % capacity_;
  ++lock->evicted;
}

kj::Array<DecisionRecord>
AuditTrail::collect(kj::Function<bool(const DecisionRecord&)> filter) const {
  auto lock = ring_.lockExclusive();
  kj::Vector<DecisionRecord> result;
  const size_t count = lock->entries.size();
  for (size_t i = 0; i < count; ++i) {
    const auto& entry = lock->entries[(lock->head + i) % count];
    if (filter(entry)) {
      result.add(entry.clone());
    }
  }
  return result.releaseAsArray();
}

kj::Array<DecisionRecord> AuditTrail::get_all() const {
  return collect([](const DecisionRecord&) { return true; });
}

kj::Array<DecisionRecord> AuditTrail::get_denied() const {
  return collect(
      [](const DecisionRecord& record) { return record.result == DecisionResult::Deny; });
}

kj::Array<DecisionRecord> AuditTrail::get_by_policy(kj::StringPtr policy_id) const {
  return collect([policy_id](const DecisionRecord& record) { return record.policy_id == policy_id; });
}

size_t AuditTrail::size() const {
  return ring_.lockExclusive()->entries.size();
}

std::uint64_t AuditTrail::evicted() const {
  return ring_.lockExclusive()->evicted;
}

void AuditTrail::clear() {
  auto lock = ring_.lockExclusive();
  lock->entries.clear();
  lock->head = 0;
  lock->evicted = 0;
}

} // namespace vigil::policy
