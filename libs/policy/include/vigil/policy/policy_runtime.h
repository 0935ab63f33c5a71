#pragma once

#include "vigil/core/config.h"
#include "vigil/core/logger.h"
#include "vigil/policy/decision_logger.h"
#include "vigil/policy/policy_engine.h"
#include "vigil/policy/policy_registry.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>

namespace vigil::policy {

enum class DecisionLogFormat : std::uint8_t {
  Json = 0,
  Text = 1,
};

[[nodiscard]] kj::StringPtr to_string(DecisionLogFormat format);

/**
 * @brief Settings of a policy runtime
 *
 * Keys read by from_config():
 *   policy_dir           string, required
 *   audit_max_entries    int > 0, default 1000
 *   decision_log_level   trace|debug|info|warn|error|critical, default info
 *   decision_log_file    string, optional; console when absent
 *   decision_log_format  json|text, default json
 */
struct PolicyRuntimeConfig {
  kj::String policy_dir;
  size_t audit_max_entries = AuditTrail::kDefaultMaxEntries;
  core::LogLevel decision_log_level = core::LogLevel::Info;
  kj::Maybe<kj::String> decision_log_file;
  DecisionLogFormat decision_log_format = DecisionLogFormat::Json;

  /**
   * @throws core::ConfigException for missing, mistyped or out-of-range values
   */
  [[nodiscard]] static PolicyRuntimeConfig from_config(const core::Config& config);
};

/**
 * @brief Owns one complete adjudication pipeline
 *
 * Builds the decision log, the registry over the configured directory, the
 * audit trail and the engine, in that order. Construction loads the policy
 * set; a load failure propagates and no runtime exists.
 */
class PolicyRuntime final {
public:
  explicit PolicyRuntime(PolicyRuntimeConfig config);

  /**
   * @brief Same pipeline, with decision records written to the given output
   */
  PolicyRuntime(PolicyRuntimeConfig config, kj::Own<core::LogOutput> output);

  KJ_DISALLOW_COPY_AND_MOVE(PolicyRuntime);

  Decision evaluate(const Action& action) {
    return engine_.evaluate(action);
  }

  [[nodiscard]] PolicyEngine& engine() {
    return engine_;
  }
  [[nodiscard]] PolicyRegistry& registry() {
    return registry_;
  }
  [[nodiscard]] AuditTrail& audit_trail() {
    return audit_trail_;
  }
  [[nodiscard]] DecisionLogger& decision_logger() {
    return decision_logger_;
  }
  [[nodiscard]] core::Logger& logger() {
    return logger_;
  }
  [[nodiscard]] const PolicyRuntimeConfig& config() const {
    return config_;
  }

private:
  PolicyRuntimeConfig config_;
  core::Logger logger_;
  PolicyRegistry registry_;
  DecisionLogger decision_logger_;
  AuditTrail audit_trail_;
  PolicyEngine engine_;
};

} // namespace vigil::policy
