#include "vigil/policy/policy_runtime.h"

#include "vigil/policy/policy_source.h"

namespace vigil::policy {

namespace {

kj::Own<core::LogFormatter> make_formatter(DecisionLogFormat format) {
  switch (format) {
  case DecisionLogFormat::Json:
    return kj::heap<core::JsonFormatter>();
  case DecisionLogFormat::Text:
    return kj::heap<core::TextFormatter>();
  }
  KJ_UNREACHABLE;
}

kj::Own<core::LogOutput> make_output(const PolicyRuntimeConfig& config) {
  KJ_IF_SOME(path, config.decision_log_file) {
    return kj::heap<core::FileOutput>(path);
  }
  return kj::heap<core::ConsoleOutput>();
}

// Load diagnostics stay visible even when decisions are logged above info.
core::LogLevel logger_threshold(core::LogLevel decision_level) {
  return decision_level < core::LogLevel::Info ? decision_level : core::LogLevel::Info;
}

} // namespace

kj::StringPtr to_string(DecisionLogFormat format) {
  switch (format) {
  case DecisionLogFormat::Json:
    return "json"_kj;
  case DecisionLogFormat::Text:
    return "text"_kj;
  }
  KJ_UNREACHABLE;
}

PolicyRuntimeConfig PolicyRuntimeConfig::from_config(const core::Config& config) {
  PolicyRuntimeConfig result;

  result.policy_dir = kj::str(config.require<kj::StringPtr>("policy_dir"));
  if (result.policy_dir.size() == 0) {
    throw core::ConfigException("Config key 'policy_dir' must not be empty");
  }

  config.check_type<int64_t>("audit_max_entries");
  auto max_entries = config.get_or<int64_t>(
      "audit_max_entries", static_cast<int64_t>(AuditTrail::kDefaultMaxEntries));
  if (max_entries <= 0) {
    throw core::ConfigException(
        kj::str("Config key 'audit_max_entries' must be greater than 0, got ", max_entries));
  }
  result.audit_max_entries = static_cast<size_t>(max_entries);

  config.check_type<kj::StringPtr>("decision_log_level");
  auto level_name = config.get_or<kj::StringPtr>("decision_log_level", "info"_kj);
  KJ_IF_SOME(level, core::parse_log_level(level_name)) {
    if (level == core::LogLevel::Off) {
      throw core::ConfigException("Config key 'decision_log_level' must not be 'off'");
    }
    result.decision_log_level = level;
  } else {
    throw core::ConfigException(
        kj::str("Config key 'decision_log_level' has unknown level '", level_name, "'"));
  }

  config.check_type<kj::StringPtr>("decision_log_file");
  KJ_IF_SOME(path, config.get<kj::StringPtr>("decision_log_file")) {
    if (path.size() == 0) {
      throw core::ConfigException("Config key 'decision_log_file' must not be empty");
    }
    result.decision_log_file = kj::str(path);
  }

  config.check_type<kj::StringPtr>("decision_log_format");
  auto format = config.get_or<kj::StringPtr>("decision_log_format", "json"_kj);
  if (format == "json"_kj) {
    result.decision_log_format = DecisionLogFormat::Json;
  } else if (format == "text"_kj) {
    result.decision_log_format = DecisionLogFormat::Text;
  } else {
    throw core::ConfigException(kj::str(
        "Config key 'decision_log_format' must be \"json\" or \"text\", got \"", format, "\""));
  }

  return result;
}

PolicyRuntime::PolicyRuntime(PolicyRuntimeConfig config)
    : PolicyRuntime(kj::mv(config), kj::Own<core::LogOutput>()) {}

PolicyRuntime::PolicyRuntime(PolicyRuntimeConfig config, kj::Own<core::LogOutput> output)
    : config_(kj::mv(config)),
      logger_(make_formatter(config_.decision_log_format),
              output.get() != nullptr ? kj::mv(output) : make_output(config_)),
      registry_(kj::heap<DirectoryPolicySource>(config_.policy_dir), logger_),
      decision_logger_(logger_, config_.decision_log_level),
      audit_trail_(config_.audit_max_entries), engine_(registry_, decision_logger_, audit_trail_) {
  logger_.set_level(logger_threshold(config_.decision_log_level));
}

} // namespace vigil::policy
