#include "kj/test.h"
#include "vigil/core/config.h"
#include "vigil/core/id.h"
#include "vigil/core/json.h"
#include "vigil/core/logger.h"
#include "vigil/policy/policy_runtime.h"

#include <kj/filesystem.h>
#include <kj/string.h>

using namespace vigil::policy;
using vigil::core::Config;
using vigil::core::ConfigException;
using vigil::core::LogLevel;
using vigil::core::MemoryOutput;

namespace {

kj::String runtime_config(kj::StringPtr extra = ""_kj) {
  return kj::str(R"({"policy_dir": ")", VIGIL_POLICY_DIR, "\"", extra, "}");
}

kj::String expect_config_error(kj::StringPtr json) {
  try {
    (void)PolicyRuntimeConfig::from_config(Config::from_string(json));
  } catch (const ConfigException& e) {
    return kj::str(e.message());
  }
  KJ_FAIL_EXPECT("config accepted", json);
  return kj::str();
}

// ============================================================================
// PolicyRuntimeConfig
// ============================================================================

KJ_TEST("PolicyRuntimeConfig: Defaults") {
  auto config = PolicyRuntimeConfig::from_config(Config::from_string(runtime_config()));
  KJ_EXPECT(config.policy_dir == VIGIL_POLICY_DIR);
  KJ_EXPECT(config.audit_max_entries == 1000);
  KJ_EXPECT(config.decision_log_level == LogLevel::Info);
  KJ_EXPECT(config.decision_log_file == kj::none);
  KJ_EXPECT(config.decision_log_format == DecisionLogFormat::Json);
}

KJ_TEST("PolicyRuntimeConfig: Explicit values") {
  auto config = PolicyRuntimeConfig::from_config(Config::from_string(runtime_config(
      R"(, "audit_max_entries": 10, "decision_log_level": "warn",
           "decision_log_file": "/tmp/decisions.log", "decision_log_format": "text")")));
  KJ_EXPECT(config.audit_max_entries == 10);
  KJ_EXPECT(config.decision_log_level == LogLevel::Warn);
  KJ_IF_SOME(file, config.decision_log_file) {
    KJ_EXPECT(file == "/tmp/decisions.log");
  } else {
    KJ_FAIL_EXPECT("decision_log_file not read");
  }
  KJ_EXPECT(config.decision_log_format == DecisionLogFormat::Text);
  KJ_EXPECT(to_string(config.decision_log_format) == "text");
}

KJ_TEST("PolicyRuntimeConfig: Invalid values are rejected") {
  KJ_EXPECT(expect_config_error("{}").contains("Missing required config key 'policy_dir'"));
  KJ_EXPECT(expect_config_error(R"({"policy_dir": ""})").contains("must not be empty"));
  KJ_EXPECT(expect_config_error(runtime_config(R"(, "audit_max_entries": 0)"))
                .contains("greater than 0"));
  KJ_EXPECT(expect_config_error(runtime_config(R"(, "audit_max_entries": "10")"))
                .contains("wrong type"));
  KJ_EXPECT(expect_config_error(runtime_config(R"(, "decision_log_level": "verbose")"))
                .contains("unknown level 'verbose'"));
  KJ_EXPECT(expect_config_error(runtime_config(R"(, "decision_log_level": "off")"))
                .contains("must not be 'off'"));
  KJ_EXPECT(expect_config_error(runtime_config(R"(, "decision_log_format": "xml")"))
                .contains("decision_log_format"));
}

// ============================================================================
// PolicyRuntime
// ============================================================================

KJ_TEST("PolicyRuntime: Built from the shipped rules") {
  auto config = PolicyRuntimeConfig::from_config(
      Config::from_string(runtime_config(R"(, "audit_max_entries": 2)")));
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  PolicyRuntime runtime(kj::mv(config), kj::mv(output));

  KJ_EXPECT(runtime.registry().size() == 6);
  KJ_EXPECT(runtime.audit_trail().capacity() == 2);

  auto decision = runtime.evaluate(Action::create("file.write", ".github/workflows/ci.yml"));
  KJ_EXPECT(decision.policy_id() == "POL_002_file_class");
  (void)runtime.evaluate(Action::create("file.read", "/tmp/test.txt"));
  (void)runtime.evaluate(Action::create("git.push", "refs/heads/main"));

  KJ_EXPECT(runtime.audit_trail().size() == 2);
  KJ_EXPECT(runtime.engine().stats().evaluations == 3);
  KJ_EXPECT(runtime.decision_logger().records_written() == 3);

  // Load summary followed by one record per decision
  auto captured = lines.lines();
  KJ_ASSERT(captured.size() == 4);
  KJ_EXPECT(captured[0].contains("Loaded 6 policies"));
  auto record = vigil::core::JsonDocument::parse(captured[3]);
  KJ_EXPECT(record.root()["payload"_kj]["policy_id"_kj].get_string() == "POL_001_branch_scope");
}

KJ_TEST("PolicyRuntime: Decision records append to a file") {
  auto path = kj::str("/tmp/vigil_runtime_test_", vigil::core::generate_uuid_v4(), ".log");
  {
    auto config = PolicyRuntimeConfig::from_config(Config::from_string(runtime_config(
        kj::str(R"(, "decision_log_file": ")", path, R"(", "decision_log_format": "text")"))));
    PolicyRuntime runtime(kj::mv(config));
    (void)runtime.evaluate(Action::create("git.push", "refs/heads/main"));
    runtime.logger().flush();
  }

  auto fs = kj::newDiskFilesystem();
  auto file_path = fs->getCurrentPath().evalNative(path);
  auto text = fs->getRoot().openFile(file_path)->readAllText();
  KJ_EXPECT(text.contains("Loaded 6 policies"));
  KJ_EXPECT(text.contains("policy_decision"));
  KJ_EXPECT(text.contains("POL_001_branch_scope"));
  fs->getRoot().remove(file_path);
}

KJ_TEST("PolicyRuntime: Missing policy directory prevents startup") {
  auto config = PolicyRuntimeConfig::from_config(
      Config::from_string(R"({"policy_dir": "/nonexistent/vigil"})"_kj));
  bool failed = false;
  try {
    PolicyRuntime runtime(kj::mv(config), kj::heap<MemoryOutput>());
  } catch (const PolicyRegistryError& e) {
    failed = true;
    KJ_EXPECT(e.message().contains("/nonexistent/vigil"));
  }
  KJ_EXPECT(failed);
}

} // namespace
