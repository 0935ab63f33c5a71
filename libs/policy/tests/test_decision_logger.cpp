#include "kj/test.h"
#include "vigil/core/error.h"
#include "vigil/core/json.h"
#include "vigil/core/logger.h"
#include "vigil/policy/decision_logger.h"

#include <kj/string.h>

using namespace vigil::policy;
using vigil::core::JsonDocument;
using vigil::core::JsonFormatter;
using vigil::core::Logger;
using vigil::core::LogLevel;
using vigil::core::MemoryOutput;
using vigil::core::TextFormatter;

namespace {

Decision deny_for(const Action& action, kj::StringPtr policy_id) {
  return Decision::deny(action.id(), policy_id, kj::str("Policy ", policy_id, ": denied"));
}

Decision allow_for(const Action& action, kj::StringPtr policy_id) {
  return Decision::allow(action.id(), policy_id, "allowed");
}

// ============================================================================
// DecisionLogger
// ============================================================================

KJ_TEST("DecisionLogger: One JSON record per decision") {
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  Logger logger(kj::heap<JsonFormatter>(), kj::mv(output));
  DecisionLogger decision_logger(logger);

  AttributeMap metadata;
  metadata.put_string("branch", "main");
  auto action = Action::create("git.push", "refs/heads/main", kj::mv(metadata));
  decision_logger.log(deny_for(action, "POL_001_branch_scope"), action);

  KJ_EXPECT(decision_logger.records_written() == 1);
  auto captured = lines.lines();
  KJ_ASSERT(captured.size() == 1);
  auto doc = JsonDocument::parse(captured[0]);
  auto payload = doc.root()["payload"_kj];
  KJ_EXPECT(doc.root()["level"_kj].get_string() == "INFO");
  KJ_EXPECT(payload["log_type"_kj].get_string() == "policy_decision");
  KJ_EXPECT(payload["action_type"_kj].get_string() == "git.push");
  KJ_EXPECT(payload["action_metadata"_kj]["branch"_kj].get_string() == "main");
  KJ_EXPECT(payload["severity"_kj].get_string() == "hard");
  KJ_EXPECT(payload["suggestion"_kj].is_null());
}

KJ_TEST("DecisionLogger: Level is configurable") {
  auto output = kj::heap<MemoryOutput>();
  auto& lines = *output;
  Logger logger(kj::heap<TextFormatter>(), kj::mv(output));
  logger.set_level(LogLevel::Warn);
  DecisionLogger decision_logger(logger, LogLevel::Debug);

  auto action = Action::create("file.read", "/tmp/test.txt");
  decision_logger.log(allow_for(action, "POL_010_read_access"), action);
  KJ_EXPECT(lines.size() == 0);

  decision_logger.set_level(LogLevel::Warn);
  KJ_EXPECT(decision_logger.level() == LogLevel::Warn);
  decision_logger.log(allow_for(action, "POL_010_read_access"), action);
  auto captured = lines.lines();
  KJ_ASSERT(captured.size() == 1);
  KJ_EXPECT(captured[0].contains("[WARN]"));
  KJ_EXPECT(captured[0].contains("\"policy_id\":\"POL_010_read_access\""));
}

// ============================================================================
// AuditTrail
// ============================================================================

KJ_TEST("AuditTrail: Queries return chronological copies") {
  AuditTrail trail;
  KJ_EXPECT(trail.capacity() == 1000);

  auto push = Action::create("git.push", "refs/heads/main");
  auto read = Action::create("file.read", "/tmp/test.txt");
  auto write = Action::create("file.write", ".github/workflows/ci.yml");
  trail.record(deny_for(push, "POL_001_branch_scope"), push);
  trail.record(allow_for(read, "POL_010_read_access"), read);
  trail.record(deny_for(write, "POL_002_file_class"), write);

  auto all = trail.get_all();
  KJ_ASSERT(all.size() == 3);
  KJ_EXPECT(all[0].action_id == push.id());
  KJ_EXPECT(all[2].action_target == ".github/workflows/ci.yml");

  auto denied = trail.get_denied();
  KJ_ASSERT(denied.size() == 2);
  KJ_EXPECT(denied[1].policy_id == "POL_002_file_class");

  auto by_policy = trail.get_by_policy("POL_010_read_access");
  KJ_ASSERT(by_policy.size() == 1);
  KJ_EXPECT(by_policy[0].result == DecisionResult::Allow);
  KJ_EXPECT(trail.get_by_policy("POL_404").size() == 0);
}

KJ_TEST("AuditTrail: Oldest records are evicted first") {
  AuditTrail trail(3);
  kj::Vector<kj::String> ids;
  for (int i = 0; i < 5; ++i) {
    auto action = Action::create("file.read", kj::str("/tmp/", i));
    ids.add(kj::str(action.id()));
    trail.record(allow_for(action, "POL_010_read_access"), action);
  }

  KJ_EXPECT(trail.size() == 3);
  KJ_EXPECT(trail.evicted() == 2);
  auto all = trail.get_all();
  KJ_ASSERT(all.size() == 3);
  KJ_EXPECT(all[0].action_id == ids[2]);
  KJ_EXPECT(all[1].action_id == ids[3]);
  KJ_EXPECT(all[2].action_id == ids[4]);

  trail.clear();
  KJ_EXPECT(trail.size() == 0);
  KJ_EXPECT(trail.evicted() == 0);
}

KJ_TEST("AuditTrail: Zero capacity is rejected") {
  bool rejected = false;
  try {
    AuditTrail trail(0);
  } catch (const vigil::core::ValidationException&) {
    rejected = true;
  }
  KJ_EXPECT(rejected);
}

} // namespace
