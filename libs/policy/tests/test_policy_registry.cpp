#include "kj/test.h"
#include "vigil/core/json.h"
#include "vigil/core/logger.h"
#include "vigil/policy/exceptions.h"
#include "vigil/policy/policy_registry.h"

#include <kj/filesystem.h>
#include <kj/string.h>

using namespace vigil::policy;
using vigil::core::JsonFormatter;
using vigil::core::Logger;
using vigil::core::MemoryOutput;
using vigil::core::TextFormatter;

namespace {

constexpr kj::StringPtr kBranchScope = R"({
    "id": "POL_001_branch_scope", "name": "Branch Scope",
    "description": "Direct pushes to main are not allowed", "severity": "deny",
    "conditions": {"action_type": "git.push", "target_pattern": "^refs/heads/main$"}
})"_kj;

constexpr kj::StringPtr kReadAccess = R"({
    "id": "POL_010_read_access", "name": "Read Access",
    "description": "File reads are allowed", "severity": "allow",
    "conditions": {"action_type": "file.read"}
})"_kj;

kj::String definition(kj::StringPtr id, kj::StringPtr extra = ""_kj) {
  return kj::str(R"({"id": ")", id, R"(", "name": "N", "description": "D", "severity": "deny", )",
                 R"("conditions": {"always": true})", extra, "}");
}

struct Fixture {
  kj::Own<MemoryOutput> output_owner = kj::heap<MemoryOutput>();
  MemoryOutput& output = *output_owner;
  Logger logger{kj::heap<TextFormatter>(), kj::mv(output_owner)};

  kj::Own<PolicyRegistry> registry(kj::Own<InMemoryPolicySource> source) {
    return kj::heap<PolicyRegistry>(kj::mv(source), logger);
  }
};

template <typename Error> kj::String expect_load_failure(PolicyRegistry& registry) {
  try {
    (void)registry.load();
  } catch (const Error& e) {
    return e.describe();
  }
  KJ_FAIL_EXPECT("load did not fail");
  return kj::str();
}

// ============================================================================
// Successful loads
// ============================================================================

KJ_TEST("PolicyRegistry: Loads documents in order") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("POL_001.json", kBranchScope).add("POL_010.json", kReadAccess);
  auto registry = fixture.registry(kj::mv(source));

  KJ_EXPECT(!registry->is_loaded());
  KJ_EXPECT(registry->size() == 0);

  auto policies = registry->load();
  KJ_ASSERT(policies.size() == 2);
  KJ_EXPECT(policies[0].id == "POL_001_branch_scope");
  KJ_EXPECT(policies[0].severity == PolicySeverity::Deny);
  KJ_EXPECT(policies[0].origin == "POL_001.json");
  KJ_EXPECT(policies[1].severity == PolicySeverity::Allow);
  KJ_EXPECT(registry->is_loaded());
  KJ_EXPECT(registry->size() == 2);

  auto lines = fixture.output.lines();
  KJ_ASSERT(lines.size() == 1);
  KJ_EXPECT(lines[0].contains("Loaded 2 policies"));
}

KJ_TEST("PolicyRegistry: A document may hold an array of rules") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("bundle.json", kj::str("[", kBranchScope, ",", kReadAccess, "]"));
  auto registry = fixture.registry(kj::mv(source));
  KJ_EXPECT(registry->load().size() == 2);
}

KJ_TEST("PolicyRegistry: Lookups and copies") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("a.json", kBranchScope).add("b.json", kReadAccess);
  auto registry = fixture.registry(kj::mv(source));

  // Lazily loads on first access
  KJ_IF_SOME(policy, registry->get_by_id("POL_010_read_access")) {
    KJ_EXPECT(policy.name == "Read Access");
  } else {
    KJ_FAIL_EXPECT("policy not found");
  }
  KJ_EXPECT(registry->get_by_id("POL_404_missing") == kj::none);

  auto copy = registry->get_all();
  KJ_ASSERT(copy.size() == 2);
  copy[0].name = kj::str("changed");
  KJ_EXPECT(registry->load()[0].name == "Branch Scope");
  // The copied regex is usable on its own
  KJ_EXPECT(copy[0].conditions[1].pattern != kj::none);
}

KJ_TEST("PolicyRegistry: Frozen after the first load") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  auto& source_ref = *source;
  source->add("a.json", kBranchScope);
  auto registry = fixture.registry(kj::mv(source));

  auto first = registry->load();
  source_ref.add("b.json", kReadAccess);
  auto second = registry->load();
  KJ_EXPECT(second.size() == 1);
  KJ_EXPECT(first.begin() == second.begin());
}

KJ_TEST("PolicyRegistry: Suspicious definitions load with warnings") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("a.json", R"({"id": "POL_020_empty", "name": "Empty", "description": "d",
                           "severity": "deny", "conditions": {}})"_kj);
  source->add("b.json", R"({"id": "POL_021_odd", "name": "Odd", "description": "d",
                           "severity": "deny", "conditions": {"target_glob": "*"}})"_kj);
  source->add("c.json", R"({"id": "POL_022_regex", "name": "Regex", "description": "d",
                           "severity": "deny", "conditions": {"target_pattern": "("}})"_kj);
  auto registry = fixture.registry(kj::mv(source));

  KJ_EXPECT(registry->load().size() == 3);
  auto lines = fixture.output.lines();
  KJ_ASSERT(lines.size() == 4);
  KJ_EXPECT(lines[0].contains("POL_020_empty has no conditions"));
  KJ_EXPECT(lines[1].contains("unknown condition 'target_glob'"));
  KJ_EXPECT(lines[2].contains("invalid target_pattern"));
  KJ_EXPECT(lines[3].contains("Loaded 3 policies"));
}

// ============================================================================
// Load failures
// ============================================================================

KJ_TEST("PolicyRegistry: Duplicate ids fail the whole load") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("a.json", kBranchScope).add("b.json", kReadAccess).add("c.json", kBranchScope);
  auto registry = fixture.registry(kj::mv(source));

  auto message = expect_load_failure<PolicyValidationError>(*registry);
  KJ_EXPECT(message.contains("Duplicate policy ID: POL_001_branch_scope"), message);
  KJ_EXPECT(message.contains("c.json"), message);
  KJ_EXPECT(!registry->is_loaded());
  KJ_EXPECT(registry->size() == 0);

  // Still nothing visible on retry
  (void)expect_load_failure<PolicyValidationError>(*registry);
}

KJ_TEST("PolicyRegistry: Empty sources are fatal") {
  Fixture fixture;
  auto registry = fixture.registry(kj::heap<InMemoryPolicySource>());
  auto message = expect_load_failure<PolicyRegistryError>(*registry);
  KJ_EXPECT(message.contains("No policy files found"), message);

  auto source = kj::heap<InMemoryPolicySource>();
  source->add("empty.json", "[]");
  auto empty_array = fixture.registry(kj::mv(source));
  (void)expect_load_failure<PolicyValidationError>(*empty_array);
}

KJ_TEST("PolicyRegistry: Invalid JSON is a registry error") {
  Fixture fixture;
  auto source = kj::heap<InMemoryPolicySource>();
  source->add("a.json", kReadAccess).add("broken.json", "{\"id\": ");
  auto registry = fixture.registry(kj::mv(source));
  auto message = expect_load_failure<PolicyRegistryError>(*registry);
  KJ_EXPECT(message.contains("Failed to parse broken.json"), message);
}

KJ_TEST("PolicyRegistry: Malformed definitions are validation errors") {
  struct Case {
    kj::String document;
    kj::StringPtr expected;
  };
  Case cases[] = {
      {kj::str("   "), "Policy file is empty"_kj},
      {kj::str("42"), "must be an object or an array"_kj},
      {kj::str("{}"), "policy definition is empty"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny"})"),
       "missing required field 'conditions'"_kj},
      {kj::str(R"({"id": "POL_1", "description": "D", "severity": "deny", "conditions": {}})"),
       "missing required field 'name'"_kj},
      {kj::str(R"({"id": 7, "name": "N", "description": "D", "severity": "deny",
                  "conditions": {}})"),
       "field 'id' must be a string"_kj},
      {definition("RULE_1"), "must start with 'POL_'"_kj},
      {definition("POL_000_default_allow"), "is reserved"_kj},
      {definition("POL_006_fail_close"), "is reserved"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "DENY",
                  "conditions": {}})"),
       "severity must be"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": []})"),
       "'conditions' must be an object"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"action_type": 3}})"),
       "condition 'action_type' must be a string"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"always": "yes"}})"),
       "condition 'always' must be a boolean"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"metadata_gt": {"key": "n", "threshold": "60"}}})"),
       "threshold must be a number"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"metadata_value": {"key": "n", "value": null}}})"),
       "must not be null"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"metadata_in_list": {"key": "n", "allowed": "read"}}})"),
       "allowed must be an array"_kj},
      {kj::str(R"({"id": "POL_1", "name": "N", "description": "D", "severity": "deny",
                  "conditions": {"metadata_key": {"key": "n"}}})"),
       "condition 'metadata_key' must be a string"_kj},
  };

  for (auto& c : cases) {
    Fixture fixture;
    auto source = kj::heap<InMemoryPolicySource>();
    source->add("rule.json", c.document);
    auto registry = fixture.registry(kj::mv(source));
    auto message = expect_load_failure<PolicyValidationError>(*registry);
    KJ_EXPECT(message.contains(c.expected), message, c.expected);
    KJ_EXPECT(message.contains("rule.json"), message);
  }
}

KJ_TEST("PolicyRegistry: Validation errors name the policy") {
  auto doc = vigil::core::JsonDocument::parse(definition("POL_030_x", R"(, "extra": 1)"));
  // Extra fields are tolerated
  auto policy = Policy::from_json(doc.root(), "inline");
  KJ_EXPECT(policy.id == "POL_030_x");

  auto bad = vigil::core::JsonDocument::parse(
      R"({"id": "POL_031_bad", "name": "N", "description": "D", "severity": "block",
          "conditions": {}})"_kj);
  bool rejected = false;
  try {
    (void)Policy::from_json(bad.root(), "inline");
  } catch (const PolicyValidationError& e) {
    rejected = true;
    KJ_EXPECT(e.policy_id().orDefault(""_kj) == "POL_031_bad");
    KJ_EXPECT(e.origin() == "inline");
    KJ_EXPECT(e.describe().startsWith("PolicyValidationError[POL_031_bad]: "));
  }
  KJ_EXPECT(rejected);
}

KJ_TEST("Policy: Serializes back to the rule-source form") {
  auto doc = vigil::core::JsonDocument::parse(R"({
      "id": "POL_004_tool_allowlist", "name": "Tool Allowlist", "description": "d",
      "severity": "deny",
      "conditions": {"action_type": "tool.execute",
                     "metadata_not_in_list": {"key": "tool_name", "allowed": ["read", "grep"]}}
  })"_kj);
  auto policy = Policy::from_json(doc.root(), "inline");
  auto reparsed_doc = vigil::core::JsonDocument::parse(policy.to_json());
  auto reparsed = Policy::from_json(reparsed_doc.root(), "inline");

  KJ_EXPECT(reparsed.id == policy.id);
  KJ_ASSERT(reparsed.conditions.size() == 2);
  KJ_EXPECT(reparsed.conditions[1].type == ConditionType::MetadataNotInList);
  KJ_EXPECT(reparsed.conditions[1].allowed.size() == 2);
}

// ============================================================================
// Directory source
// ============================================================================

KJ_TEST("DirectoryPolicySource: Reads POL_*.json in name order") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  dir->openFile(kj::Path("POL_010_read.json"), kj::WriteMode::CREATE)->writeAll(kReadAccess);
  dir->openFile(kj::Path("POL_001_branch.json"), kj::WriteMode::CREATE)->writeAll(kBranchScope);
  dir->openFile(kj::Path("README.md"), kj::WriteMode::CREATE)->writeAll("ignored");
  dir->openFile(kj::Path("POL_002_notes.txt"), kj::WriteMode::CREATE)->writeAll("ignored");

  DirectoryPolicySource source(dir->clone(), "in-memory directory");
  auto documents = source.read();
  KJ_ASSERT(documents.size() == 2);
  KJ_EXPECT(documents[0].origin == "POL_001_branch.json");
  KJ_EXPECT(documents[1].origin == "POL_010_read.json");
  KJ_EXPECT(documents[1].content == kReadAccess);

  KJ_EXPECT(DirectoryPolicySource::is_policy_file_name("POL_1.json"));
  KJ_EXPECT(!DirectoryPolicySource::is_policy_file_name("POL_.json"));
  KJ_EXPECT(!DirectoryPolicySource::is_policy_file_name("pol_1.json"));
}

KJ_TEST("DirectoryPolicySource: Missing directory is a registry error") {
  Fixture fixture;
  PolicyRegistry registry(kj::heap<DirectoryPolicySource>("/nonexistent/vigil/policies"),
                          fixture.logger);
  auto message = expect_load_failure<PolicyRegistryError>(registry);
  KJ_EXPECT(message.contains("Policy directory not found"), message);
}

KJ_TEST("DirectoryPolicySource: Shipped reference rules load") {
  Fixture fixture;
  PolicyRegistry registry(kj::heap<DirectoryPolicySource>(VIGIL_POLICY_DIR), fixture.logger);
  auto policies = registry.load();
  KJ_ASSERT(policies.size() == 6);
  KJ_EXPECT(policies[0].id == "POL_001_branch_scope");
  KJ_EXPECT(policies[5].id == "POL_010_read_access");
  for (auto& policy : policies) {
    for (auto& condition : policy.conditions) {
      KJ_EXPECT(condition.type != ConditionType::Unknown, policy.id);
      KJ_EXPECT(condition.pattern_error.size() == 0, policy.id);
    }
  }
}

} // namespace
