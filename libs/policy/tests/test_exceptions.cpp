#include "kj/test.h"
#include "vigil/policy/exceptions.h"
#include "vigil/policy/policy.h"

#include <kj/string.h>

using namespace vigil::policy;

namespace {

KJ_TEST("PolicyError: Describe includes the policy id when known") {
  PolicyError with_id("bad rule", "POL_001_branch_scope"_kj);
  PolicyError without_id("bad rule");

  KJ_EXPECT(with_id.describe() == "PolicyError[POL_001_branch_scope]: bad rule");
  KJ_EXPECT(without_id.describe() == "PolicyError: bad rule");
  KJ_EXPECT(without_id.policy_id() == kj::none);
}

KJ_TEST("PolicyDenied: Carries action and suggestion") {
  PolicyDenied denied("push to main", "POL_001_branch_scope", "action-7",
                      "push to a feature branch"_kj);

  KJ_EXPECT(denied.action_id() == "action-7");
  auto suggestion = denied.suggestion();
  KJ_IF_SOME(s, suggestion) {
    KJ_EXPECT(s == "push to a feature branch");
  } else {
    KJ_FAIL_EXPECT("suggestion missing");
  }
  KJ_EXPECT(denied.describe() == "PolicyDenied[POL_001_branch_scope]: push to main (action=action-7)");
}

KJ_TEST("PolicyEvaluationError: Describe names the cause") {
  PolicyEvaluationError error("pattern failed", "POL_003_policy_immutability"_kj,
                              "std::regex_error", "bad bracket");
  KJ_EXPECT(error.describe() ==
            "PolicyEvaluationError[POL_003_policy_immutability]: pattern failed "
            "(caused by std::regex_error: bad bracket)");

  PolicyEvaluationError bare("pattern failed", kj::none, "", "");
  KJ_EXPECT(bare.describe() == "PolicyEvaluationError: pattern failed");
}

KJ_TEST("PolicyValidationError: Describe names the origin") {
  PolicyValidationError error("missing required field 'name'", "POL_009_x"_kj,
                              "POL_009_x.json");
  KJ_EXPECT(error.origin() == "POL_009_x.json");
  KJ_EXPECT(error.describe() ==
            "PolicyValidationError[POL_009_x]: missing required field 'name' (in POL_009_x.json)");
}

KJ_TEST("FailCloseError: Tagged with the fail-close policy") {
  FailCloseError error("evaluation failed", "PolicyEvaluationError", "boom",
                       "POL_005_rate_guard"_kj);

  auto id = error.policy_id();
  KJ_IF_SOME(s, id) {
    KJ_EXPECT(s == kFailClosePolicyId);
  } else {
    KJ_FAIL_EXPECT("fail-close id missing");
  }
  auto failed = error.failed_policy_id();
  KJ_IF_SOME(s, failed) {
    KJ_EXPECT(s == "POL_005_rate_guard");
  } else {
    KJ_FAIL_EXPECT("failed policy id missing");
  }
  KJ_EXPECT(error.describe() ==
            "FailCloseError: evaluation failed (original: PolicyEvaluationError)");
}

KJ_TEST("PolicyError: Copies keep every field") {
  PolicyValidationError original("duplicate", "POL_002_file_class"_kj, "b.json");
  PolicyValidationError copy(original);

  KJ_EXPECT(copy.describe() == original.describe());
  KJ_EXPECT(copy.origin() == "b.json");
  KJ_EXPECT(copy.kind() == "PolicyValidationError");
}

KJ_TEST("PolicyError: Converts to kj::Exception") {
  PolicyRegistryError error("Policy directory not found: /nowhere");
  auto converted = error.toKjException();

  KJ_EXPECT(converted.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(converted.getDescription() == "Policy directory not found: /nowhere");
  KJ_EXPECT(kj::StringPtr(error.what()) == "Policy directory not found: /nowhere");
}

} // namespace
