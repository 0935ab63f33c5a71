#include "vigil/policy/replan_hints.h"

#include "vigil/policy/policy.h"

namespace vigil::policy {

namespace {

AttributeMap branch_scope_alternative() {
  AttributeMap alternative;
  alternative.put_string("target_pattern", "refs/heads/feature/*");
  return alternative;
}

AttributeMap file_class_alternative() {
  AttributeMap alternative;
  const kj::StringPtr excluded[] = {".github/workflows/"_kj};
  alternative.put_list("excluded_paths", excluded);
  return alternative;
}

AttributeMap tool_allowlist_alternative() {
  AttributeMap alternative;
  const kj::StringPtr tools[] = {"read"_kj,      "write"_kj,     "edit"_kj, "glob"_kj,
                                 "grep"_kj,      "bash"_kj,      "web_fetch"_kj,
                                 "web_search"_kj, "todo_write"_kj, "ask_user"_kj};
  alternative.put_list("allowed_tools", tools);
  return alternative;
}

AttributeMap rate_guard_alternative() {
  AttributeMap alternative;
  alternative.put_int("rate_limit", 60).put_string("window", "1 minute");
  return alternative;
}

const ReplanHint kHints[] = {
    {"POL_001_branch_scope"_kj, "Create a feature/* branch and open a PR"_kj,
     &branch_scope_alternative},
    {"POL_002_file_class"_kj, "Move change to non-governance path"_kj, &file_class_alternative},
    {"POL_003_policy_immutability"_kj, "Policy layer is immutable; modify via governance process"_kj,
     nullptr},
    {"POL_004_tool_allowlist"_kj, "Use an allowed tool or request approval"_kj,
     &tool_allowlist_alternative},
    {"POL_005_rate_guard"_kj, "Retry after rate window resets"_kj, &rate_guard_alternative},
    {kFailClosePolicyId, "Action denied due to system safety fallback"_kj, nullptr},
};

} // namespace

kj::Maybe<const ReplanHint&> find_replan_hint(kj::StringPtr policy_id) {
  for (const auto& hint : kHints) {
    if (hint.policy_id == policy_id) {
      return hint;
    }
  }
  return kj::none;
}

kj::Maybe<kj::StringPtr> replan_suggestion(kj::StringPtr policy_id) {
  KJ_IF_SOME(hint, find_replan_hint(policy_id)) {
    return hint.suggestion;
  }
  return kj::none;
}

kj::Maybe<AttributeMap> replan_alternative(kj::StringPtr policy_id) {
  KJ_IF_SOME(hint, find_replan_hint(policy_id)) {
    if (hint.alternative != nullptr) {
      return hint.alternative();
    }
  }
  return kj::none;
}

kj::ArrayPtr<const ReplanHint> replan_hints() {
  return kj::arrayPtr(kHints, kj::size(kHints));
}

} // namespace vigil::policy
