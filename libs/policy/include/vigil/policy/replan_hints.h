#pragma once

#include "vigil/policy/attributes.h"

#include <kj/common.h>
#include <kj/string.h>

namespace vigil::policy {

/**
 * @brief Replanning guidance attached to a denial
 *
 * The hint table is fixed and keyed by policy id. A suggestion is a short
 * instruction for the agent; an alternative is a structured description of an
 * acceptable variant of the denied action.
 */
struct ReplanHint {
  kj::StringPtr policy_id;
  kj::StringPtr suggestion;
  AttributeMap (*alternative)(); ///< null when the hint has no structured alternative
};

[[nodiscard]] kj::Maybe<const ReplanHint&> find_replan_hint(kj::StringPtr policy_id);

[[nodiscard]] kj::Maybe<kj::StringPtr> replan_suggestion(kj::StringPtr policy_id);

/**
 * @brief Fresh copy of the structured alternative, if the policy has one
 */
[[nodiscard]] kj::Maybe<AttributeMap> replan_alternative(kj::StringPtr policy_id);

/// All entries, in policy id order
[[nodiscard]] kj::ArrayPtr<const ReplanHint> replan_hints();

} // namespace vigil::policy
