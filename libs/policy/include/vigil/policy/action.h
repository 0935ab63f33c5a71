#pragma once

#include "vigil/core/json.h"
#include "vigil/policy/attributes.h"

#include <kj/common.h>
#include <kj/string.h>

namespace vigil::policy {

/**
 * @brief An operation an agent proposes to perform
 *
 * Immutable once constructed. The id identifies one attempt: create() draws a
 * fresh UUIDv4, the explicit-id constructor exists for replaying recorded
 * actions.
 */
class Action final {
public:
  /**
   * @brief Create an action with a freshly generated id
   * @param type Dotted category, e.g. "file.write" or "git.push"
   * @param target Resource identifier, e.g. a path or a ref
   * @throws core::ValidationException if type is empty
   */
  [[nodiscard]] static Action create(kj::StringPtr type, kj::StringPtr target,
                                     AttributeMap metadata = AttributeMap());

  /**
   * @throws core::ValidationException if id or type is empty
   */
  Action(kj::String id, kj::String type, kj::String target, AttributeMap metadata);

  Action(Action&&) = default;
  Action& operator=(Action&&) = default;
  KJ_DISALLOW_COPY(Action);

  [[nodiscard]] Action clone() const;

  [[nodiscard]] kj::StringPtr id() const {
    return id_;
  }
  [[nodiscard]] kj::StringPtr type() const {
    return type_;
  }
  [[nodiscard]] kj::StringPtr target() const {
    return target_;
  }
  [[nodiscard]] const AttributeMap& metadata() const {
    return metadata_;
  }

  void write_json(core::JsonBuilder& object) const;

  /**
   * @brief Serialize as {"id", "type", "target", "metadata"}
   */
  [[nodiscard]] kj::String to_json() const;

  /**
   * @throws core::ValidationException for missing or mistyped fields
   */
  [[nodiscard]] static Action from_json(const core::JsonValue& object);

  /**
   * @throws core::ParseException for invalid JSON text
   * @throws core::ValidationException for missing or mistyped fields
   */
  [[nodiscard]] static Action from_json(kj::StringPtr json);

private:
  kj::String id_;
  kj::String type_;
  kj::String target_;
  AttributeMap metadata_;
};

} // namespace vigil::policy
