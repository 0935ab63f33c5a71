#include "vigil/policy/action.h"

#include "vigil/core/error.h"
#include "vigil/core/id.h"

namespace vigil::policy {

namespace {

kj::StringPtr require_string(const core::JsonValue& object, kj::StringPtr field) {
  KJ_IF_SOME(value, object.get(field)) {
    KJ_IF_SOME(s, value.get_string_ptr()) {
      return s;
    }
    throw core::ValidationException(
        kj::str("action field '", field, "' must be a string, found ", value.type_name()));
  }
  throw core::ValidationException(kj::str("action is missing field '", field, "'"));
}

} // namespace

Action Action::create(kj::StringPtr type, kj::StringPtr target, AttributeMap metadata) {
  return Action(core::generate_uuid_v4(), kj::str(type), kj::str(target), kj::mv(metadata));
}

Action::Action(kj::String id, kj::String type, kj::String target, AttributeMap metadata)
    : id_(kj::mv(id)), type_(kj::mv(type)), target_(kj::mv(target)),
      metadata_(kj::mv(metadata)) {
  if (id_.size() == 0) {
    throw core::ValidationException("action id must not be empty");
  }
  if (type_.size() == 0) {
    throw core::ValidationException("action type must not be empty");
  }
}

Action Action::clone() const {
  return Action(kj::str(id_), kj::str(type_), kj::str(target_), metadata_.clone());
}

void Action::write_json(core::JsonBuilder& object) const {
  object.put("id", id_.asPtr())
      .put("type", type_.asPtr())
      .put("target", target_.asPtr())
      .put_object("metadata", [this](core::JsonBuilder& nested) { metadata_.write_json(nested); });
}

kj::String Action::to_json() const {
  auto builder = core::JsonBuilder::object();
  write_json(builder);
  return builder.build();
}

Action Action::from_json(const core::JsonValue& object) {
  if (!object.is_object()) {
    throw core::ValidationException(
        kj::str("action must be a JSON object, found ", object.type_name()));
  }
  AttributeMap metadata;
  KJ_IF_SOME(meta, object.get("metadata")) {
    if (!meta.is_null()) {
      metadata = AttributeMap::from_json(meta);
    }
  }
  return Action(kj::str(require_string(object, "id")), kj::str(require_string(object, "type")),
                kj::str(require_string(object, "target")), kj::mv(metadata));
}

Action Action::from_json(kj::StringPtr json) {
  auto doc = core::JsonDocument::parse(json);
  return from_json(doc.root());
}

} // namespace vigil::policy
