#include "vigil/policy/attributes.h"

#include "vigil/core/error.h"

#include <kj/debug.h>
#include <limits>

namespace vigil::policy {

AttributeValue clone_value(const AttributeValue& value) {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(b, bool) {
      return b;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return i;
    }
    KJ_CASE_ONEOF(d, double) {
      return d;
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return kj::str(s);
    }
    KJ_CASE_ONEOF(list, kj::Array<kj::String>) {
      return KJ_MAP(item, list) {
        return kj::str(item);
      };
    }
  }
  KJ_UNREACHABLE;
}

kj::Maybe<double> numeric_value(const AttributeValue& value) {
  if (value.is<int64_t>()) {
    return static_cast<double>(value.get<int64_t>());
  }
  if (value.is<double>()) {
    return value.get<double>();
  }
  return kj::none;
}

bool values_equal(const AttributeValue& a, const AttributeValue& b) {
  KJ_IF_SOME(x, numeric_value(a)) {
    KJ_IF_SOME(y, numeric_value(b)) {
      return x == y;
    }
    return false;
  }
  if (a.is<bool>() && b.is<bool>()) {
    return a.get<bool>() == b.get<bool>();
  }
  if (a.is<kj::String>() && b.is<kj::String>()) {
    return a.get<kj::String>() == b.get<kj::String>();
  }
  if (a.is<kj::Array<kj::String>>() && b.is<kj::Array<kj::String>>()) {
    auto& x = a.get<kj::Array<kj::String>>();
    auto& y = b.get<kj::Array<kj::String>>();
    if (x.size() != y.size()) {
      return false;
    }
    for (size_t i = 0; i < x.size(); ++i) {
      if (x[i] != y[i]) {
        return false;
      }
    }
    return true;
  }
  return false;
}

kj::StringPtr value_type_name(const AttributeValue& value) {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(b, bool) {
      return "bool"_kj;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return "int"_kj;
    }
    KJ_CASE_ONEOF(d, double) {
      return "double"_kj;
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return "string"_kj;
    }
    KJ_CASE_ONEOF(list, kj::Array<kj::String>) {
      return "list"_kj;
    }
  }
  KJ_UNREACHABLE;
}

kj::String describe_value(const AttributeValue& value) {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(b, bool) {
      return kj::str(b ? "true" : "false");
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return kj::str(i);
    }
    KJ_CASE_ONEOF(d, double) {
      return kj::str(d);
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return kj::str("\"", s, "\"");
    }
    KJ_CASE_ONEOF(list, kj::Array<kj::String>) {
      return kj::str("[", kj::strArray(list, ", "), "]");
    }
  }
  KJ_UNREACHABLE;
}

AttributeValue value_from_json(const core::JsonValue& json, kj::StringPtr context) {
  if (json.is_bool()) {
    return json.get_bool();
  }
  if (json.is_uint() &&
      json.get_uint() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    // Out of int64 range; kept as a number so numeric conditions still see it
    return json.get_double();
  }
  if (json.is_int()) {
    return json.get_int();
  }
  if (json.is_real()) {
    return json.get_double();
  }
  KJ_IF_SOME(s, json.get_string_ptr()) {
    return kj::str(s);
  }
  if (json.is_array()) {
    auto builder = kj::heapArrayBuilder<kj::String>(json.size());
    json.for_each_array([&](const core::JsonValue& item) {
      KJ_IF_SOME(s, item.get_string_ptr()) {
        builder.add(kj::str(s));
      } else {
        throw core::ValidationException(kj::str("'", context, "' must be a list of strings, found ",
                                                item.type_name(), " element"));
      }
    });
    return builder.finish();
  }
  throw core::ValidationException(
      kj::str("'", context, "' has unsupported type ", json.type_name()));
}

void put_json_value(core::JsonBuilder& object, kj::StringPtr key, const AttributeValue& value) {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(b, bool) {
      object.put(key, b);
    }
    KJ_CASE_ONEOF(i, int64_t) {
      object.put(key, i);
    }
    KJ_CASE_ONEOF(d, double) {
      object.put(key, d);
    }
    KJ_CASE_ONEOF(s, kj::String) {
      object.put(key, s.asPtr());
    }
    KJ_CASE_ONEOF(list, kj::Array<kj::String>) {
      object.put(key, list.asPtr());
    }
  }
}

void add_json_value(core::JsonBuilder& array, const AttributeValue& value) {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(b, bool) {
      array.add(b);
    }
    KJ_CASE_ONEOF(i, int64_t) {
      array.add(i);
    }
    KJ_CASE_ONEOF(d, double) {
      array.add(d);
    }
    KJ_CASE_ONEOF(s, kj::String) {
      array.add(s.asPtr());
    }
    KJ_CASE_ONEOF(list, kj::Array<kj::String>) {
      array.add_array([&list](core::JsonBuilder& nested) {
        for (auto& item : list) {
          nested.add(item.asPtr());
        }
      });
    }
  }
}

// ============================================================================
// AttributeMap
// ============================================================================

AttributeMap AttributeMap::clone() const {
  AttributeMap copy;
  for (auto& entry : values_) {
    copy.values_.insert(kj::str(entry.key), clone_value(entry.value));
  }
  return copy;
}

AttributeMap& AttributeMap::put(kj::StringPtr key, AttributeValue value) {
  values_.upsert(kj::str(key), kj::mv(value),
                 [](AttributeValue& existing, AttributeValue&& replacement) {
                   existing = kj::mv(replacement);
                 });
  return *this;
}

AttributeMap& AttributeMap::put_string(kj::StringPtr key, kj::StringPtr value) {
  return put(key, kj::str(value));
}

AttributeMap& AttributeMap::put_int(kj::StringPtr key, int64_t value) {
  return put(key, value);
}

AttributeMap& AttributeMap::put_double(kj::StringPtr key, double value) {
  return put(key, value);
}

AttributeMap& AttributeMap::put_bool(kj::StringPtr key, bool value) {
  return put(key, value);
}

AttributeMap& AttributeMap::put_list(kj::StringPtr key, kj::ArrayPtr<const kj::StringPtr> values) {
  return put(key, KJ_MAP(v, values) { return kj::str(v); });
}

AttributeMap& AttributeMap::put_list(kj::StringPtr key, kj::Array<kj::String> values) {
  return put(key, kj::mv(values));
}

bool AttributeMap::contains(kj::StringPtr key) const {
  return values_.find(key) != kj::none;
}

kj::Maybe<const AttributeValue&> AttributeMap::get(kj::StringPtr key) const {
  return values_.find(key);
}

kj::Maybe<kj::StringPtr> AttributeMap::get_string(kj::StringPtr key) const {
  KJ_IF_SOME(value, values_.find(key)) {
    if (value.is<kj::String>()) {
      return value.get<kj::String>().asPtr();
    }
  }
  return kj::none;
}

kj::Maybe<double> AttributeMap::get_number(kj::StringPtr key) const {
  KJ_IF_SOME(value, values_.find(key)) {
    return numeric_value(value);
  }
  return kj::none;
}

kj::Maybe<bool> AttributeMap::get_bool(kj::StringPtr key) const {
  KJ_IF_SOME(value, values_.find(key)) {
    if (value.is<bool>()) {
      return value.get<bool>();
    }
  }
  return kj::none;
}

kj::Maybe<kj::ArrayPtr<const kj::String>> AttributeMap::get_list(kj::StringPtr key) const {
  KJ_IF_SOME(value, values_.find(key)) {
    if (value.is<kj::Array<kj::String>>()) {
      return value.get<kj::Array<kj::String>>().asPtr();
    }
  }
  return kj::none;
}

void AttributeMap::write_json(core::JsonBuilder& object) const {
  for (auto& entry : values_) {
    put_json_value(object, entry.key, entry.value);
  }
}

kj::String AttributeMap::to_json() const {
  auto builder = core::JsonBuilder::object();
  write_json(builder);
  return builder.build();
}

AttributeMap AttributeMap::from_json(const core::JsonValue& object) {
  if (!object.is_object()) {
    throw core::ValidationException(
        kj::str("attributes must be a JSON object, found ", object.type_name()));
  }
  AttributeMap map;
  object.for_each_object([&map](kj::StringPtr key, const core::JsonValue& value) {
    map.put(key, value_from_json(value, key));
  });
  return map;
}

AttributeMap AttributeMap::from_json(kj::StringPtr json) {
  auto doc = core::JsonDocument::parse(json);
  return from_json(doc.root());
}

bool AttributeMap::operator==(const AttributeMap& other) const {
  if (values_.size() != other.values_.size()) {
    return false;
  }
  for (auto& entry : values_) {
    KJ_IF_SOME(value, other.values_.find(entry.key)) {
      if (!values_equal(entry.value, value)) {
        return false;
      }
    } else {
      return false;
    }
  }
  return true;
}

} // namespace vigil::policy
