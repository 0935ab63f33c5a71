#include "vigil/core/json.h"

#include "vigil/core/error.h"

#include <cstdlib>
#include <limits>
#include <kj/debug.h>
#include <kj/filesystem.h>

#include <yyjson.h>

namespace vigil::core {

// ============================================================================
// YyJsonMutDoc
// ============================================================================

YyJsonMutDoc::~YyJsonMutDoc() noexcept {
  if (doc_) {
    yyjson_mut_doc_free(doc_);
  }
}

void YyJsonMutDoc::reset(yyjson_mut_doc* doc) noexcept {
  if (doc_) {
    yyjson_mut_doc_free(doc_);
  }
  doc_ = doc;
}

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::JsonDocument() : doc_(nullptr) {}

JsonDocument::JsonDocument(yyjson_doc* doc) : doc_(doc) {}

JsonDocument::~JsonDocument() {
  if (doc_) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr str) {
  yyjson_read_err err;
  yyjson_doc* doc =
      yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, &err);
  if (doc == nullptr) {
    throw ParseException(kj::str("JSON parse error at byte ", err.pos, ": ",
                                 err.msg != nullptr ? err.msg : "unknown error"));
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path) {
  auto fs = kj::newDiskFilesystem();
  auto resolved = fs->getCurrentPath().evalNative(path);
  KJ_IF_SOME(file, fs->getRoot().tryOpenFile(resolved)) {
    auto text = file->readAllText();
    return parse(text);
  }
  throw ResourceException(kj::str("Failed to open JSON file: ", path));
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue
// ============================================================================

JsonValue::JsonValue(yyjson_val* val) : val_(val) {}

bool JsonValue::is_null() const {
  return val_ && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ && yyjson_is_int(val_);
}

bool JsonValue::is_uint() const {
  return val_ && yyjson_is_uint(val_);
}

bool JsonValue::is_real() const {
  return val_ && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ && yyjson_is_obj(val_);
}

kj::StringPtr JsonValue::type_name() const {
  if (val_ == nullptr) {
    return "missing"_kj;
  }
  if (is_null()) {
    return "null"_kj;
  }
  if (is_bool()) {
    return "boolean"_kj;
  }
  if (is_number()) {
    return "number"_kj;
  }
  if (is_string()) {
    return "string"_kj;
  }
  if (is_array()) {
    return "array"_kj;
  }
  if (is_object()) {
    return "object"_kj;
  }
  return "unknown"_kj;
}

bool JsonValue::get_bool(bool default_val) const {
  if (!is_bool()) {
    return default_val;
  }
  return yyjson_get_bool(val_);
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (is_uint()) {
    auto value = yyjson_get_uint(val_);
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(value);
  }
  if (is_int()) {
    return yyjson_get_sint(val_);
  }
  if (is_real()) {
    return static_cast<int64_t>(yyjson_get_real(val_));
  }
  return default_val;
}

uint64_t JsonValue::get_uint(uint64_t default_val) const {
  if (is_uint()) {
    return yyjson_get_uint(val_);
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  if (!is_number()) {
    return default_val;
  }
  return yyjson_get_num(val_);
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  KJ_IF_SOME(s, get_string_ptr()) {
    return kj::str(s);
  }
  return kj::str(default_val);
}

kj::Maybe<kj::StringPtr> JsonValue::get_string_ptr() const {
  if (!is_string()) {
    return kj::none;
  }
  const char* str = yyjson_get_str(val_);
  if (str == nullptr) {
    return kj::none;
  }
  // yyjson keeps strings NUL-terminated
  return kj::StringPtr(str, yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!is_array()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_arr_get(val_, index));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  if (!is_object()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_obj_getn(val_, key.cStr(), key.size()));
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  if (!is_object()) {
    return kj::none;
  }
  yyjson_val* child = yyjson_obj_getn(val_, key.cStr(), key.size());
  if (child == nullptr) {
    return kj::none;
  }
  return JsonValue(child);
}

void JsonValue::for_each_array(kj::Function<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  yyjson_arr_iter iter;
  yyjson_arr_iter_init(val_, &iter);
  yyjson_val* item;
  while ((item = yyjson_arr_iter_next(&iter)) != nullptr) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::Function<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  yyjson_obj_iter iter;
  yyjson_obj_iter_init(val_, &iter);
  yyjson_val* key;
  while ((key = yyjson_obj_iter_next(&iter)) != nullptr) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)),
             JsonValue(yyjson_obj_iter_get_val(key)));
  }
}

kj::Vector<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> result;
  for_each_object([&](kj::StringPtr key, const JsonValue&) { result.add(kj::str(key)); });
  return result;
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::Impl {
  YyJsonMutDoc doc;
  yyjson_mut_val* current = nullptr; // owned by doc
  bool is_object = true;
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->is_object = (type == Type::Object);
  impl_->doc.reset(yyjson_mut_doc_new(nullptr));
  KJ_REQUIRE(impl_->doc.get() != nullptr, "failed to allocate JSON document");
  impl_->current =
      impl_->is_object ? yyjson_mut_obj(impl_->doc.get()) : yyjson_mut_arr(impl_->doc.get());
}

JsonBuilder::~JsonBuilder() = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : impl_(kj::mv(other.impl_)) {}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    impl_ = kj::mv(other.impl_);
  }
  return *this;
}

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

yyjson_mut_val* JsonBuilder::make_key(kj::StringPtr key) {
  return yyjson_mut_strncpy(impl_->doc.get(), key.cStr(), key.size());
}

void JsonBuilder::put_value(kj::StringPtr key, yyjson_mut_val* value) {
  KJ_REQUIRE(impl_->is_object, "put() called on a JSON array builder", key);
  yyjson_mut_val* key_val = make_key(key);
  if (key_val != nullptr && value != nullptr) {
    yyjson_mut_obj_add(impl_->current, key_val, value);
  }
}

void JsonBuilder::add_value(yyjson_mut_val* value) {
  KJ_REQUIRE(!impl_->is_object, "add() called on a JSON object builder");
  if (value != nullptr) {
    yyjson_mut_arr_append(impl_->current, value);
  }
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  return put(key, kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  put_value(key, yyjson_mut_strncpy(impl_->doc.get(), value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  put_value(key, yyjson_mut_bool(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  put_value(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  put_value(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  put_value(key, yyjson_mut_uint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  put_value(key, yyjson_mut_real(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  put_value(key, yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::ArrayPtr<const kj::String> value) {
  yyjson_mut_val* arr = yyjson_mut_arr(impl_->doc.get());
  for (auto& v : value) {
    yyjson_mut_arr_add_strncpy(impl_->doc.get(), arr, v.cStr(), v.size());
  }
  put_value(key, arr);
  return *this;
}

JsonBuilder& JsonBuilder::put_raw(kj::StringPtr key, kj::StringPtr json) {
  put_value(key, yyjson_mut_rawncpy(impl_->doc.get(), json.cStr(), json.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder) {
  KJ_REQUIRE(impl_->is_object, "put_object() called on a JSON array builder", key);
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc.get());
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = true;
  put_value(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder) {
  KJ_REQUIRE(impl_->is_object, "put_array() called on a JSON array builder", key);
  yyjson_mut_val* nested = yyjson_mut_arr(impl_->doc.get());
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = false;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = true;
  put_value(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::add(const char* value) {
  return add(kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  add_value(yyjson_mut_strncpy(impl_->doc.get(), value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::add(bool value) {
  add_value(yyjson_mut_bool(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(int value) {
  add_value(yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  add_value(yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(uint64_t value) {
  add_value(yyjson_mut_uint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  add_value(yyjson_mut_real(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::add(std::nullptr_t) {
  add_value(yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::Function<void(JsonBuilder&)> builder) {
  KJ_REQUIRE(!impl_->is_object, "add_object() called on a JSON object builder");
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc.get());
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = true;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = false;
  add_value(nested);
  return *this;
}

JsonBuilder& JsonBuilder::add_array(kj::Function<void(JsonBuilder&)> builder) {
  KJ_REQUIRE(!impl_->is_object, "add_array() called on a JSON object builder");
  yyjson_mut_val* nested = yyjson_mut_arr(impl_->doc.get());
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = false;
  add_value(nested);
  return *this;
}

kj::String JsonBuilder::build(bool pretty) const {
  KJ_REQUIRE(impl_.get() != nullptr, "build() on a moved-from JsonBuilder");
  yyjson_mut_doc_set_root(impl_->doc.get(), impl_->current);
  size_t len = 0;
  yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : 0;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(impl_->doc.get(), flags, nullptr, &len, &err);
  KJ_REQUIRE(json != nullptr, "JSON write failed", err.msg != nullptr ? err.msg : "unknown");
  kj::String result = kj::heapString(json, len);
  free(json);
  return result;
}

// ============================================================================
// json_utils
// ============================================================================

namespace json_utils {

kj::String escape_string(kj::StringPtr str) {
  auto builder = JsonBuilder::array();
  builder.add(str);
  auto json = builder.build();
  kj::StringPtr text = json;
  // Strip the surrounding `["` and `"]`
  if (text.size() >= 4) {
    return kj::heapString(text.slice(2).begin(), text.size() - 4);
  }
  return kj::str(text);
}

bool is_valid_json(kj::StringPtr str) {
  try {
    JsonDocument::parse(str);
    return true;
  } catch (const ParseException&) {
    return false;
  }
}

} // namespace json_utils

} // namespace vigil::core
