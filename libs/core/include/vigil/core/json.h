/**
 * @file json.h
 * @brief JSON wrapper using yyjson
 *
 * RAII wrapper around yyjson for parsing rule documents, configuration and
 * decision records, and for producing structured log lines.
 *
 * Usage:
 *   auto doc = JsonDocument::parse(json_string);
 *   auto root = doc.root();
 *   KJ_IF_SOME(id, root.get("id")) { ... }
 *
 *   auto builder = JsonBuilder::object();
 *   builder.put("result", "DENY").put("severity", "hard");
 *   kj::String json = builder.build();
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

// Forward declarations for yyjson types to avoid including C header
struct yyjson_doc;
struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace vigil::core {

/**
 * @brief RAII wrapper for yyjson_mut_doc* (mutable document)
 *
 * Move-only ownership of a yyjson mutable document.
 * Automatically calls yyjson_mut_doc_free() on destruction.
 */
class YyJsonMutDoc {
public:
  YyJsonMutDoc() noexcept : doc_(nullptr) {}
  explicit YyJsonMutDoc(yyjson_mut_doc* doc) noexcept : doc_(doc) {}

  ~YyJsonMutDoc() noexcept;

  YyJsonMutDoc(YyJsonMutDoc&& other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }

  YyJsonMutDoc& operator=(YyJsonMutDoc&& other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }

  YyJsonMutDoc(const YyJsonMutDoc&) = delete;
  YyJsonMutDoc& operator=(const YyJsonMutDoc&) = delete;

  [[nodiscard]] yyjson_mut_doc* get() const noexcept {
    return doc_;
  }

  void reset(yyjson_mut_doc* doc = nullptr) noexcept;

  [[nodiscard]] explicit operator bool() const noexcept {
    return doc_ != nullptr;
  }

private:
  yyjson_mut_doc* doc_;
};

class JsonValue;

/**
 * @brief RAII wrapper for an immutable yyjson document
 *
 * Owns the parsed document; every JsonValue obtained from it is a view that
 * must not outlive the document.
 */
class JsonDocument {
public:
  JsonDocument();
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse JSON from string
   * @param str JSON text
   * @return JsonDocument with parsed content
   * @throws ParseException if the text is not valid JSON
   */
  static JsonDocument parse(kj::StringPtr str);

  /**
   * @brief Parse JSON from file
   * @param path Path to JSON file
   * @throws ResourceException if the file cannot be read
   * @throws ParseException if the content is not valid JSON
   */
  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;

  [[nodiscard]] bool is_valid() const {
    return doc_ != nullptr;
  }

private:
  explicit JsonDocument(yyjson_doc* doc);
  yyjson_doc* doc_;
};

/**
 * @brief Read-only view of a JSON value
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr);

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_int() const; // signed or unsigned integer
  bool is_uint() const;
  bool is_real() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  /**
   * @brief Name of the JSON type ("object", "array", "string", ...), for diagnostics
   */
  kj::StringPtr type_name() const;

  bool get_bool(bool default_val = false) const;
  /**
   * @brief Integer value; unsigned values above INT64_MAX saturate to INT64_MAX
   */
  int64_t get_int(int64_t default_val = 0) const;
  uint64_t get_uint(uint64_t default_val = 0) const;
  double get_double(double default_val = 0.0) const;
  kj::String get_string(kj::StringPtr default_val = ""_kj) const;

  /**
   * @brief Zero-copy string access
   * @return The string, or none if this is not a string
   */
  kj::Maybe<kj::StringPtr> get_string_ptr() const;

  /**
   * @brief Number of elements of an array or members of an object, 0 otherwise
   */
  size_t size() const;

  JsonValue operator[](size_t index) const;
  JsonValue operator[](kj::StringPtr key) const;

  /**
   * @brief Get object member by key
   * @return The member, or none if absent or this is not an object
   */
  kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::Function<void(const JsonValue&)> callback) const;

  /**
   * @brief Iterate object members in document order
   */
  void for_each_object(kj::Function<void(kj::StringPtr, const JsonValue&)> callback) const;

  kj::Vector<kj::String> keys() const;

  bool is_valid() const {
    return val_ != nullptr;
  }

  yyjson_val* raw() const {
    return val_;
  }

private:
  yyjson_val* val_;
};

/**
 * @brief Builder for creating JSON documents
 *
 * Fluent API for constructing JSON objects and arrays on top of the yyjson
 * mutable document API.
 */
class JsonBuilder {
public:
  static JsonBuilder object();
  static JsonBuilder array();

  ~JsonBuilder();
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;

  /**
   * @brief Add key-value pair to object
   */
  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);
  JsonBuilder& put(kj::StringPtr key, kj::ArrayPtr<const kj::String> value);

  /**
   * @brief Add already-serialized JSON verbatim; the caller guarantees it is valid
   */
  JsonBuilder& put_raw(kj::StringPtr key, kj::StringPtr json);

  JsonBuilder& put_object(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder);

  /**
   * @brief Add value to array
   */
  JsonBuilder& add(const char* value);
  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(bool value);
  JsonBuilder& add(int value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(uint64_t value);
  JsonBuilder& add(double value);
  JsonBuilder& add(std::nullptr_t);

  JsonBuilder& add_object(kj::Function<void(JsonBuilder&)> builder);
  JsonBuilder& add_array(kj::Function<void(JsonBuilder&)> builder);

  /**
   * @brief Serialize the document
   * @param pretty Pretty print with indentation
   */
  kj::String build(bool pretty = false) const;

private:
  enum class Type { Object, Array };
  explicit JsonBuilder(Type type);

  yyjson_mut_val* make_key(kj::StringPtr key);
  void put_value(kj::StringPtr key, yyjson_mut_val* value);
  void add_value(yyjson_mut_val* value);

  struct Impl;
  kj::Own<Impl> impl_;
};

namespace json_utils {

/**
 * @brief Escape string for embedding inside a JSON string literal
 */
kj::String escape_string(kj::StringPtr str);

/**
 * @brief Validate JSON text without keeping the document
 */
bool is_valid_json(kj::StringPtr str);

} // namespace json_utils

} // namespace vigil::core
