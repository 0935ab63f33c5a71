#pragma once

#include "vigil/core/json.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace vigil::policy {

/**
 * @brief Typed attribute value
 *
 * The closed set of value types an action's metadata or a structured replan
 * hint may carry: a scalar (bool, integer, real, string) or a list of strings.
 */
using AttributeValue = kj::OneOf<bool, int64_t, double, kj::String, kj::Array<kj::String>>;

[[nodiscard]] AttributeValue clone_value(const AttributeValue& value);

/**
 * @brief Compare two attribute values
 *
 * Integers and reals compare by numeric value. Booleans never equal numbers
 * and strings never equal numbers; lists compare element-wise.
 */
[[nodiscard]] bool values_equal(const AttributeValue& a, const AttributeValue& b);

/**
 * @brief Numeric view of a value: integers and reals only, never booleans
 */
[[nodiscard]] kj::Maybe<double> numeric_value(const AttributeValue& value);

/**
 * @brief Short type name for diagnostics ("bool", "int", "double", "string", "list")
 */
[[nodiscard]] kj::StringPtr value_type_name(const AttributeValue& value);

/**
 * @brief Render a value for human-readable messages
 */
[[nodiscard]] kj::String describe_value(const AttributeValue& value);

/**
 * @brief Convert a JSON scalar or string array into an attribute value
 * @param context Name used in the error message (key or field path)
 * @throws core::ValidationException for null, objects and non-string arrays
 */
[[nodiscard]] AttributeValue value_from_json(const core::JsonValue& json, kj::StringPtr context);

void put_json_value(core::JsonBuilder& object, kj::StringPtr key, const AttributeValue& value);
void add_json_value(core::JsonBuilder& array, const AttributeValue& value);

/**
 * @brief String-keyed map of typed attributes
 *
 * Keys iterate in sorted order, so serialization and comparison are
 * deterministic. Getters are typed and never coerce: get_string() on an
 * integer attribute yields none.
 */
class AttributeMap final {
public:
  AttributeMap() = default;
  AttributeMap(AttributeMap&&) = default;
  AttributeMap& operator=(AttributeMap&&) = default;
  KJ_DISALLOW_COPY(AttributeMap);

  [[nodiscard]] AttributeMap clone() const;

  AttributeMap& put(kj::StringPtr key, AttributeValue value);
  AttributeMap& put_string(kj::StringPtr key, kj::StringPtr value);
  AttributeMap& put_int(kj::StringPtr key, int64_t value);
  AttributeMap& put_double(kj::StringPtr key, double value);
  AttributeMap& put_bool(kj::StringPtr key, bool value);
  AttributeMap& put_list(kj::StringPtr key, kj::ArrayPtr<const kj::StringPtr> values);
  AttributeMap& put_list(kj::StringPtr key, kj::Array<kj::String> values);

  [[nodiscard]] bool contains(kj::StringPtr key) const;
  [[nodiscard]] kj::Maybe<const AttributeValue&> get(kj::StringPtr key) const;

  [[nodiscard]] kj::Maybe<kj::StringPtr> get_string(kj::StringPtr key) const;

  /**
   * @brief Integer or real attribute as double; none when absent or not numeric
   */
  [[nodiscard]] kj::Maybe<double> get_number(kj::StringPtr key) const;

  [[nodiscard]] kj::Maybe<bool> get_bool(kj::StringPtr key) const;
  [[nodiscard]] kj::Maybe<kj::ArrayPtr<const kj::String>> get_list(kj::StringPtr key) const;

  [[nodiscard]] size_t size() const {
    return values_.size();
  }
  [[nodiscard]] bool empty() const {
    return values_.size() == 0;
  }

  auto begin() const {
    return values_.begin();
  }
  auto end() const {
    return values_.end();
  }

  /**
   * @brief Add every attribute as a member of an object builder
   */
  void write_json(core::JsonBuilder& object) const;

  [[nodiscard]] kj::String to_json() const;

  /**
   * @throws core::ValidationException if the value is not an object of supported values
   */
  [[nodiscard]] static AttributeMap from_json(const core::JsonValue& object);

  /**
   * @throws core::ParseException for invalid JSON text
   * @throws core::ValidationException for unsupported values
   */
  [[nodiscard]] static AttributeMap from_json(kj::StringPtr json);

  bool operator==(const AttributeMap& other) const;

private:
  kj::TreeMap<kj::String, AttributeValue> values_;
};

} // namespace vigil::policy
