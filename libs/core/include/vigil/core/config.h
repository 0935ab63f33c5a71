#pragma once

#include "vigil/core/error.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <source_location>
#include <type_traits>

namespace vigil::core {

/**
 * @brief Configuration-related exception
 *
 * Raised for unreadable or malformed configuration documents and for missing
 * or wrongly typed required keys.
 */
class ConfigException : public VigilException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : VigilException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] kj::StringPtr kind() const noexcept override {
    return "ConfigException"_kj;
  }
};

/**
 * @brief Flat, typed key/value configuration loaded from a JSON object
 *
 * Values keep the JSON type they were loaded with. get<T>() does not coerce
 * between types, except that an integer widens to double. Nested objects,
 * nulls and mixed-type arrays are rejected at load.
 */
class Config final {
public:
  using Value = kj::OneOf<bool, int64_t, double, kj::String, kj::Array<kj::String>>;

  Config() = default;

  /**
   * @brief Replace the contents with the members of a JSON object
   * @throws ConfigException if the text is not a JSON object of supported values
   */
  void load_from_string(kj::StringPtr json_content);

  /**
   * @throws ConfigException if the file cannot be read or is malformed
   */
  void load_from_file(kj::StringPtr file_path);

  static Config from_string(kj::StringPtr json_content);
  static Config from_file(kj::StringPtr file_path);

  kj::String to_string() const;

  [[nodiscard]] bool has_key(kj::StringPtr key) const;
  void set(kj::StringPtr key, Value value);
  void remove(kj::StringPtr key);

  template <typename T> [[nodiscard]] kj::Maybe<T> get(kj::StringPtr key) const {
    KJ_IF_SOME(value, config_.find(key)) {
      if constexpr (std::is_same_v<T, bool>) {
        if (value.template is<bool>()) {
          return value.template get<bool>();
        }
      } else if constexpr (std::is_same_v<T, int64_t>) {
        if (value.template is<int64_t>()) {
          return value.template get<int64_t>();
        }
      } else if constexpr (std::is_same_v<T, double>) {
        if (value.template is<double>()) {
          return value.template get<double>();
        }
        if (value.template is<int64_t>()) {
          return static_cast<double>(value.template get<int64_t>());
        }
      } else if constexpr (std::is_same_v<T, kj::StringPtr>) {
        if (value.template is<kj::String>()) {
          return value.template get<kj::String>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const kj::String>>) {
        if (value.template is<kj::Array<kj::String>>()) {
          return value.template get<kj::Array<kj::String>>().asPtr();
        }
      } else {
        static_assert(kj::isSameType<T, void>(), "Unsupported config get<T>() type");
      }
      return kj::none;
    }
    return kj::none;
  }

  template <typename T> T get_or(kj::StringPtr key, T default_value) const {
    KJ_IF_SOME(value, get<T>(key)) {
      return value;
    }
    return default_value;
  }

  /**
   * @brief Get a value that must be present with the given type
   * @throws ConfigException if the key is absent or holds another type
   */
  template <typename T> T require(kj::StringPtr key) const {
    KJ_IF_SOME(value, get<T>(key)) {
      return value;
    }
    if (has_key(key)) {
      throw ConfigException(kj::str("Config key '", key, "' has the wrong type"));
    }
    throw ConfigException(kj::str("Missing required config key '", key, "'"));
  }

  /**
   * @brief Check that a present key holds the type the caller expects
   * @throws ConfigException if the key is present with another type
   */
  template <typename T> void check_type(kj::StringPtr key) const {
    if (has_key(key) && get<T>(key) == kj::none) {
      throw ConfigException(kj::str("Config key '", key, "' has the wrong type"));
    }
  }

  void merge(const Config& other);

  [[nodiscard]] kj::Array<kj::String> keys() const;

  [[nodiscard]] bool empty() const {
    return config_.size() == 0;
  }

  [[nodiscard]] size_t size() const {
    return config_.size();
  }

private:
  kj::TreeMap<kj::String, Value> config_;
};

} // namespace vigil::core
