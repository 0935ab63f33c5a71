#include "vigil/core/config.h"

#include "vigil/core/json.h"

#include <kj/debug.h>

namespace vigil::core {

namespace {

Config::Value json_to_value(kj::StringPtr key, const JsonValue& j) {
  if (j.is_bool()) {
    return j.get_bool();
  }
  if (j.is_int()) {
    return j.get_int();
  }
  if (j.is_real()) {
    return j.get_double();
  }
  if (j.is_string()) {
    return j.get_string();
  }
  if (j.is_array()) {
    auto builder = kj::heapArrayBuilder<kj::String>(j.size());
    j.for_each_array([&](const JsonValue& item) {
      KJ_IF_SOME(s, item.get_string_ptr()) {
        builder.add(kj::str(s));
      } else {
        throw ConfigException(
            kj::str("Config key '", key, "' must be an array of strings, found ", item.type_name()));
      }
    });
    return builder.finish();
  }
  throw ConfigException(kj::str("Config key '", key, "' has unsupported type ", j.type_name()));
}

Config::Value clone_value(const Config::Value& v) {
  KJ_SWITCH_ONEOF(v) {
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
    KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
      auto builder = kj::heapArrayBuilder<kj::String>(a.size());
      for (const auto& item : a) {
        builder.add(kj::str(item));
      }
      return builder.finish();
    }
  }
  KJ_UNREACHABLE;
}

kj::TreeMap<kj::String, Config::Value> values_from_root(const JsonValue& root,
                                                        kj::StringPtr origin) {
  if (!root.is_object()) {
    throw ConfigException(
        kj::str("Configuration ", origin, " must be a JSON object, found ", root.type_name()));
  }
  kj::TreeMap<kj::String, Config::Value> values;
  root.for_each_object([&](kj::StringPtr key, const JsonValue& value) {
    // Later duplicates win, as in most JSON readers
    values.upsert(kj::str(key), json_to_value(key, value),
                  [](Config::Value& existing, Config::Value&& replacement) {
                    existing = kj::mv(replacement);
                  });
  });
  return values;
}

} // namespace

void Config::load_from_string(kj::StringPtr json_content) {
  JsonDocument doc;
  try {
    doc = JsonDocument::parse(json_content);
  } catch (const ParseException& e) {
    throw ConfigException(kj::str("Invalid configuration: ", e.message()));
  }
  // Fully parsed before assignment, so a failed load keeps the old contents
  config_ = values_from_root(doc.root(), "text"_kj);
}

void Config::load_from_file(kj::StringPtr file_path) {
  JsonDocument doc;
  try {
    doc = JsonDocument::parse_file(file_path);
  } catch (const ResourceException& e) {
    throw ConfigException(kj::str("Cannot read configuration file: ", e.message()));
  } catch (const ParseException& e) {
    throw ConfigException(kj::str("Invalid configuration in ", file_path, ": ", e.message()));
  }
  config_ = values_from_root(doc.root(), file_path);
}

Config Config::from_string(kj::StringPtr json_content) {
  Config config;
  config.load_from_string(json_content);
  return config;
}

Config Config::from_file(kj::StringPtr file_path) {
  Config config;
  config.load_from_file(file_path);
  return config;
}

kj::String Config::to_string() const {
  auto builder = JsonBuilder::object();
  for (const auto& entry : config_) {
    kj::StringPtr key = entry.key;
    KJ_SWITCH_ONEOF(entry.value) {
      KJ_CASE_ONEOF(b, bool) {
        builder.put(key, b);
      }
      KJ_CASE_ONEOF(i, int64_t) {
        builder.put(key, i);
      }
      KJ_CASE_ONEOF(d, double) {
        builder.put(key, d);
      }
      KJ_CASE_ONEOF(s, kj::String) {
        builder.put(key, s.asPtr());
      }
      KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
        builder.put(key, a.asPtr());
      }
    }
  }
  return builder.build();
}

bool Config::has_key(kj::StringPtr key) const {
  return config_.find(key) != kj::none;
}

void Config::set(kj::StringPtr key, Value value) {
  config_.upsert(kj::str(key), kj::mv(value), [](Value& existing, Value&& replacement) {
    existing = kj::mv(replacement);
  });
}

void Config::remove(kj::StringPtr key) {
  config_.erase(key);
}

void Config::merge(const Config& other) {
  for (const auto& entry : other.config_) {
    set(entry.key, clone_value(entry.value));
  }
}

kj::Array<kj::String> Config::keys() const {
  auto builder = kj::heapArrayBuilder<kj::String>(config_.size());
  for (const auto& entry : config_) {
    builder.add(kj::str(entry.key));
  }
  return builder.finish();
}

} // namespace vigil::core
