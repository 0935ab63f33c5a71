#pragma once

#include <chrono>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace vigil::core {

[[nodiscard]] std::int64_t now_unix_ns();

// Formats nanoseconds since the Unix epoch as YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ
[[nodiscard]] kj::String to_utc_iso8601(std::int64_t unix_ns);

[[nodiscard]] kj::String now_utc_iso8601();

} // namespace vigil::core
