#pragma once

#include <kj/common.h>
#include <kj/string.h>

namespace vigil::core {

/**
 * @brief Generate a random RFC 4122 version 4 UUID
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx (lowercase hex).
 * Safe to call from multiple threads.
 */
[[nodiscard]] kj::String generate_uuid_v4();

/**
 * @brief Check whether a string is a canonical lowercase UUID
 */
[[nodiscard]] bool is_uuid(kj::StringPtr value);

} // namespace vigil::core
