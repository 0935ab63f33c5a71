#include "vigil/core/id.h"

#include <cstdint>
#include <kj/array.h>
#include <random>

namespace vigil::core {

namespace {
constexpr char kHexChars[] = "0123456789abcdef";
} // namespace

kj::String generate_uuid_v4() {
  // std::random_device and std::mt19937_64 are used because KJ does not provide an RNG
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());

  uint64_t hi = gen();
  uint64_t lo = gen();

  // Version 4 and RFC 4122 variant bits
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  auto builder = kj::heapArrayBuilder<char>(37);
  auto append_hex = [&builder](uint64_t bits, int nibbles) {
    for (int i = nibbles - 1; i >= 0; --i) {
      builder.add(kHexChars[(bits >> (i * 4)) & 0xF]);
    }
  };

  append_hex(hi >> 32, 8);
  builder.add('-');
  append_hex((hi >> 16) & 0xFFFF, 4);
  builder.add('-');
  append_hex(hi & 0xFFFF, 4);
  builder.add('-');
  append_hex(lo >> 48, 4);
  builder.add('-');
  append_hex(lo & 0xFFFFFFFFFFFFULL, 12);
  builder.add('\0');

  return kj::String(builder.finish());
}

bool is_uuid(kj::StringPtr value) {
  if (value.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') {
        return false;
      }
    } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace vigil::core
