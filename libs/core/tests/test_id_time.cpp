#include "kj/test.h"
#include "vigil/core/id.h"
#include "vigil/core/time.h"

#include <kj/map.h>
#include <kj/string.h>

using namespace vigil::core;

namespace {

KJ_TEST("generate_uuid_v4: Format") {
  auto id = generate_uuid_v4();
  KJ_EXPECT(id.size() == 36);
  KJ_EXPECT(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
  KJ_EXPECT(id[14] == '4');
  char variant = id[19];
  KJ_EXPECT(variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
  KJ_EXPECT(is_uuid(id));
}

KJ_TEST("generate_uuid_v4: Unique") {
  kj::HashSet<kj::String> seen;
  for (int i = 0; i < 1000; ++i) {
    auto id = generate_uuid_v4();
    KJ_EXPECT(!seen.contains(id));
    seen.insert(kj::mv(id));
  }
  KJ_EXPECT(seen.size() == 1000);
}

KJ_TEST("is_uuid: Rejects malformed ids") {
  KJ_EXPECT(!is_uuid(""_kj));
  KJ_EXPECT(!is_uuid("not-a-uuid"_kj));
  KJ_EXPECT(!is_uuid("123e4567-e89b-12d3-a456-42661417400"_kj));
  KJ_EXPECT(!is_uuid("123E4567-E89B-12D3-A456-426614174000"_kj));
  KJ_EXPECT(is_uuid("123e4567-e89b-12d3-a456-426614174000"_kj));
}

KJ_TEST("to_utc_iso8601: Formats epoch nanoseconds") {
  KJ_EXPECT(to_utc_iso8601(0) == "1970-01-01T00:00:00.000000000Z");
  KJ_EXPECT(to_utc_iso8601(1'700'000'000'123'456'789) == "2023-11-14T22:13:20.123456789Z");
  KJ_EXPECT(to_utc_iso8601(-1) == "1969-12-31T23:59:59.999999999Z");
}

KJ_TEST("now_unix_ns: Monotone enough for ordering") {
  auto first = now_unix_ns();
  auto second = now_unix_ns();
  KJ_EXPECT(first > 0);
  KJ_EXPECT(second >= first);
  KJ_EXPECT(now_utc_iso8601().endsWith("Z"));
}

} // namespace
