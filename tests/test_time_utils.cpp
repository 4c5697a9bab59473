#include <gtest/gtest.h>
#include <foxess/time_utils.hpp>

#include <cstdlib>

using foxess::local_timezone_id;
using foxess::now_epoch_millis;
using foxess::timezone_from_zoneinfo_path;

TEST(TimeUtils, NowIsMilliseconds) {
  // 2023-11-14 в миллисекундах; секунды были бы на три порядка меньше
  EXPECT_GT(now_epoch_millis(), 1'700'000'000'000LL);
  EXPECT_LT(now_epoch_millis(), 10'000'000'000'000LL);
}

TEST(TimeUtils, NowIsMonotonicEnough) {
  const auto a = now_epoch_millis();
  const auto b = now_epoch_millis();
  EXPECT_LE(a, b);
}

TEST(TimeUtils, ZoneinfoPath) {
  EXPECT_EQ(timezone_from_zoneinfo_path("/usr/share/zoneinfo/Europe/Berlin"),
            "Europe/Berlin");
  EXPECT_EQ(timezone_from_zoneinfo_path("../usr/share/zoneinfo/UTC"), "UTC");
  EXPECT_EQ(timezone_from_zoneinfo_path("/etc/localtime"), "");
}

TEST(TimeUtils, OverrideWins) {
  EXPECT_EQ(local_timezone_id("Asia/Tokyo"), "Asia/Tokyo");
}

TEST(TimeUtils, TzEnvironment) {
  const char *old = std::getenv("TZ");
  const std::string saved = old ? old : "";

  ::setenv("TZ", ":America/Chicago", 1);
  EXPECT_EQ(local_timezone_id(), "America/Chicago");

  if (old)
    ::setenv("TZ", saved.c_str(), 1);
  else
    ::unsetenv("TZ");
}

TEST(TimeUtils, NeverEmpty) {
  EXPECT_FALSE(local_timezone_id().empty());
}
