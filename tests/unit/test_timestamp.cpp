#include <gtest/gtest.h>
#include "util/timestamp.hpp"
#include "util/strings.hpp"

using namespace nb::util;
using namespace std::chrono;

TEST(TimestampTest, FormatsIsoUtcWithMicroseconds) {
    const Timestamp ts = Clock::from_time_t(1700000000) + microseconds(42);
    EXPECT_EQ(timestampToString(ts), "2023-11-14T22:13:20.000042Z");
}

TEST(StringsTest, CaseInsensitiveContains) {
    EXPECT_TRUE(containsIgnoreCase("Buy MILK today", "milk"));
    EXPECT_FALSE(containsIgnoreCase("Buy bread", "milk"));
    EXPECT_TRUE(containsIgnoreCase("anything", ""));
    EXPECT_EQ(toLower("MiXeD"), "mixed");
}

TEST(StringsTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("caf\xC3\xA9"), 4u);
    EXPECT_EQ(utf8Length(""), 0u);
}

TEST(TimestampTest, DropsSubMicrosecondPrecision) {
    const Timestamp ts = Clock::from_time_t(0) + nanoseconds(1999);
    EXPECT_EQ(timestampToString(ts), "1970-01-01T00:00:00.000001Z");
}
