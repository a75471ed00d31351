#include <gtest/gtest.h>
#include "util.hpp"
#include <stdexcept>

TEST(UtilTest, ParsesUtcWithFraction) {
    auto tp = parse_iso8601("2026-01-05T14:30:00.5Z");
    EXPECT_EQ(format_iso8601(tp), "2026-01-05T14:30:00.500Z");
    EXPECT_EQ(parse_iso8601("2026-01-05T14:30:00"), parse_iso8601("2026-01-05T14:30:00.000Z"));
}

TEST(UtilTest, AppliesZoneOffsets) {
    auto utc = parse_iso8601("2026-01-05T14:00:00.000Z");
    EXPECT_EQ(parse_iso8601("2026-01-05T16:00:00+02:00"), utc);
    EXPECT_EQ(parse_iso8601("2026-01-05T16:00:00.000+0200"), utc);
    EXPECT_EQ(parse_iso8601("2026-01-05T09:00:00-05"), utc);
    EXPECT_EQ(parse_iso8601("2026-01-05T08:30:00-05:30"), utc);
    EXPECT_EQ(parse_iso8601("2026-01-05T14:00:00+00:00"), utc);
}

TEST(UtilTest, RejectsMalformedTimestamps) {
    EXPECT_THROW(parse_iso8601("yesterday"), std::runtime_error);
    EXPECT_THROW(parse_iso8601("2026-01-05T14:00:00 EST"), std::runtime_error);
    EXPECT_THROW(parse_iso8601("2026-01-05T14:00:00+2"), std::runtime_error);
    EXPECT_THROW(parse_iso8601("2026-01-05T14:00:00+25:00"), std::runtime_error);
    EXPECT_THROW(parse_iso8601("2026-01-05T14:00:00+02:00Z"), std::runtime_error);
}

TEST(UtilTest, TimeFieldFallsBackOnBadZone) {
    auto fallback = parse_iso8601("2026-01-01T00:00:00.000Z");
    auto j = nlohmann::json::parse(R"({"ts": "2026-01-05T14:00:00+xx:00"})");
    EXPECT_EQ(json_time_or(j, "ts", fallback), fallback);
}
