#include <gtest/gtest.h>
#include "cooldowns.hpp"
#include "util.hpp"

using namespace std::chrono_literals;

class CooldownRegistryTest : public ::testing::Test {
protected:
    TimePoint now = parse_iso8601("2026-01-05T14:30:00.000Z");
    CooldownRegistry registry;
};

TEST_F(CooldownRegistryTest, BlocksUntilExpiry) {
    registry.add("AAPL", now + 30min);

    EXPECT_TRUE(registry.is_on_cooldown("AAPL", now));
    EXPECT_TRUE(registry.is_on_cooldown("AAPL", now + 29min));
    EXPECT_FALSE(registry.is_on_cooldown("AAPL", now + 30min));
    EXPECT_FALSE(registry.is_on_cooldown("MSFT", now));
}

TEST_F(CooldownRegistryTest, KeepsLaterExpiry) {
    registry.add("AAPL", now + 2h);
    registry.add("AAPL", now + 1h);
    EXPECT_EQ(*registry.expiry("AAPL"), now + 2h);

    registry.add("AAPL", now + 3h);
    EXPECT_EQ(*registry.expiry("AAPL"), now + 3h);
}

TEST_F(CooldownRegistryTest, PruneRemovesOnlyExpired) {
    registry.add("OLD", now - 1min);
    registry.add("EDGE", now);
    registry.add("LIVE", now + 1min);

    EXPECT_EQ(registry.prune(now), 2u);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.expiry("LIVE").has_value());
    EXPECT_FALSE(registry.expiry("OLD").has_value());
}

// Expired entries never block, pruned or not
TEST_F(CooldownRegistryTest, ExpiredUnprunedEntryDoesNotBlock) {
    registry.add("AAPL", now - 5min);
    EXPECT_FALSE(registry.is_on_cooldown("AAPL", now));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(CooldownRegistryTest, JsonSkipsMalformedEntries) {
    auto j = nlohmann::json::parse(R"({
        "AAPL": "2026-01-05T16:00:00.000Z",
        "MSFT": "not-a-time",
        "TSLA": 42
    })");
    CooldownRegistry parsed = CooldownRegistry::from_json(j);

    EXPECT_EQ(parsed.size(), 1u);
    EXPECT_TRUE(parsed.is_on_cooldown("AAPL", now));
    EXPECT_EQ(parsed.to_json()["AAPL"], "2026-01-05T16:00:00.000Z");
}
