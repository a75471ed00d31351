#include <gtest/gtest.h>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               (std::string("admission_config_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(path);
        unsetenv("ADMISSION_PROFILE");
        unsetenv("EV_FLOOR");
        unsetenv("ADMISSION_CAPACITY");
        unsetenv("DISPLACEMENT_ENABLED");
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path path;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.capacity, 16);
    EXPECT_EQ(config.profile, "bootstrap");
    EXPECT_EQ(config.displacement_cooldown(), std::chrono::minutes(360));
}

TEST_F(ConfigTest, ProfilesSetBothFloors) {
    Config config;
    config.apply_profile("steady_state");
    EXPECT_DOUBLE_EQ(config.ev_floor, 0.10);
    EXPECT_DOUBLE_EQ(config.score_floor, steady_state_profile().score_floor);

    config.apply_profile("bootstrap");
    EXPECT_DOUBLE_EQ(config.ev_floor, -0.02);
    EXPECT_LT(bootstrap_profile().ev_floor, steady_state_profile().ev_floor);

    EXPECT_THROW(config.apply_profile("reckless"), std::runtime_error);
}

// Explicit floors in the file win over the profile
TEST_F(ConfigTest, LoadAppliesProfileThenOverrides) {
    write(R"({
        "profile": "steady_state",
        "score_floor": 1.5,
        "capacity": 8,
        "max_new_positions_per_cycle": 2,
        "displacement_margin": 0.25,
        "base_weights": {"trend": 0.05}
    })");

    Config config;
    config.load(path.string());

    EXPECT_EQ(config.profile, "steady_state");
    EXPECT_DOUBLE_EQ(config.ev_floor, 0.10);
    EXPECT_DOUBLE_EQ(config.score_floor, 1.5);
    EXPECT_EQ(config.capacity, 8);
    EXPECT_EQ(config.max_new_positions_per_cycle, 2);
    EXPECT_DOUBLE_EQ(config.displacement_margin, 0.25);
    EXPECT_DOUBLE_EQ(config.base_weights.trend, 0.05);
    EXPECT_DOUBLE_EQ(config.base_weights.momentum, 0.035);
}

TEST_F(ConfigTest, LoadRejectsBadFiles) {
    Config config;
    EXPECT_THROW(config.load((path.string() + ".missing")), std::runtime_error);

    write("{ not json");
    EXPECT_THROW(config.load(path.string()), std::runtime_error);

    write(R"({"capacity": "sixteen"})");
    EXPECT_THROW(config.load(path.string()), std::runtime_error);

    write(R"({"profile": "reckless"})");
    EXPECT_THROW(config.load(path.string()), std::runtime_error);
}

TEST_F(ConfigTest, ValidateRejectsNonsense) {
    Config zero_capacity;
    zero_capacity.capacity = 0;
    EXPECT_THROW(zero_capacity.validate(), std::runtime_error);

    Config negative_weight;
    negative_weight.base_weights.reversal = -0.01;
    EXPECT_THROW(negative_weight.validate(), std::runtime_error);

    Config negative_margin;
    negative_margin.displacement_margin = -0.1;
    EXPECT_THROW(negative_margin.validate(), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("ADMISSION_PROFILE", "steady_state", 1);
    setenv("EV_FLOOR", "0.2", 1);
    setenv("ADMISSION_CAPACITY", "not-a-number", 1);
    setenv("DISPLACEMENT_ENABLED", "false", 1);

    Config config;
    config.load_from_env();

    EXPECT_EQ(config.profile, "steady_state");
    EXPECT_DOUBLE_EQ(config.ev_floor, 0.2);
    EXPECT_EQ(config.capacity, 16);
    EXPECT_FALSE(config.displacement_enabled);
}

// A profile chosen through the environment keeps floors the file set explicitly
TEST_F(ConfigTest, EnvironmentProfileKeepsExplicitFileFloors) {
    write(R"({"profile": "steady_state", "score_floor": 1.5, "ev_floor": 0.3})");
    setenv("ADMISSION_PROFILE", "bootstrap", 1);

    Config config;
    config.load(path.string());
    config.load_from_env();

    EXPECT_EQ(config.profile, "bootstrap");
    EXPECT_DOUBLE_EQ(config.score_floor, 1.5);
    EXPECT_DOUBLE_EQ(config.ev_floor, 0.3);
}

TEST_F(ConfigTest, EnvironmentProfileFillsFloorsNotSetExplicitly) {
    write(R"({"profile": "bootstrap", "score_floor": 1.5})");
    setenv("ADMISSION_PROFILE", "steady_state", 1);

    Config config;
    config.load(path.string());
    config.load_from_env();

    EXPECT_DOUBLE_EQ(config.score_floor, 1.5);
    EXPECT_DOUBLE_EQ(config.ev_floor, steady_state_profile().ev_floor);
}
