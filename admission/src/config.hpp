#pragma once

#include "types.hpp"
#include <string>
#include <chrono>
#include <optional>

// Expectancy floors for a learning stage; explicit settings override them
struct FloorProfile {
    std::string name;
    double score_floor;
    double ev_floor;
};

// Looser EV floor while the system is still collecting fills
const FloorProfile& bootstrap_profile();
const FloorProfile& steady_state_profile();

// Throws std::runtime_error for an unknown profile name
const FloorProfile& profile_by_name(const std::string& name);

struct Config {
    // Capacity
    int capacity = 16;
    int max_new_positions_per_cycle = 6;

    // Expectancy floors
    std::string profile = "bootstrap";
    double score_floor = 0.5;
    double ev_floor = -0.02;
    // Floors set explicitly in the file or environment; they win over any profile
    std::optional<double> score_floor_override;
    std::optional<double> ev_floor_override;

    // Displacement
    bool displacement_enabled = true;
    double displacement_margin = 0.0;
    int displacement_cooldown_minutes = 360;
    int displacement_min_hold_seconds = 0;
    // Weakest positions scoring below this are displaceable regardless of hold time
    double displacement_emergency_score = 3.0;

    // Signal weights
    WeightVector base_weights{0.040, 0.035, 0.020, 0.025, 0.025, 0.020, 0.030, 0.015};
    double regime_boost = 1.25;
    double regime_damp = 0.75;

    // Service configuration
    std::string service_name = "admission";
    std::string audit_log_path = "blocked_candidates.jsonl";
    std::string log_level = "info";

    std::chrono::minutes displacement_cooldown() const;
    std::chrono::seconds displacement_min_hold() const;

    // Replace both floors with those of the named profile, then re-apply explicit overrides
    void apply_profile(const std::string& name);

    // Load from a JSON file; a "profile" key is applied before explicit floors
    void load(const std::string& path);

    // Load from environment variables
    void load_from_env();

    // Throws std::runtime_error when a setting is out of range
    void validate() const;
};
