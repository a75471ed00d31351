#include "config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    bool get_env_bool(const char* name, bool default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        std::string v = value;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "1" || v == "true" || v == "yes") {
            return true;
        }
        if (v == "0" || v == "false" || v == "no") {
            return false;
        }
        spdlog::warn("Invalid boolean value for {}: {}", name, value);
        return default_value;
    }

    template <typename T>
    void read_key(const nlohmann::json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it == j.end()) {
            return;
        }
        try {
            target = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(fmt::format("Invalid value for config key '{}': {}", key, e.what()));
        }
    }
}

const FloorProfile& bootstrap_profile() {
    static const FloorProfile profile{"bootstrap", 0.5, -0.02};
    return profile;
}

const FloorProfile& steady_state_profile() {
    static const FloorProfile profile{"steady_state", 0.5, 0.10};
    return profile;
}

const FloorProfile& profile_by_name(const std::string& name) {
    if (name == bootstrap_profile().name) {
        return bootstrap_profile();
    }
    if (name == steady_state_profile().name) {
        return steady_state_profile();
    }
    throw std::runtime_error("Unknown admission profile: " + name);
}

std::chrono::minutes Config::displacement_cooldown() const {
    return std::chrono::minutes(displacement_cooldown_minutes);
}

std::chrono::seconds Config::displacement_min_hold() const {
    return std::chrono::seconds(displacement_min_hold_seconds);
}

void Config::apply_profile(const std::string& name) {
    const FloorProfile& p = profile_by_name(name);
    profile = p.name;
    score_floor = score_floor_override.value_or(p.score_floor);
    ev_floor = ev_floor_override.value_or(p.ev_floor);
}

void Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Failed to parse config file {}: {}", path, e.what()));
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file must hold a JSON object: " + path);
    }

    auto prof = j.find("profile");
    if (prof != j.end()) {
        if (!prof->is_string()) {
            throw std::runtime_error("Config key 'profile' must be a string");
        }
        apply_profile(prof->get<std::string>());
    }

    read_key(j, "capacity", capacity);
    read_key(j, "max_new_positions_per_cycle", max_new_positions_per_cycle);
    if (j.contains("score_floor")) {
        read_key(j, "score_floor", score_floor);
        score_floor_override = score_floor;
    }
    if (j.contains("ev_floor")) {
        read_key(j, "ev_floor", ev_floor);
        ev_floor_override = ev_floor;
    }

    read_key(j, "displacement_enabled", displacement_enabled);
    read_key(j, "displacement_margin", displacement_margin);
    read_key(j, "displacement_cooldown_minutes", displacement_cooldown_minutes);
    read_key(j, "displacement_min_hold_seconds", displacement_min_hold_seconds);
    read_key(j, "displacement_emergency_score", displacement_emergency_score);

    auto weights = j.find("base_weights");
    if (weights != j.end()) {
        base_weights = WeightVector::from_json(*weights, base_weights);
    }
    read_key(j, "regime_boost", regime_boost);
    read_key(j, "regime_damp", regime_damp);

    read_key(j, "service_name", service_name);
    read_key(j, "audit_log_path", audit_log_path);
    read_key(j, "log_level", log_level);
}

void Config::load_from_env() {
    const char* prof = std::getenv("ADMISSION_PROFILE");
    if (prof) {
        apply_profile(prof);
    }

    // Capacity
    capacity = get_env_int("ADMISSION_CAPACITY", capacity);
    max_new_positions_per_cycle = get_env_int("MAX_NEW_POSITIONS_PER_CYCLE", max_new_positions_per_cycle);

    // Floors
    if (std::getenv("SCORE_FLOOR")) {
        score_floor = get_env_double("SCORE_FLOOR", score_floor);
        score_floor_override = score_floor;
    }
    if (std::getenv("EV_FLOOR")) {
        ev_floor = get_env_double("EV_FLOOR", ev_floor);
        ev_floor_override = ev_floor;
    }

    // Displacement
    displacement_enabled = get_env_bool("DISPLACEMENT_ENABLED", displacement_enabled);
    displacement_margin = get_env_double("DISPLACEMENT_MARGIN", displacement_margin);
    displacement_cooldown_minutes = get_env_int("DISPLACEMENT_COOLDOWN_MINUTES", displacement_cooldown_minutes);
    displacement_min_hold_seconds = get_env_int("DISPLACEMENT_MIN_HOLD_SECONDS", displacement_min_hold_seconds);

    // Service configuration
    service_name = get_env("SERVICE_NAME", service_name);
    audit_log_path = get_env("AUDIT_LOG_PATH", audit_log_path);
    log_level = get_env("LOG_LEVEL", log_level);
}

void Config::validate() const {
    if (capacity <= 0) {
        throw std::runtime_error("capacity must be positive");
    }
    if (max_new_positions_per_cycle < 0) {
        throw std::runtime_error("max_new_positions_per_cycle cannot be negative");
    }
    if (!std::isfinite(score_floor) || !std::isfinite(ev_floor)) {
        throw std::runtime_error("score_floor and ev_floor must be finite");
    }
    if (!std::isfinite(displacement_margin) || displacement_margin < 0.0) {
        throw std::runtime_error("displacement_margin must be a non-negative number");
    }
    if (displacement_cooldown_minutes < 0 || displacement_min_hold_seconds < 0) {
        throw std::runtime_error("displacement durations cannot be negative");
    }

    const double weights[] = {
        base_weights.trend, base_weights.momentum, base_weights.volatility, base_weights.regime,
        base_weights.sector, base_weights.reversal, base_weights.breakout, base_weights.mean_reversion
    };
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::runtime_error(fmt::format("base weights must be non-negative, got {}", w));
        }
    }
    if (!std::isfinite(regime_boost) || regime_boost < 0.0 ||
        !std::isfinite(regime_damp) || regime_damp < 0.0) {
        throw std::runtime_error("regime multipliers must be non-negative");
    }
    if (audit_log_path.empty()) {
        throw std::runtime_error("audit_log_path cannot be empty");
    }

    spdlog::debug("Configuration validated: profile={} capacity={} max_new={} score_floor={} ev_floor={}",
                  profile, capacity, max_new_positions_per_cycle, score_floor, ev_floor);
}
