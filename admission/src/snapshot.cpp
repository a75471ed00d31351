#include "snapshot.hpp"
#include "util.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

CycleSnapshot CycleSnapshot::from_json(const nlohmann::json& j, TimePoint fallback_now) {
    CycleSnapshot snapshot;
    snapshot.now = json_time_or(j, "now", fallback_now);

    auto candidates = j.find("candidates");
    if (candidates != j.end() && candidates->is_array()) {
        for (const auto& item : *candidates) {
            snapshot.candidates.push_back(Candidate::from_json(item, snapshot.now));
        }
    }

    auto positions = j.find("positions");
    if (positions != j.end() && positions->is_array()) {
        for (const auto& item : *positions) {
            auto position = OpenPosition::from_json(item, snapshot.now);
            if (position) {
                snapshot.positions.push_back(*position);
            } else {
                spdlog::warn("Dropping malformed open position: {}", item.dump());
            }
        }
    }

    auto cooldowns = j.find("cooldowns");
    if (cooldowns != j.end()) {
        snapshot.cooldowns = CooldownRegistry::from_json(*cooldowns);
    }

    return snapshot;
}

CycleSnapshot CycleSnapshot::load(const std::string& path, TimePoint fallback_now) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open snapshot file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Failed to parse snapshot {}: {}", path, e.what()));
    }
    if (!j.is_object()) {
        throw std::runtime_error("Snapshot must hold a JSON object: " + path);
    }
    return from_json(j, fallback_now);
}

nlohmann::json build_cycle_report(const CycleResult& result,
                                  const PortfolioState& portfolio,
                                  const CooldownRegistry& cooldowns,
                                  TimePoint now) {
    nlohmann::json decisions = nlohmann::json::array();
    for (const auto& r : result.results) {
        decisions.push_back(r.to_json());
    }

    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& b : result.block_records) {
        blocks.push_back(b.to_json());
    }

    return {
        {"now", format_iso8601(now)},
        {"summary", result.summary_json()},
        {"decisions", decisions},
        {"block_records", blocks},
        {"positions", portfolio.to_json()},
        {"cooldowns", cooldowns.to_json()}
    };
}

void write_cycle_report(const std::string& path, const nlohmann::json& report) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open report file for writing: " + path);
    }
    out << report.dump(2) << '\n';
    if (!out.good()) {
        throw std::runtime_error("Failed to write report file: " + path);
    }
}
