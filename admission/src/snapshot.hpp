#pragma once

#include "types.hpp"
#include "cooldowns.hpp"
#include "portfolio_state.hpp"
#include <string>
#include <vector>

// One cycle's input as handed over by the cycle driver
struct CycleSnapshot {
    TimePoint now;
    std::vector<Candidate> candidates;
    std::vector<OpenPosition> positions;
    CooldownRegistry cooldowns;

    // "now" defaults to `fallback_now`; positions without a symbol or finite
    // entry score are dropped with a warning
    static CycleSnapshot from_json(const nlohmann::json& j, TimePoint fallback_now);

    // Throws std::runtime_error when the file is unreadable or not a JSON object
    static CycleSnapshot load(const std::string& path, TimePoint fallback_now);
};

// Decisions plus the state to carry into the next cycle
nlohmann::json build_cycle_report(const CycleResult& result,
                                  const PortfolioState& portfolio,
                                  const CooldownRegistry& cooldowns,
                                  TimePoint now);

// Throws std::runtime_error when the file cannot be written
void write_cycle_report(const std::string& path, const nlohmann::json& report);
