#pragma once

#include "types.hpp"
#include "config.hpp"
#include "portfolio_state.hpp"
#include "cooldowns.hpp"
#include <vector>

// Decides admit / reject / displace for one cycle of ranked candidates.
//
// Candidates are evaluated in the order given (see rank_candidates). Checks run
// as validation, cooldown, duplicate, expectancy floors, per-cycle budget,
// capacity, then displacement of the weakest open position. Each admission or
// displacement mutates `portfolio` and `cooldowns` before the next candidate is
// evaluated, so later candidates see earlier outcomes of the same cycle.
// Every rejection yields exactly one BlockRecord.
//
// The caller serialises access to `portfolio` and `cooldowns` for the duration
// of a cycle.
class AdmissionController {
public:
    explicit AdmissionController(const Config& config);

    CycleResult run_cycle(const std::vector<ScoredCandidate>& ranked,
                          PortfolioState& portfolio,
                          CooldownRegistry& cooldowns,
                          TimePoint now) const;

private:
    void reject(CycleResult& result, AdmissionResult& decision, BlockReason reason,
                const std::string& detail, TimePoint now) const;

    const Config& config_;
};
