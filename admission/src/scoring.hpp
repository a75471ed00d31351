#pragma once

#include "types.hpp"
#include "config.hpp"
#include "weights.hpp"
#include "gates.hpp"
#include <vector>

// Bounds on the signal adjustment applied to a base entry score
constexpr double DELTA_MIN = -0.25;
constexpr double DELTA_MAX = 0.25;

class SignalScorer {
public:
    explicit SignalScorer(const Config& config);

    // gate * sum(signals[k] * weights[k]) before clamping; non-finite signals count as 0.0
    double raw_weighted_delta(const RawSignalVector& signals, const WeightVector& weights, double gate) const;

    // raw_weighted_delta clamped to [DELTA_MIN, DELTA_MAX]
    double weighted_delta(const RawSignalVector& signals, const WeightVector& weights, double gate) const;

    // Plain addition, kept separate from base-score computation
    double final_score(double base_entry_score, double delta) const;

    // Full pipeline for one candidate: weights, gates, delta, final score
    ScoredCandidate score(const Candidate& candidate) const;

    std::vector<ScoredCandidate> score_all(const std::vector<Candidate>& candidates) const;

    const RegimeWeightTable& weight_table() const { return weight_table_; }
    const GateStack& gate_stack() const { return gate_stack_; }

private:
    RegimeWeightTable weight_table_;
    GateStack gate_stack_;
};

// Sort by final score descending, symbol ascending on ties.
// Candidates with a non-finite final score go last, ordered by symbol.
void rank_candidates(std::vector<ScoredCandidate>& candidates);
