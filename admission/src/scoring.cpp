#include "scoring.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

SignalScorer::SignalScorer(const Config& config) : weight_table_(config) {}

double SignalScorer::raw_weighted_delta(const RawSignalVector& signals, const WeightVector& weights, double gate) const {
    double weighted_sum =
        finite_or_zero(signals.trend) * weights.trend +
        finite_or_zero(signals.momentum) * weights.momentum +
        finite_or_zero(signals.volatility) * weights.volatility +
        finite_or_zero(signals.regime) * weights.regime +
        finite_or_zero(signals.sector) * weights.sector +
        finite_or_zero(signals.reversal) * weights.reversal +
        finite_or_zero(signals.breakout) * weights.breakout +
        finite_or_zero(signals.mean_reversion) * weights.mean_reversion;

    return finite_or_zero(gate * weighted_sum);
}

double SignalScorer::weighted_delta(const RawSignalVector& signals, const WeightVector& weights, double gate) const {
    double raw = raw_weighted_delta(signals, weights, gate);
    return std::max(DELTA_MIN, std::min(DELTA_MAX, raw));
}

double SignalScorer::final_score(double base_entry_score, double delta) const {
    return base_entry_score + delta;
}

ScoredCandidate SignalScorer::score(const Candidate& candidate) const {
    ScoredCandidate scored;
    scored.candidate = candidate;
    scored.weights = weight_table_.weights_for(candidate.regime);
    scored.gates = gate_stack_.evaluate(candidate);
    scored.raw_delta = raw_weighted_delta(candidate.signals, scored.weights, scored.gates.composite);
    scored.delta = std::max(DELTA_MIN, std::min(DELTA_MAX, scored.raw_delta));
    scored.final_score = final_score(candidate.base_entry_score, scored.delta);
    return scored;
}

std::vector<ScoredCandidate> SignalScorer::score_all(const std::vector<Candidate>& candidates) const {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        scored.push_back(score(candidate));
    }
    return scored;
}

void rank_candidates(std::vector<ScoredCandidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
              [](const ScoredCandidate& a, const ScoredCandidate& b) {
                  bool a_finite = std::isfinite(a.final_score);
                  bool b_finite = std::isfinite(b.final_score);
                  if (a_finite != b_finite) {
                      return a_finite;
                  }
                  if (a_finite && a.final_score != b.final_score) {
                      return a.final_score > b.final_score;
                  }
                  return a.candidate.symbol < b.candidate.symbol;
              });
}
