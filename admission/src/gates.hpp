#pragma once

#include "types.hpp"

// Floor for the composite gate: signals are damped, never silenced
constexpr double GATE_MIN = 0.1;
constexpr double GATE_MAX = 1.0;

// Volatility below zero reads as chop, above this as excessive
constexpr double VOLATILITY_CHOP_THRESHOLD = 0.0;
constexpr double VOLATILITY_EXCESS_THRESHOLD = 0.7;

constexpr double VOLATILITY_CHOP_GATE = 0.25;
constexpr double VOLATILITY_EXCESS_GATE = 0.5;
constexpr double REGIME_CONTRADICTION_GATE = 0.5;
constexpr double SECTOR_ALIGNED_MULTIPLIER = 1.2;
constexpr double SECTOR_OPPOSED_MULTIPLIER = 0.5;

class GateStack {
public:
    double volatility_gate(const RawSignalVector& signals) const;

    // Damps only when trend and momentum both contradict a BULL or BEAR label
    double regime_gate(const RawSignalVector& signals, RegimeLabel regime) const;

    // 1.0 when either input is zero or unusable
    double sector_multiplier(const RawSignalVector& signals, double sector_momentum) const;

    // min(GATE_MAX, max(GATE_MIN, vol * regime * sector))
    double composite(double vol_gate, double regime_gate, double sector_mult) const;

    GateBreakdown evaluate(const Candidate& candidate) const;
};
