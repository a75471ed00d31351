#include "gates.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

double GateStack::volatility_gate(const RawSignalVector& signals) const {
    double vol = finite_or_zero(signals.volatility);
    if (vol < VOLATILITY_CHOP_THRESHOLD) {
        return VOLATILITY_CHOP_GATE;
    }
    if (vol > VOLATILITY_EXCESS_THRESHOLD) {
        return VOLATILITY_EXCESS_GATE;
    }
    return 1.0;
}

double GateStack::regime_gate(const RawSignalVector& signals, RegimeLabel regime) const {
    double trend = finite_or_zero(signals.trend);
    double momentum = finite_or_zero(signals.momentum);

    if (regime == RegimeLabel::Bull && trend < 0.0 && momentum < 0.0) {
        return REGIME_CONTRADICTION_GATE;
    }
    if (regime == RegimeLabel::Bear && trend > 0.0 && momentum > 0.0) {
        return REGIME_CONTRADICTION_GATE;
    }
    return 1.0;
}

double GateStack::sector_multiplier(const RawSignalVector& signals, double sector_momentum) const {
    double trend = finite_or_zero(signals.trend);
    double sector = finite_or_zero(sector_momentum);

    if (trend == 0.0 || sector == 0.0) {
        return 1.0;
    }
    return (trend > 0.0) == (sector > 0.0) ? SECTOR_ALIGNED_MULTIPLIER : SECTOR_OPPOSED_MULTIPLIER;
}

double GateStack::composite(double vol_gate, double regime_gate, double sector_mult) const {
    double product = vol_gate * regime_gate * sector_mult;
    return std::min(GATE_MAX, std::max(GATE_MIN, product));
}

GateBreakdown GateStack::evaluate(const Candidate& candidate) const {
    GateBreakdown g;
    g.volatility_gate = volatility_gate(candidate.signals);
    g.regime_gate = regime_gate(candidate.signals, candidate.regime);
    g.sector_multiplier = sector_multiplier(candidate.signals, candidate.sector_momentum);
    g.composite = composite(g.volatility_gate, g.regime_gate, g.sector_multiplier);

    spdlog::debug("Gates for {}: vol={:.2f} regime={:.2f} sector={:.2f} composite={:.3f}",
                  candidate.symbol, g.volatility_gate, g.regime_gate, g.sector_multiplier, g.composite);
    return g;
}
