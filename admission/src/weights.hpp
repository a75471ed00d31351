#pragma once

#include "types.hpp"
#include "config.hpp"

// Maps a market regime to per-signal weights. Stateless once constructed.
class RegimeWeightTable {
public:
    explicit RegimeWeightTable(const Config& config);
    RegimeWeightTable(const WeightVector& base, double boost, double damp);

    // BULL boosts trend/momentum/breakout and damps reversal/mean_reversion,
    // BEAR boosts trend/momentum/reversal and damps mean_reversion,
    // RANGE boosts reversal/mean_reversion and damps trend/breakout,
    // UNKNOWN returns the base vector.
    WeightVector weights_for(RegimeLabel regime) const;

    const WeightVector& base() const { return base_; }

private:
    WeightVector base_;
    double boost_;
    double damp_;
};
