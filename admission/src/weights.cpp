#include "weights.hpp"
#include <algorithm>

namespace {
    void clamp_non_negative(WeightVector& w) {
        w.trend = std::max(0.0, w.trend);
        w.momentum = std::max(0.0, w.momentum);
        w.volatility = std::max(0.0, w.volatility);
        w.regime = std::max(0.0, w.regime);
        w.sector = std::max(0.0, w.sector);
        w.reversal = std::max(0.0, w.reversal);
        w.breakout = std::max(0.0, w.breakout);
        w.mean_reversion = std::max(0.0, w.mean_reversion);
    }
}

RegimeWeightTable::RegimeWeightTable(const Config& config)
    : RegimeWeightTable(config.base_weights, config.regime_boost, config.regime_damp) {}

RegimeWeightTable::RegimeWeightTable(const WeightVector& base, double boost, double damp)
    : base_(base), boost_(boost), damp_(damp) {}

WeightVector RegimeWeightTable::weights_for(RegimeLabel regime) const {
    WeightVector w = base_;

    switch (regime) {
        case RegimeLabel::Bull:
            w.trend *= boost_;
            w.momentum *= boost_;
            w.breakout *= boost_;
            w.reversal *= damp_;
            w.mean_reversion *= damp_;
            break;
        case RegimeLabel::Bear:
            w.trend *= boost_;
            w.momentum *= boost_;
            w.reversal *= boost_;
            w.mean_reversion *= damp_;
            break;
        case RegimeLabel::Range:
            w.reversal *= boost_;
            w.mean_reversion *= boost_;
            w.trend *= damp_;
            w.breakout *= damp_;
            break;
        case RegimeLabel::Unknown:
            break;
    }

    clamp_non_negative(w);
    return w;
}
