#include "types.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace {
    // Signal keys arrive both bare ("trend") and suffixed ("trend_signal")
    double signal_value(const nlohmann::json& j, const char* key) {
        if (auto v = json_finite_number(j, key)) {
            return *v;
        }
        std::string suffixed = std::string(key) + "_signal";
        if (auto v = json_finite_number(j, suffixed.c_str())) {
            return *v;
        }
        return 0.0;
    }
}

RegimeLabel parse_regime(const std::string& label) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "BULL") {
        return RegimeLabel::Bull;
    } else if (upper == "BEAR") {
        return RegimeLabel::Bear;
    } else if (upper == "RANGE") {
        return RegimeLabel::Range;
    }
    return RegimeLabel::Unknown;
}

std::string regime_to_string(RegimeLabel regime) {
    switch (regime) {
        case RegimeLabel::Bull: return "BULL";
        case RegimeLabel::Bear: return "BEAR";
        case RegimeLabel::Range: return "RANGE";
        case RegimeLabel::Unknown: break;
    }
    return "UNKNOWN";
}

RawSignalVector RawSignalVector::from_json(const nlohmann::json& j) {
    RawSignalVector signals;
    if (!j.is_object()) {
        return signals;
    }
    signals.trend = signal_value(j, "trend");
    signals.momentum = signal_value(j, "momentum");
    signals.volatility = signal_value(j, "volatility");
    signals.regime = signal_value(j, "regime");
    signals.sector = signal_value(j, "sector");
    signals.reversal = signal_value(j, "reversal");
    signals.breakout = signal_value(j, "breakout");
    signals.mean_reversion = signal_value(j, "mean_reversion");
    return signals;
}

nlohmann::json RawSignalVector::to_json() const {
    return {
        {"trend", trend},
        {"momentum", momentum},
        {"volatility", volatility},
        {"regime", regime},
        {"sector", sector},
        {"reversal", reversal},
        {"breakout", breakout},
        {"mean_reversion", mean_reversion}
    };
}

WeightVector WeightVector::from_json(const nlohmann::json& j, const WeightVector& defaults) {
    WeightVector w = defaults;
    if (!j.is_object()) {
        return w;
    }
    w.trend = json_finite_number(j, "trend").value_or(w.trend);
    w.momentum = json_finite_number(j, "momentum").value_or(w.momentum);
    w.volatility = json_finite_number(j, "volatility").value_or(w.volatility);
    w.regime = json_finite_number(j, "regime").value_or(w.regime);
    w.sector = json_finite_number(j, "sector").value_or(w.sector);
    w.reversal = json_finite_number(j, "reversal").value_or(w.reversal);
    w.breakout = json_finite_number(j, "breakout").value_or(w.breakout);
    w.mean_reversion = json_finite_number(j, "mean_reversion").value_or(w.mean_reversion);
    return w;
}

nlohmann::json WeightVector::to_json() const {
    return {
        {"trend", trend},
        {"momentum", momentum},
        {"volatility", volatility},
        {"regime", regime},
        {"sector", sector},
        {"reversal", reversal},
        {"breakout", breakout},
        {"mean_reversion", mean_reversion}
    };
}

nlohmann::json GateBreakdown::to_json() const {
    return {
        {"volatility_gate", volatility_gate},
        {"regime_gate", regime_gate},
        {"sector_multiplier", sector_multiplier},
        {"composite", composite}
    };
}

Candidate Candidate::from_json(const nlohmann::json& j, TimePoint now) {
    Candidate c;
    c.timestamp = now;
    if (!j.is_object()) {
        c.base_entry_score = std::numeric_limits<double>::quiet_NaN();
        return c;
    }

    auto sym = j.find("symbol");
    if (sym != j.end() && sym->is_string()) {
        c.symbol = sym->get<std::string>();
    }

    auto sig = j.find("signals");
    if (sig != j.end()) {
        c.signals = RawSignalVector::from_json(*sig);
    }

    auto reg = j.find("regime");
    if (reg == j.end() || !reg->is_string()) {
        reg = j.find("regime_label");
    }
    if (reg != j.end() && reg->is_string()) {
        c.regime = parse_regime(reg->get<std::string>());
        if (c.regime == RegimeLabel::Unknown) {
            spdlog::debug("Unrecognised regime '{}' for {}, using UNKNOWN", reg->get<std::string>(), c.symbol);
        }
    }

    c.sector_momentum = json_finite_number(j, "sector_momentum").value_or(0.0);

    // Required: a missing or non-finite base score is caught by validation
    c.base_entry_score = json_finite_number(j, "base_entry_score")
        .value_or(std::numeric_limits<double>::quiet_NaN());

    if (std::isnan(c.base_entry_score)) {
        spdlog::debug("Candidate {} has no finite base_entry_score", c.symbol);
    }

    c.estimated_ev = json_finite_number(j, "estimated_ev");
    c.timestamp = json_time_or(j, "timestamp", now);
    return c;
}

std::optional<OpenPosition> OpenPosition::from_json(const nlohmann::json& j, TimePoint now) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto sym = j.find("symbol");
    if (sym == j.end() || !sym->is_string() || sym->get<std::string>().empty()) {
        return std::nullopt;
    }
    auto score = json_finite_number(j, "score_at_entry");
    if (!score) {
        score = json_finite_number(j, "entry_score");
    }
    if (!score) {
        return std::nullopt;
    }

    OpenPosition p;
    p.symbol = sym->get<std::string>();
    p.score_at_entry = *score;
    p.opened_at = json_time_or(j, "opened_at", now);
    return p;
}

nlohmann::json OpenPosition::to_json() const {
    return {
        {"symbol", symbol},
        {"score_at_entry", score_at_entry},
        {"opened_at", format_iso8601(opened_at)}
    };
}

std::string block_reason_code(BlockReason reason) {
    switch (reason) {
        case BlockReason::SymbolOnCooldown: return "symbol_on_cooldown";
        case BlockReason::PositionAlreadyOpen: return "position_already_open";
        case BlockReason::ScoreFloorBreach: return "expectancy_blocked:score_floor_breach";
        case BlockReason::EvBelowFloor: return "expectancy_blocked:ev_below_floor";
        case BlockReason::MaxNewPositionsPerCycle: return "max_new_positions_per_cycle";
        case BlockReason::MaxPositionsReached: return "max_positions_reached";
        case BlockReason::DisplacementMinHold: return "displacement_min_hold";
        case BlockReason::OrderValidationFailed: return "order_validation_failed";
    }
    return "order_validation_failed";
}

nlohmann::json BlockRecord::to_json() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"reason", block_reason_code(reason)},
        {"ts", format_iso8601(timestamp)},
        {"detail", detail}
    };
    // A non-finite score cannot be represented in JSON
    if (std::isfinite(candidate_score)) {
        j["candidate_score"] = candidate_score;
    } else {
        j["candidate_score"] = nullptr;
    }
    return j;
}

std::string decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::Admit: return "admit";
        case Decision::Displace: return "displace";
        case Decision::Reject: break;
    }
    return "reject";
}

nlohmann::json AdmissionResult::to_json() const {
    nlohmann::json j = {
        {"symbol", symbol},
        {"decision", decision_to_string(decision)},
        {"delta", delta},
        {"gates", gates.to_json()}
    };
    j["final_score"] = std::isfinite(final_score) ? nlohmann::json(final_score) : nlohmann::json(nullptr);
    j["reason"] = reason ? nlohmann::json(block_reason_code(*reason)) : nlohmann::json(nullptr);
    j["evicted_symbol"] = evicted_symbol ? nlohmann::json(*evicted_symbol) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json CycleResult::summary_json() const {
    return {
        {"candidates", results.size()},
        {"admitted", admitted},
        {"displaced", displaced},
        {"rejected", block_records.size()},
        {"rejections_by_reason", rejections_by_reason}
    };
}
