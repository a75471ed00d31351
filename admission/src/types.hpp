#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

enum class RegimeLabel {
    Bull,
    Bear,
    Range,
    Unknown
};

// Unrecognised or empty labels resolve to Unknown
RegimeLabel parse_regime(const std::string& label);
std::string regime_to_string(RegimeLabel regime);

// Directional signals supplied per candidate; absent components stay 0.0
struct RawSignalVector {
    double trend = 0.0;
    double momentum = 0.0;
    double volatility = 0.0;
    double regime = 0.0;
    double sector = 0.0;
    double reversal = 0.0;
    double breakout = 0.0;
    double mean_reversion = 0.0;

    static RawSignalVector from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Per-signal weights, same keys as RawSignalVector
struct WeightVector {
    double trend = 0.0;
    double momentum = 0.0;
    double volatility = 0.0;
    double regime = 0.0;
    double sector = 0.0;
    double reversal = 0.0;
    double breakout = 0.0;
    double mean_reversion = 0.0;

    static WeightVector from_json(const nlohmann::json& j, const WeightVector& defaults);
    nlohmann::json to_json() const;
};

struct GateBreakdown {
    double volatility_gate = 1.0;
    double regime_gate = 1.0;
    double sector_multiplier = 1.0;
    double composite = 1.0;

    nlohmann::json to_json() const;
};

struct Candidate {
    std::string symbol;
    RawSignalVector signals;
    RegimeLabel regime = RegimeLabel::Unknown;
    double sector_momentum = 0.0;
    double base_entry_score = 0.0;
    std::optional<double> estimated_ev;
    TimePoint timestamp;

    // Missing optional fields fall back to neutral values; timestamp defaults to `now`
    static Candidate from_json(const nlohmann::json& j, TimePoint now);
};

struct ScoredCandidate {
    Candidate candidate;
    WeightVector weights;
    GateBreakdown gates;
    double raw_delta = 0.0;
    double delta = 0.0;
    double final_score = 0.0;
};

struct OpenPosition {
    std::string symbol;
    double score_at_entry = 0.0;
    TimePoint opened_at;

    static std::optional<OpenPosition> from_json(const nlohmann::json& j, TimePoint now);
    nlohmann::json to_json() const;
};

enum class BlockReason {
    SymbolOnCooldown,
    PositionAlreadyOpen,
    ScoreFloorBreach,
    EvBelowFloor,
    MaxNewPositionsPerCycle,
    MaxPositionsReached,
    DisplacementMinHold,
    OrderValidationFailed
};

// Stable reason code written to the audit stream
std::string block_reason_code(BlockReason reason);

// Append-only record of one rejected candidate
struct BlockRecord {
    std::string symbol;
    BlockReason reason;
    double candidate_score;
    TimePoint timestamp;
    std::string detail;

    nlohmann::json to_json() const;
};

enum class Decision {
    Admit,
    Reject,
    Displace
};

std::string decision_to_string(Decision decision);

struct AdmissionResult {
    std::string symbol;
    Decision decision = Decision::Reject;
    std::optional<BlockReason> reason;
    std::optional<std::string> evicted_symbol;
    double final_score = 0.0;
    double delta = 0.0;
    GateBreakdown gates;

    nlohmann::json to_json() const;
};

struct CycleResult {
    std::vector<AdmissionResult> results;
    std::vector<BlockRecord> block_records;
    // New positions opened this cycle, displacements included
    int admitted = 0;
    int displaced = 0;
    std::map<std::string, int> rejections_by_reason;

    nlohmann::json summary_json() const;
};
