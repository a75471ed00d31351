#include "admission_controller.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    bool is_blank(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    }
}

AdmissionController::AdmissionController(const Config& config) : config_(config) {}

void AdmissionController::reject(CycleResult& result, AdmissionResult& decision, BlockReason reason,
                                 const std::string& detail, TimePoint now) const {
    decision.decision = Decision::Reject;
    decision.reason = reason;

    BlockRecord record{decision.symbol, reason, decision.final_score, now, detail};
    result.block_records.push_back(record);
    result.rejections_by_reason[block_reason_code(reason)]++;

    spdlog::info("Blocked {} ({}): {}", decision.symbol.empty() ? "<missing>" : decision.symbol,
                 block_reason_code(reason), detail);
}

CycleResult AdmissionController::run_cycle(const std::vector<ScoredCandidate>& ranked,
                                           PortfolioState& portfolio,
                                           CooldownRegistry& cooldowns,
                                           TimePoint now) const {
    CycleResult result;
    result.results.reserve(ranked.size());

    cooldowns.prune(now);

    for (const auto& scored : ranked) {
        const Candidate& c = scored.candidate;

        AdmissionResult decision;
        decision.symbol = c.symbol;
        decision.final_score = scored.final_score;
        decision.delta = scored.delta;
        decision.gates = scored.gates;

        // Structural validation
        if (c.symbol.empty() || is_blank(c.symbol)) {
            reject(result, decision, BlockReason::OrderValidationFailed, "missing symbol", now);
            result.results.push_back(decision);
            continue;
        }
        if (!std::isfinite(c.base_entry_score) || !std::isfinite(scored.final_score)) {
            reject(result, decision, BlockReason::OrderValidationFailed, "non-finite score", now);
            result.results.push_back(decision);
            continue;
        }

        // Cooldown
        if (cooldowns.is_on_cooldown(c.symbol, now)) {
            reject(result, decision, BlockReason::SymbolOnCooldown,
                   fmt::format("cooldown until {}", format_iso8601(*cooldowns.expiry(c.symbol))), now);
            result.results.push_back(decision);
            continue;
        }

        if (portfolio.contains(c.symbol)) {
            reject(result, decision, BlockReason::PositionAlreadyOpen, "position already open", now);
            result.results.push_back(decision);
            continue;
        }

        // Expectancy floors
        if (scored.final_score < config_.score_floor) {
            reject(result, decision, BlockReason::ScoreFloorBreach,
                   fmt::format("score {:.4f} < floor {:.4f}", scored.final_score, config_.score_floor), now);
            result.results.push_back(decision);
            continue;
        }
        if (c.estimated_ev && std::isfinite(*c.estimated_ev) && *c.estimated_ev < config_.ev_floor) {
            reject(result, decision, BlockReason::EvBelowFloor,
                   fmt::format("ev {:.4f} < floor {:.4f} ({})", *c.estimated_ev, config_.ev_floor, config_.profile),
                   now);
            result.results.push_back(decision);
            continue;
        }

        // Per-cycle budget
        if (result.admitted >= config_.max_new_positions_per_cycle) {
            reject(result, decision, BlockReason::MaxNewPositionsPerCycle,
                   fmt::format("{} admitted this cycle", result.admitted), now);
            result.results.push_back(decision);
            continue;
        }

        OpenPosition position{c.symbol, scored.final_score, now};

        // Capacity
        if (!portfolio.is_full()) {
            portfolio.open(position);
            decision.decision = Decision::Admit;
            result.admitted++;
            spdlog::info("Admitted {} with score {:.4f} ({}/{} open)",
                         c.symbol, scored.final_score, portfolio.size(), portfolio.capacity());
            result.results.push_back(decision);
            continue;
        }

        // Displacement
        auto weakest = portfolio.weakest();
        if (!config_.displacement_enabled || !weakest) {
            reject(result, decision, BlockReason::MaxPositionsReached,
                   fmt::format("{}/{} open, displacement unavailable", portfolio.size(), portfolio.capacity()), now);
            result.results.push_back(decision);
            continue;
        }

        double advantage = scored.final_score - weakest->score_at_entry;
        if (!(advantage > config_.displacement_margin)) {
            reject(result, decision, BlockReason::MaxPositionsReached,
                   fmt::format("score {:.4f} does not beat weakest {} {:.4f} by more than {:.4f}",
                               scored.final_score, weakest->symbol, weakest->score_at_entry,
                               config_.displacement_margin),
                   now);
            result.results.push_back(decision);
            continue;
        }

        auto held = now - weakest->opened_at;
        bool emergency = weakest->score_at_entry < config_.displacement_emergency_score;
        if (config_.displacement_min_hold_seconds > 0 && !emergency && held < config_.displacement_min_hold()) {
            reject(result, decision, BlockReason::DisplacementMinHold,
                   fmt::format("weakest {} held {}s of required {}s", weakest->symbol,
                               std::chrono::duration_cast<std::chrono::seconds>(held).count(),
                               config_.displacement_min_hold_seconds),
                   now);
            result.results.push_back(decision);
            continue;
        }

        portfolio.close(weakest->symbol);
        cooldowns.add(weakest->symbol, now + config_.displacement_cooldown());
        portfolio.open(position);

        decision.decision = Decision::Displace;
        decision.evicted_symbol = weakest->symbol;
        result.admitted++;
        result.displaced++;
        spdlog::info("Displaced {} ({:.4f}) with {} ({:.4f}); {} on cooldown for {} min",
                     weakest->symbol, weakest->score_at_entry, c.symbol, scored.final_score,
                     weakest->symbol, config_.displacement_cooldown_minutes);
        result.results.push_back(decision);
    }

    return result;
}
