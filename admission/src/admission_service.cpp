#include "admission_service.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

AdmissionService::AdmissionService(const Config& config)
    : config_(config) {

    // Initialize components
    scorer_ = std::make_unique<SignalScorer>(config_);
    controller_ = std::make_unique<AdmissionController>(config_);
    audit_logger_ = std::make_unique<AuditLogger>(config_);
}

CycleResult AdmissionService::run_cycle(const std::vector<Candidate>& candidates,
                                        PortfolioState& portfolio,
                                        CooldownRegistry& cooldowns,
                                        TimePoint now) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    ++cycle_count_;

    spdlog::info("Cycle {} started: {} candidates, {}/{} positions open, {} cooldowns",
                 cycle_count_, candidates.size(), portfolio.size(), portfolio.capacity(), cooldowns.size());

    std::vector<ScoredCandidate> ranked = scorer_->score_all(candidates);
    rank_candidates(ranked);

    CycleResult result = controller_->run_cycle(ranked, portfolio, cooldowns, now);

    size_t written = audit_logger_->log_blocks(result.block_records);
    if (written != result.block_records.size()) {
        spdlog::error("Audit log accepted {} of {} block records", written, result.block_records.size());
    }

    std::vector<std::string> tally;
    for (const auto& [reason, count] : result.rejections_by_reason) {
        tally.push_back(fmt::format("{}={}", reason, count));
    }
    spdlog::info("Cycle {} finished: admitted={} displaced={} rejected={} [{}]",
                 cycle_count_, result.admitted, result.displaced, result.block_records.size(),
                 fmt::join(tally, ", "));

    return result;
}
