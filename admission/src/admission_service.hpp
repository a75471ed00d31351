#pragma once

#include "config.hpp"
#include "scoring.hpp"
#include "admission_controller.hpp"
#include "audit_logger.hpp"
#include "portfolio_state.hpp"
#include "cooldowns.hpp"
#include <memory>
#include <mutex>
#include <vector>

class AdmissionService {
public:
    explicit AdmissionService(const Config& config);

    // Score, rank and admit one cycle's candidates. Cycles are serialised;
    // block records go to the audit log once the cycle has completed.
    CycleResult run_cycle(const std::vector<Candidate>& candidates,
                          PortfolioState& portfolio,
                          CooldownRegistry& cooldowns,
                          TimePoint now);

    const Config& config() const { return config_; }

private:
    Config config_;

    std::unique_ptr<SignalScorer> scorer_;
    std::unique_ptr<AdmissionController> controller_;
    std::unique_ptr<AuditLogger> audit_logger_;

    std::mutex cycle_mutex_;
    unsigned long cycle_count_{0};
};
