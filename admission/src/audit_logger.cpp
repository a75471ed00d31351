#include "audit_logger.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

AuditLogger::AuditLogger(const Config& config) : path_(config.audit_log_path) {
    open();
}

AuditLogger::~AuditLogger() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

bool AuditLogger::open() {
    out_.clear();
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        spdlog::error("Failed to open audit log {}", path_);
        return false;
    }
    spdlog::info("Audit log opened at {}", path_);
    return true;
}

bool AuditLogger::check_health() {
    if (!out_.is_open() || !out_.good()) {
        if (out_.is_open()) {
            out_.close();
        }
        return open();
    }
    return true;
}

bool AuditLogger::log_block(const BlockRecord& record) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (!check_health()) {
        spdlog::error("Cannot write block record for {}, audit log is unavailable", record.symbol);
        return false;
    }

    try {
        out_ << record.to_json().dump() << '\n';
        out_.flush();
    } catch (const std::exception& e) {
        spdlog::error("Failed to write block record for {}: {}", record.symbol, e.what());
        return false;
    }
    if (!out_.good()) {
        spdlog::error("Failed to write block record for {} to {}", record.symbol, path_);
        return false;
    }
    return true;
}

size_t AuditLogger::log_blocks(const std::vector<BlockRecord>& records) {
    size_t written = 0;
    for (const auto& record : records) {
        if (log_block(record)) {
            ++written;
        }
    }
    return written;
}
