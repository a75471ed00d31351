#pragma once

#include "config.hpp"
#include "types.hpp"
#include <fstream>
#include <mutex>
#include <vector>

// Append-only JSON-lines sink for BlockRecords. Existing lines are never rewritten.
class AuditLogger {
public:
    explicit AuditLogger(const Config& config);
    ~AuditLogger();

    // Returns false when the record could not be written
    bool log_block(const BlockRecord& record);

    // Returns the number of records written
    size_t log_blocks(const std::vector<BlockRecord>& records);

    bool check_health();

private:
    bool open();

    std::string path_;
    std::ofstream out_;
    std::mutex out_mutex_;
};
