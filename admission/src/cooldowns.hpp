#pragma once

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <optional>

// symbol -> expiry. An entry blocks admission until `now` reaches its expiry.
class CooldownRegistry {
public:
    bool is_on_cooldown(const std::string& symbol, TimePoint now) const;

    std::optional<TimePoint> expiry(const std::string& symbol) const;

    // Keeps the later expiry when the symbol is already present
    void add(const std::string& symbol, TimePoint expiry);

    // Drop expired entries, returns how many were removed
    size_t prune(TimePoint now);

    size_t size() const { return entries_.size(); }
    const std::unordered_map<std::string, TimePoint>& entries() const { return entries_; }

    // Object of symbol -> ISO8601 expiry; malformed entries are skipped
    static CooldownRegistry from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

private:
    std::unordered_map<std::string, TimePoint> entries_;
};
