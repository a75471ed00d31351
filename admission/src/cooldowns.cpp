#include "cooldowns.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

bool CooldownRegistry::is_on_cooldown(const std::string& symbol, TimePoint now) const {
    auto it = entries_.find(symbol);
    return it != entries_.end() && now < it->second;
}

std::optional<TimePoint> CooldownRegistry::expiry(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CooldownRegistry::add(const std::string& symbol, TimePoint expiry) {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        entries_.emplace(symbol, expiry);
    } else if (expiry > it->second) {
        it->second = expiry;
    }
}

size_t CooldownRegistry::prune(TimePoint now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Pruned {} expired cooldown entries", removed);
    }
    return removed;
}

CooldownRegistry CooldownRegistry::from_json(const nlohmann::json& j) {
    CooldownRegistry registry;
    if (!j.is_object()) {
        return registry;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            spdlog::warn("Skipping cooldown for {}: expiry is not a timestamp", it.key());
            continue;
        }
        try {
            registry.add(it.key(), parse_iso8601(it.value().get<std::string>()));
        } catch (const std::runtime_error& e) {
            spdlog::warn("Skipping cooldown for {}: {}", it.key(), e.what());
        }
    }
    return registry;
}

nlohmann::json CooldownRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [symbol, expiry] : entries_) {
        j[symbol] = format_iso8601(expiry);
    }
    return j;
}
