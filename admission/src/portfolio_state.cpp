#include "portfolio_state.hpp"
#include <algorithm>

PortfolioState::PortfolioState(int capacity) : capacity_(capacity) {}

PortfolioState::PortfolioState(int capacity, std::vector<OpenPosition> positions)
    : capacity_(capacity), positions_(std::move(positions)) {}

bool PortfolioState::is_full() const {
    return positions_.size() >= static_cast<size_t>(std::max(0, capacity_));
}

bool PortfolioState::contains(const std::string& symbol) const {
    return std::any_of(positions_.begin(), positions_.end(),
                       [&symbol](const OpenPosition& p) { return p.symbol == symbol; });
}

std::optional<OpenPosition> PortfolioState::weakest() const {
    if (positions_.empty()) {
        return std::nullopt;
    }
    auto it = std::min_element(positions_.begin(), positions_.end(),
                               [](const OpenPosition& a, const OpenPosition& b) {
                                   if (a.score_at_entry != b.score_at_entry) {
                                       return a.score_at_entry < b.score_at_entry;
                                   }
                                   if (a.opened_at != b.opened_at) {
                                       return a.opened_at < b.opened_at;
                                   }
                                   return a.symbol < b.symbol;
                               });
    return *it;
}

void PortfolioState::open(const OpenPosition& position) {
    positions_.push_back(position);
}

std::optional<OpenPosition> PortfolioState::close(const std::string& symbol) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&symbol](const OpenPosition& p) { return p.symbol == symbol; });
    if (it == positions_.end()) {
        return std::nullopt;
    }
    OpenPosition closed = *it;
    positions_.erase(it);
    return closed;
}

nlohmann::json PortfolioState::to_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& p : positions_) {
        j.push_back(p.to_json());
    }
    return j;
}
