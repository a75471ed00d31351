#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

// Open positions against a fixed capacity
class PortfolioState {
public:
    explicit PortfolioState(int capacity);
    PortfolioState(int capacity, std::vector<OpenPosition> positions);

    int capacity() const { return capacity_; }
    size_t size() const { return positions_.size(); }
    bool is_full() const;
    bool contains(const std::string& symbol) const;

    const std::vector<OpenPosition>& positions() const { return positions_; }

    // Lowest score_at_entry; ties go to the oldest, then lowest symbol
    std::optional<OpenPosition> weakest() const;

    void open(const OpenPosition& position);

    // Returns the closed position, if it was open
    std::optional<OpenPosition> close(const std::string& symbol);

    nlohmann::json to_json() const;

private:
    int capacity_;
    std::vector<OpenPosition> positions_;
};
