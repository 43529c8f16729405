#pragma once

#include "types.hpp"
#include "target_allocation.hpp"
#include <map>
#include <string>
#include <vector>

// A snapshot of held positions together with the allocation it aims for.
class Portfolio {
public:
    Portfolio(std::vector<Position> positions, TargetAllocation allocation);

    const std::vector<Position>& positions() const { return positions_; }
    const TargetAllocation& allocation() const { return allocation_; }

    std::map<std::string, int64_t> holdings() const;
    DecimalSum total_value() const;

    RebalanceSuggestion rebalance() const;

private:
    std::vector<Position> positions_;
    TargetAllocation allocation_;
};
