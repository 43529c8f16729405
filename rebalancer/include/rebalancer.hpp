#pragma once

#include "types.hpp"
#include "target_allocation.hpp"
#include <map>
#include <string>
#include <vector>

class Rebalancer {
public:
    struct Holdings {
        std::map<std::string, int64_t> units;
        DecimalSum total_value;
    };

    // Count held units per asset name and sum their recorded prices
    static Holdings group_positions(const std::vector<Position>& positions);

    // Calculate whole-unit trades that move the holdings toward the target without
    // ever exceeding an asset's target share of the current total value
    static RebalanceSuggestion rebalance(
        const std::vector<Position>& positions,
        const TargetAllocation& allocation
    );

    // Flatten a suggestion into market orders: sells first, then buys
    static std::vector<Order> to_orders(const RebalanceSuggestion& suggestion);
};
