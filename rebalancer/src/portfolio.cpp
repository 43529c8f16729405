#include "portfolio.hpp"
#include "rebalancer.hpp"
#include <utility>

Portfolio::Portfolio(std::vector<Position> positions, TargetAllocation allocation)
    : positions_(std::move(positions)), allocation_(std::move(allocation)) {}

std::map<std::string, int64_t> Portfolio::holdings() const {
    return Rebalancer::group_positions(positions_).units;
}

DecimalSum Portfolio::total_value() const {
    return Rebalancer::group_positions(positions_).total_value;
}

RebalanceSuggestion Portfolio::rebalance() const {
    return Rebalancer::rebalance(positions_, allocation_);
}
