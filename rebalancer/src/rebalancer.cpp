#include "rebalancer.hpp"

Rebalancer::Holdings Rebalancer::group_positions(const std::vector<Position>& positions) {
    Holdings holdings;
    for (const auto& position : positions) {
        ++holdings.units[position.name()];
        holdings.total_value += position.current_price();
    }
    return holdings;
}

RebalanceSuggestion Rebalancer::rebalance(
    const std::vector<Position>& positions,
    const TargetAllocation& allocation
) {
    RebalanceSuggestion suggestion;

    // 1. Group holdings; the total is fixed here and not revisited after liquidations
    const Holdings holdings = group_positions(positions);

    // 2. Nothing held means nothing to allocate
    if (holdings.total_value.is_zero()) {
        return suggestion;
    }

    // 3. Handle Liquidations (Assets held but NOT in Target)
    for (const auto& [name, units] : holdings.units) {
        if (!allocation.contains(name)) {
            suggestion.to_sell[name] = units;
        }
    }

    // 4. Handle Buys and Sells for assets in Target
    for (const auto& [percentage, asset] : allocation.entries()) {
        const int64_t target_qty = holdings.total_value.units_for_share(percentage, asset.current_price());

        int64_t current_qty = 0;
        auto it = holdings.units.find(asset.name());
        if (it != holdings.units.end()) {
            current_qty = it->second;
        }

        const int64_t diff = target_qty - current_qty;

        if (diff > 0) {
            suggestion.to_buy[asset.name()] = diff;
        } else if (diff < 0) {
            suggestion.to_sell[asset.name()] = -diff;
        }
    }

    return suggestion;
}

std::vector<Order> Rebalancer::to_orders(const RebalanceSuggestion& suggestion) {
    std::vector<Order> orders;
    orders.reserve(suggestion.to_sell.size() + suggestion.to_buy.size());

    for (const auto& [symbol, quantity] : suggestion.to_sell) {
        orders.push_back({symbol, Side::SELL, quantity});
    }
    for (const auto& [symbol, quantity] : suggestion.to_buy) {
        orders.push_back({symbol, Side::BUY, quantity});
    }

    return orders;
}
