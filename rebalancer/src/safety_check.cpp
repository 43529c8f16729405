#include "safety_check.hpp"

namespace {

SafetyCheck::Result validate_side(const std::map<std::string, int64_t>& quantities, const char* side) {
    for (const auto& [symbol, quantity] : quantities) {
        // Check 1: Quantity > 0
        if (quantity <= 0) {
            return {false, std::string(side) + " quantity must be positive. Found: " + std::to_string(quantity) + " for symbol: " + symbol};
        }

        // Check 2: Symbol Validity
        if (symbol.empty()) {
            return {false, std::string(side) + " symbol cannot be empty."};
        }
    }

    return {true, ""};
}

} // namespace

SafetyCheck::Result SafetyCheck::validate(const RebalanceSuggestion& suggestion) {
    auto result = validate_side(suggestion.to_buy, "Buy");
    if (!result.valid) {
        return result;
    }

    result = validate_side(suggestion.to_sell, "Sell");
    if (!result.valid) {
        return result;
    }

    // Check 3: An asset is either bought or sold, never both
    for (const auto& [symbol, quantity] : suggestion.to_buy) {
        if (suggestion.to_sell.count(symbol)) {
            return {false, "Symbol is both bought and sold: " + symbol};
        }
    }

    return {true, ""};
}
