#pragma once

#include "portfolio.hpp"
#include <nlohmann/json.hpp>

// Upper bound on "units" for one positions entry; each unit becomes its own Position
constexpr int64_t kMaxUnitsPerEntry = 1000000;

// Build a Portfolio from {"positions": [...], "target": [...]}.
// Throws on malformed documents, negative prices and invalid allocations.
Portfolio parse_request(const nlohmann::json& input);

// {"to_buy": {...}, "to_sell": {...}, "orders": [...]}
nlohmann::json make_response(const RebalanceSuggestion& suggestion);
