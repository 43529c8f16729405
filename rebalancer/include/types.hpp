#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "decimal.hpp"

enum class Side {
    BUY,
    SELL
};

// One held unit of an asset at the price it was recorded.
class Position {
public:
    // Throws InvalidPrice if current_price is negative.
    Position(std::string name, Decimal current_price);

    const std::string& name() const { return name_; }
    const Decimal& current_price() const { return current_price_; }

    bool operator==(const Position& other) const {
        return name_ == other.name_ && current_price_ == other.current_price_;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

private:
    std::string name_;
    Decimal current_price_;
};

struct Order {
    std::string symbol;
    Side side;
    int64_t quantity;

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Order, symbol, side, quantity)
};

// Units to trade per asset name. Names are copied out of the input, so a suggestion
// stays valid after the positions it was computed from are gone.
struct RebalanceSuggestion {
    std::map<std::string, int64_t> to_buy;
    std::map<std::string, int64_t> to_sell;

    bool empty() const { return to_buy.empty() && to_sell.empty(); }

    // Serialization
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RebalanceSuggestion, to_buy, to_sell)
};

// Position has no default constructor, so it gets a full serializer instead of the macro
namespace nlohmann {
    template <>
    struct adl_serializer<Position> {
        static void to_json(json& j, const Position& position);
        static Position from_json(const json& j);
    };
}

// JSON conversions for Enums
NLOHMANN_JSON_SERIALIZE_ENUM(Side, {
    {Side::BUY, "BUY"},
    {Side::SELL, "SELL"}
})
