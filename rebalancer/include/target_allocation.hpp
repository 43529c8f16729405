#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

// The distribution a portfolio aims for, e.g. 40% META / 60% AAPL.
// Only constructible in a valid state: every percentage is > 0, names are unique,
// and the percentages add up to exactly 100.
class TargetAllocation {
public:
    using Entry = std::pair<Decimal, Position>;

    // 100% in a single asset
    explicit TargetAllocation(Position asset);

    // Throws InvalidAllocation if the entries break any of the invariants above.
    static TargetAllocation try_from(std::vector<Entry> entries);

    bool contains(const std::string& name) const;
    std::optional<Decimal> percentage_of(const std::string& name) const;

    const std::vector<Entry>& entries() const { return entries_; }

private:
    explicit TargetAllocation(std::vector<Entry> entries);

    std::vector<Entry> entries_;
};

// Reads an array of {percentage, name, current_price}; goes through try_from.
namespace nlohmann {
    template <>
    struct adl_serializer<TargetAllocation> {
        static void to_json(json& j, const TargetAllocation& allocation);
        static TargetAllocation from_json(const json& j);
    };
}
