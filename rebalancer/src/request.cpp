#include "request.hpp"
#include "rebalancer.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<Position> parse_positions(const nlohmann::json& items) {
    if (!items.is_array()) {
        throw std::invalid_argument("'positions' must be a JSON array");
    }

    std::vector<Position> positions;
    for (const auto& item : items) {
        const Position unit = item.get<Position>();
        int64_t units = 1;

        if (item.contains("units")) {
            const auto& value = item.at("units");
            if (!value.is_number_integer()) {
                throw std::invalid_argument("Units must be a whole number. Found: " + value.dump() + " for asset: " + unit.name());
            }
            // Unsigned values above the int64 range would wrap on conversion
            if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(kMaxUnitsPerEntry)) {
                throw std::invalid_argument("Units must be between 0 and " + std::to_string(kMaxUnitsPerEntry) +
                                            ". Found: " + value.dump() + " for asset: " + unit.name());
            }
            units = value.get<int64_t>();
        }

        if (units < 0 || units > kMaxUnitsPerEntry) {
            throw std::invalid_argument("Units must be between 0 and " + std::to_string(kMaxUnitsPerEntry) +
                                        ". Found: " + std::to_string(units) + " for asset: " + unit.name());
        }

        positions.insert(positions.end(), static_cast<size_t>(units), unit);
    }
    return positions;
}

} // namespace

Portfolio parse_request(const nlohmann::json& input) {
    if (!input.contains("target")) {
        throw std::invalid_argument("Missing 'target' allocation");
    }

    std::vector<Position> positions;
    if (input.contains("positions")) {
        positions = parse_positions(input["positions"]);
    }

    return Portfolio(std::move(positions), input["target"].get<TargetAllocation>());
}

nlohmann::json make_response(const RebalanceSuggestion& suggestion) {
    nlohmann::json output = suggestion;
    output["orders"] = Rebalancer::to_orders(suggestion);
    return output;
}
