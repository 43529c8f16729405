#include "target_allocation.hpp"
#include "errors.hpp"
#include <set>

namespace {

const Decimal kFullAllocation = Decimal::from_units(100);

} // namespace

TargetAllocation::TargetAllocation(Position asset) {
    entries_.emplace_back(kFullAllocation, std::move(asset));
}

TargetAllocation::TargetAllocation(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

TargetAllocation TargetAllocation::try_from(std::vector<Entry> entries) {
    std::set<std::string> seen;
    Decimal total;

    for (const auto& [percentage, asset] : entries) {
        // Check 1: Percentage > 0
        if (!percentage.is_positive()) {
            throw InvalidAllocation(InvalidAllocation::Reason::NON_POSITIVE_PERCENTAGE,
                "Target percentage must be positive. Found: " + percentage.to_string() + "% for asset: " + asset.name());
        }

        // Check 2: Each asset targeted once
        if (!seen.insert(asset.name()).second) {
            throw InvalidAllocation(InvalidAllocation::Reason::DUPLICATE_ASSET,
                "Asset appears more than once in target allocation: " + asset.name());
        }

        // Check 3: Running total never passes 100
        if (percentage > kFullAllocation - total) {
            throw InvalidAllocation(InvalidAllocation::Reason::SUM_MISMATCH,
                "Target percentages must sum to 100%. Found more than 100% at asset: " + asset.name());
        }

        total += percentage;
    }

    // Check 4: Exact sum, no tolerance
    if (total != kFullAllocation) {
        throw InvalidAllocation(InvalidAllocation::Reason::SUM_MISMATCH,
            "Target percentages must sum to 100%. Found: " + total.to_string() + "%");
    }

    return TargetAllocation(std::move(entries));
}

bool TargetAllocation::contains(const std::string& name) const {
    return percentage_of(name).has_value();
}

std::optional<Decimal> TargetAllocation::percentage_of(const std::string& name) const {
    for (const auto& [percentage, asset] : entries_) {
        if (asset.name() == name) {
            return percentage;
        }
    }
    return std::nullopt;
}

void nlohmann::adl_serializer<TargetAllocation>::to_json(json& j, const TargetAllocation& allocation) {
    j = json::array();
    for (const auto& [percentage, asset] : allocation.entries()) {
        j.push_back({
            {"percentage", percentage},
            {"name", asset.name()},
            {"current_price", asset.current_price()}
        });
    }
}

TargetAllocation nlohmann::adl_serializer<TargetAllocation>::from_json(const json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Target allocation must be a JSON array");
    }

    std::vector<TargetAllocation::Entry> entries;
    entries.reserve(j.size());
    for (const auto& item : j) {
        entries.emplace_back(item.at("percentage").get<Decimal>(), item.get<Position>());
    }

    return TargetAllocation::try_from(std::move(entries));
}
