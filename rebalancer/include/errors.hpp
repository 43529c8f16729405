#pragma once

#include <stdexcept>
#include <string>

// Thrown by TargetAllocation::try_from when the entries can't describe a full portfolio.
class InvalidAllocation : public std::invalid_argument {
public:
    enum class Reason {
        SUM_MISMATCH,
        NON_POSITIVE_PERCENTAGE,
        DUPLICATE_ASSET
    };

    InvalidAllocation(Reason reason, const std::string& message)
        : std::invalid_argument(message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// Thrown when a Position is recorded with a negative price.
class InvalidPrice : public std::invalid_argument {
public:
    explicit InvalidPrice(const std::string& message)
        : std::invalid_argument(message) {}
};
