#pragma once

#include "types.hpp"
#include <string>

class SafetyCheck {
public:
    struct Result {
        bool valid;
        std::string reason;
    };

    static Result validate(const RebalanceSuggestion& suggestion);
};
