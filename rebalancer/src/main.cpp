#include <fstream>
#include <iostream>
#include <string>
#include "request.hpp"
#include "safety_check.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using json = nlohmann::json;

namespace {

int report_error(const std::string& message) {
    spdlog::error(message);

    // Output Error JSON
    json error_output = {
        {"status", "error"},
        {"message", message}
    };
    std::cout << error_output.dump(4) << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // Stdout is reserved for the JSON document
    spdlog::set_default_logger(spdlog::stderr_color_mt("rebalancer"));

    // 1. Read Input (file argument or Stdin)
    const std::string source = argc > 1 ? argv[1] : "-";
    json input;
    try {
        if (source == "-") {
            std::cin >> input;
        } else {
            std::ifstream file(source);
            if (!file) {
                return report_error("Cannot open input file: " + source);
            }
            file >> input;
        }
    } catch (const std::exception& e) {
        return report_error(std::string("Error parsing JSON input: ") + e.what());
    }

    // 2. Parse Positions and Target Allocation
    try {
        const Portfolio portfolio = parse_request(input);
        spdlog::info("Rebalancing {} units across {} assets, total value {}, {} target entries",
                     portfolio.positions().size(), portfolio.holdings().size(),
                     portfolio.total_value().to_string(), portfolio.allocation().entries().size());

        // 3. Run Rebalancer
        const RebalanceSuggestion suggestion = portfolio.rebalance();

        // 4. Run Safety Check
        auto safety_result = SafetyCheck::validate(suggestion);
        if (!safety_result.valid) {
            return report_error("Safety Check Failed: " + safety_result.reason);
        }

        spdlog::info("Suggested {} buys and {} sells", suggestion.to_buy.size(), suggestion.to_sell.size());

        // 5. Output Suggestion (Stdout)
        std::cout << make_response(suggestion).dump(4) << std::endl;
    } catch (const std::exception& e) {
        return report_error(std::string("Invalid request: ") + e.what());
    }

    return 0;
}
