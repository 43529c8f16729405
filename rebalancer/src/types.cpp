#include "types.hpp"
#include "errors.hpp"
#include <utility>

Position::Position(std::string name, Decimal current_price)
    : name_(std::move(name)), current_price_(current_price) {
    if (current_price_.is_negative()) {
        throw InvalidPrice("Price cannot be negative. Found: " + current_price_.to_string() + " for asset: " + name_);
    }
}

void nlohmann::adl_serializer<Position>::to_json(json& j, const Position& position) {
    j = json{
        {"name", position.name()},
        {"current_price", position.current_price()}
    };
}

Position nlohmann::adl_serializer<Position>::from_json(const json& j) {
    return Position(j.at("name").get<std::string>(), j.at("current_price").get<Decimal>());
}
