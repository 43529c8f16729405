#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Fixed-point number with 6 fractional digits, stored as a count of millionths.
// Sums and comparisons are exact, so a set of percentages either adds up to 100 or it doesn't.
class Decimal {
public:
    static constexpr int kFractionDigits = 6;
    static constexpr int64_t kScale = 1000000;

    Decimal() = default;

    static Decimal from_raw(int64_t raw) { return Decimal(raw); }
    static Decimal from_units(int64_t units);
    static Decimal from_double(double value);

    // Throws std::invalid_argument on malformed text or more than 6 fractional digits.
    static Decimal parse(const std::string& text);

    int64_t raw() const { return raw_; }
    bool is_zero() const { return raw_ == 0; }
    bool is_negative() const { return raw_ < 0; }
    bool is_positive() const { return raw_ > 0; }

    std::string to_string() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    explicit Decimal(int64_t raw) : raw_(raw) {}

    int64_t raw_ = 0;
};

// Exact total of many Decimals. Kept wider than a single Decimal, so adding up any
// number of in-range prices cannot overflow.
class DecimalSum {
public:
    DecimalSum() = default;

    DecimalSum& operator+=(const Decimal& value);

    bool is_zero() const { return high_ == 0 && low_ == 0; }
    std::string to_string() const;

    bool operator==(const Decimal& value) const;
    bool operator!=(const Decimal& value) const { return !(*this == value); }

    // floor(total * percentage / 100 / price), saturating at the int64 maximum.
    // 0 when price is not positive. Throws std::invalid_argument if percentage is
    // outside [0, 100].
    int64_t units_for_share(const Decimal& percentage, const Decimal& price) const;

private:
    // Two's complement 128-bit value split in two words
    int64_t high_ = 0;
    uint64_t low_ = 0;
};

// Serialized as a string so no precision is lost on the way through a JSON document.
void to_json(nlohmann::json& j, const Decimal& d);
void from_json(const nlohmann::json& j, Decimal& d);
