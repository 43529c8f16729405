#include "decimal.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

// Compiler extensions are confined to this block: overflow-checked int64 arithmetic
// and a 128-bit integer for totals and products of raw millionths.
using wide_int = __int128;
using wide_uint = unsigned __int128;

bool checked_add(int64_t a, int64_t b, int64_t* out) {
    return !__builtin_add_overflow(a, b, out);
}

bool checked_sub(int64_t a, int64_t b, int64_t* out) {
    return !__builtin_sub_overflow(a, b, out);
}

bool checked_mul(int64_t a, int64_t b, int64_t* out) {
    return !__builtin_mul_overflow(a, b, out);
}

wide_int join_words(int64_t high, uint64_t low) {
    return static_cast<wide_int>((static_cast<wide_uint>(static_cast<uint64_t>(high)) << 64) | low);
}

void split_words(wide_int value, int64_t& high, uint64_t& low) {
    low = static_cast<uint64_t>(value);
    high = static_cast<int64_t>(value >> 64);
}

// Largest whole number a Decimal can hold
constexpr int64_t kMaxUnits = std::numeric_limits<int64_t>::max() / Decimal::kScale;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Canonical text for a count of millionths, trailing fractional zeros trimmed
std::string format_raw(wide_int raw) {
    const bool negative = raw < 0;
    const wide_uint magnitude = negative ? wide_uint{0} - static_cast<wide_uint>(raw)
                                         : static_cast<wide_uint>(raw);

    wide_uint whole = magnitude / Decimal::kScale;
    const uint64_t fraction = static_cast<uint64_t>(magnitude % Decimal::kScale);

    std::string out;
    do {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(whole % 10)));
        whole /= 10;
    } while (whole != 0);

    if (fraction != 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, Decimal::kFractionDigits - digits.size(), '0');
        while (digits.back() == '0') {
            digits.pop_back();
        }
        out += "." + digits;
    }

    return negative ? "-" + out : out;
}

} // namespace

Decimal Decimal::from_units(int64_t units) {
    int64_t raw = 0;
    if (!checked_mul(units, kScale, &raw)) {
        throw std::overflow_error("Decimal overflow: " + std::to_string(units));
    }
    return Decimal(raw);
}

Decimal Decimal::from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal from non-finite value");
    }

    const double scaled = std::round(value * static_cast<double>(kScale));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw std::invalid_argument("Decimal out of range: " + std::to_string(value));
    }
    return Decimal(static_cast<int64_t>(scaled));
}

Decimal Decimal::parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    // 1. Whole part
    int64_t whole = 0;
    size_t whole_digits = 0;
    for (; pos < text.size() && is_digit(text[pos]); ++pos, ++whole_digits) {
        if (!checked_mul(whole, 10, &whole) || !checked_add(whole, text[pos] - '0', &whole)) {
            throw std::invalid_argument("Decimal out of range: " + text);
        }
    }

    // 2. Fractional part, padded to kFractionDigits
    int64_t fraction = 0;
    size_t fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        for (; pos < text.size() && is_digit(text[pos]); ++pos, ++fraction_digits) {
            if (fraction_digits == static_cast<size_t>(kFractionDigits)) {
                throw std::invalid_argument("Decimal has more than 6 fractional digits: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
        }
    }

    if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        throw std::invalid_argument("Malformed decimal: '" + text + "'");
    }

    for (size_t i = fraction_digits; i < static_cast<size_t>(kFractionDigits); ++i) {
        fraction *= 10;
    }

    int64_t raw = 0;
    if (!checked_mul(whole, kScale, &raw) || !checked_add(raw, fraction, &raw)) {
        throw std::invalid_argument("Decimal out of range: " + text);
    }

    return Decimal(negative ? -raw : raw);
}

std::string Decimal::to_string() const {
    return format_raw(raw_);
}

Decimal Decimal::operator+(const Decimal& other) const {
    int64_t raw = 0;
    if (!checked_add(raw_, other.raw_, &raw)) {
        throw std::overflow_error("Decimal overflow: " + to_string() + " + " + other.to_string());
    }
    return Decimal(raw);
}

Decimal Decimal::operator-(const Decimal& other) const {
    int64_t raw = 0;
    if (!checked_sub(raw_, other.raw_, &raw)) {
        throw std::overflow_error("Decimal overflow: " + to_string() + " - " + other.to_string());
    }
    return Decimal(raw);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

DecimalSum& DecimalSum::operator+=(const Decimal& value) {
    split_words(join_words(high_, low_) + value.raw(), high_, low_);
    return *this;
}

std::string DecimalSum::to_string() const {
    return format_raw(join_words(high_, low_));
}

bool DecimalSum::operator==(const Decimal& value) const {
    return join_words(high_, low_) == value.raw();
}

int64_t DecimalSum::units_for_share(const Decimal& percentage, const Decimal& price) const {
    if (percentage.is_negative() || percentage > Decimal::from_units(100)) {
        throw std::invalid_argument("Share must be between 0 and 100%. Found: " + percentage.to_string() + "%");
    }

    const wide_int total = join_words(high_, low_);
    if (!price.is_positive() || percentage.is_zero() || total <= 0) {
        return 0;
    }

    // total * percentage can pass 128 bits, so divide first and carry the remainder.
    // All operands are positive, so truncation is the floor.
    const wide_int denominator = static_cast<wide_int>(price.raw()) * 100 * Decimal::kScale;
    const wide_int whole = total / denominator;
    const wide_int rest = total % denominator;

    constexpr int64_t kMaxUnitsResult = std::numeric_limits<int64_t>::max();
    if (whole > kMaxUnitsResult) {
        return kMaxUnitsResult;
    }

    const wide_int units = whole * percentage.raw() + rest * percentage.raw() / denominator;
    return units > kMaxUnitsResult ? kMaxUnitsResult : static_cast<int64_t>(units);
}

void to_json(nlohmann::json& j, const Decimal& d) {
    j = d.to_string();
}

void from_json(const nlohmann::json& j, Decimal& d) {
    if (j.is_string()) {
        d = Decimal::parse(j.get<std::string>());
    } else if (j.is_number_unsigned()) {
        const uint64_t units = j.get<uint64_t>();
        if (units > static_cast<uint64_t>(kMaxUnits)) {
            throw std::invalid_argument("Decimal out of range: " + j.dump());
        }
        d = Decimal::from_units(static_cast<int64_t>(units));
    } else if (j.is_number_integer()) {
        const int64_t units = j.get<int64_t>();
        if (units > kMaxUnits || units < -kMaxUnits) {
            throw std::invalid_argument("Decimal out of range: " + j.dump());
        }
        d = Decimal::from_units(units);
    } else if (j.is_number_float()) {
        d = Decimal::from_double(j.get<double>());
    } else {
        throw std::invalid_argument("Expected a decimal string or number, got: " + j.dump());
    }
}
