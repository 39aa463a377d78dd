#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace hb {

// Minor currency units (cents). Payouts always floor to a whole unit.
using Amount = std::int64_t;

// Fixed-point multiplier with six decimals. Keeps payout arithmetic exact
// where doubles would land a hair under a round value (100 * 1.98).
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000;
    static constexpr std::int64_t kHundredth = kScale / 100;

    Fixed64() : raw_(0) {}
    explicit Fixed64(std::int64_t whole) : raw_(scaleWhole(whole)) {}

    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }
    static Fixed64 fromHundredths(std::int64_t hundredths) {
        return Fixed64(clampToInt64(static_cast<__int128>(hundredths) * kHundredth), RawTag{});
    }
    static Fixed64 fromDouble(double value) {
        if (std::isnan(value)) {
            throw std::domain_error("Fixed64 cannot represent NaN");
        }
        double scaled = std::round(value * static_cast<double>(kScale));
        if (scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return Fixed64(std::numeric_limits<std::int64_t>::max(), RawTag{});
        }
        if (scaled <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
            return Fixed64(std::numeric_limits<std::int64_t>::min(), RawTag{});
        }
        return Fixed64(static_cast<std::int64_t>(scaled), RawTag{});
    }

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }

    // Rounds toward zero onto the 0.01 grid.
    Fixed64 floorToHundredths() const { return Fixed64((raw_ / kHundredth) * kHundredth, RawTag{}); }

    // floor(amount * this) for non-negative amounts and multipliers.
    Amount applyTo(Amount amount) const {
        if (amount < 0 || raw_ < 0) {
            throw std::domain_error("payout scaling needs a non-negative amount and multiplier");
        }
        __int128 wide = static_cast<__int128>(amount) * static_cast<__int128>(raw_);
        wide /= kScale;
        if (wide > static_cast<__int128>(std::numeric_limits<Amount>::max())) {
            throw std::overflow_error("payout exceeds the representable amount range");
        }
        return static_cast<Amount>(wide);
    }

    Fixed64 operator+(Fixed64 other) const {
        return Fixed64(clampToInt64(static_cast<__int128>(raw_) + other.raw_), RawTag{});
    }
    Fixed64 operator-(Fixed64 other) const {
        return Fixed64(clampToInt64(static_cast<__int128>(raw_) - other.raw_), RawTag{});
    }
    Fixed64 operator*(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(other.raw_);
        return Fixed64(clampToInt64(wide / kScale), RawTag{});
    }
    Fixed64 operator/(Fixed64 other) const {
        if (other.raw_ == 0) {
            throw std::domain_error("Fixed64 division by zero");
        }
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(kScale);
        return Fixed64(clampToInt64(wide / other.raw_), RawTag{});
    }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator<=(Fixed64 other) const { return raw_ <= other.raw_; }
    bool operator>=(Fixed64 other) const { return raw_ >= other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

    // Fixed number of decimals, truncated ("2.37" for 2.379999 with 2 places).
    std::string toString(int decimals = 2) const {
        if (decimals < 0 || decimals > 6) {
            throw std::invalid_argument("Fixed64::toString supports 0..6 decimals");
        }
        std::int64_t magnitude = raw_ < 0 ? -raw_ : raw_;
        std::string out = raw_ < 0 ? "-" : "";
        out += std::to_string(magnitude / kScale);
        if (decimals == 0) {
            return out;
        }
        std::string frac = std::to_string(magnitude % kScale);
        frac.insert(0, 6 - frac.size(), '0');
        return out + "." + frac.substr(0, static_cast<std::size_t>(decimals));
    }

private:
    struct RawTag {};
    Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}

    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    static std::int64_t scaleWhole(std::int64_t whole) {
        constexpr std::int64_t maxWhole = std::numeric_limits<std::int64_t>::max() / kScale;
        constexpr std::int64_t minWhole = std::numeric_limits<std::int64_t>::min() / kScale;
        if (whole > maxWhole || whole < minWhole) {
            throw std::overflow_error("Fixed64 whole value out of range");
        }
        return whole * kScale;
    }

    std::int64_t raw_;
};

} // namespace hb
