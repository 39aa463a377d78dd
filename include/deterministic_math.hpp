#pragma once

#include "fixed_point.hpp"

#include <cstdint>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace hb {

// Evaluated in 50-digit decimal arithmetic so a verified draw maps to the
// same multiplier on every platform and compiler.
class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    // max(1, scale / (1 - u)) capped at `cap`, floored to 0.01.
    static Fixed64 crashPoint(double u, Fixed64 scale, Fixed64 cap);

    // (1 - edge) / (hundredths / 10000), truncated to six decimals.
    static Fixed64 edgedOdds(Fixed64 edge, std::int64_t probabilityHundredthsOfPercent);

    // floor(amount * (1 - edge) * 10000 / hundredths). Rounded down once, so
    // large stakes do not lose the digits edgedOdds truncates.
    static Amount edgedPayout(Amount amount, Fixed64 edge, std::int64_t probabilityHundredthsOfPercent);

private:
    static HighPrecision fromFixed(Fixed64 value);
    static Fixed64 toFixedFloor(const HighPrecision& value);
};

} // namespace hb
