#include "deterministic_math.hpp"

#include <limits>
#include <stdexcept>

namespace hb {

DeterministicMath::HighPrecision DeterministicMath::fromFixed(Fixed64 value) {
    return HighPrecision(value.raw()) / HighPrecision(Fixed64::kScale);
}

Fixed64 DeterministicMath::toFixedFloor(const HighPrecision& value) {
    HighPrecision scaled = boost::multiprecision::floor(value * HighPrecision(Fixed64::kScale));
    return Fixed64::fromRaw(scaled.convert_to<std::int64_t>());
}

Fixed64 DeterministicMath::crashPoint(double u, Fixed64 scale, Fixed64 cap) {
    if (u < 0.0 || u > 1.0) {
        throw std::domain_error("crash draw must lie in [0, 1]");
    }
    const Fixed64 one(1);
    if (cap < one) {
        throw std::invalid_argument("crash cap must be at least 1.00");
    }

    HighPrecision remaining = HighPrecision(1) - HighPrecision(u);
    if (remaining <= 0) {
        return cap.floorToHundredths();
    }

    HighPrecision point = fromFixed(scale) / remaining;
    HighPrecision hpCap = fromFixed(cap);
    if (point > hpCap) {
        point = hpCap;
    }
    if (point < 1) {
        point = 1;
    }

    HighPrecision hundredths = boost::multiprecision::floor(point * 100);
    return Fixed64::fromHundredths(hundredths.convert_to<std::int64_t>());
}

Fixed64 DeterministicMath::edgedOdds(Fixed64 edge, std::int64_t probabilityHundredthsOfPercent) {
    if (probabilityHundredthsOfPercent <= 0 || probabilityHundredthsOfPercent > 10000) {
        throw std::domain_error("win probability must lie in (0, 10000] hundredths of a percent");
    }
    HighPrecision keep = HighPrecision(1) - fromFixed(edge);
    HighPrecision probability =
        HighPrecision(probabilityHundredthsOfPercent) / HighPrecision(10000);
    return toFixedFloor(keep / probability);
}

Amount DeterministicMath::edgedPayout(Amount amount,
                                      Fixed64 edge,
                                      std::int64_t probabilityHundredthsOfPercent) {
    if (probabilityHundredthsOfPercent <= 0 || probabilityHundredthsOfPercent > 10000) {
        throw std::domain_error("win probability must lie in (0, 10000] hundredths of a percent");
    }
    if (amount < 0) {
        throw std::domain_error("payout scaling needs a non-negative amount");
    }
    HighPrecision keep = HighPrecision(1) - fromFixed(edge);
    HighPrecision payout = boost::multiprecision::floor(
        HighPrecision(amount) * keep * HighPrecision(10000) /
        HighPrecision(probabilityHundredthsOfPercent));
    if (payout > HighPrecision(std::numeric_limits<Amount>::max())) {
        throw std::overflow_error("payout exceeds the representable amount range");
    }
    return payout.convert_to<Amount>();
}

} // namespace hb
