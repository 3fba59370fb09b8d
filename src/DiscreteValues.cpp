#include "loopguard/DiscreteValues.hpp"

#include <cmath>
#include <optional>

#include "loopguard/GuardrailError.hpp"
#include "loopguard/Log.hpp"

namespace loopguard {

namespace {

// Absorbs representation error between a rounded target and a supported value
constexpr double MATCH_TOLERANCE = 1e-9;

} // namespace

double roundedToDecimalPlaces(double value, int decimalPlaces) noexcept {
    double scale = std::pow(10.0, decimalPlaces);
    return std::round(value * scale) / scale;
}

bool matchesWithinDecimalPlaces(double supportedValue, double target, int decimalPlaces) noexcept {
    return std::abs(supportedValue - roundedToDecimalPlaces(target, decimalPlaces)) <= MATCH_TOLERANCE;
}

double matchingOrTruncatedValue(double target, std::span<const double> supportedValues, int decimalPlaces) {
    if (supportedValues.empty()) {
        Log::error(std::source_location::current(), "No supported values to match {} against", target);
        throw GuardrailError(GuardrailErrorCode::EmptyInputList, "Supported value list is empty");
    }

    std::optional<double> truncated;
    for (double value : supportedValues) {
        if (matchesWithinDecimalPlaces(value, target, decimalPlaces)) {
            return value;
        }
        if (value < target && (!truncated || value > *truncated)) {
            truncated = value;
        }
    }

    if (!truncated) {
        Log::error(std::source_location::current(),
                   "Target {} is below all {} supported values",
                   target, supportedValues.size());
        throw GuardrailError(GuardrailErrorCode::NoMatchingDiscreteValue, fmt::format(
            "No supported value at or below {}", target));
    }

    Log::debug(std::source_location::current(), "Truncated {} to supported value {}", target, *truncated);
    return *truncated;
}

} // namespace loopguard
