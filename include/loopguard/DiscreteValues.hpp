#pragma once

#include <span>

#include "GuardrailPolicy.hpp"

namespace loopguard {

/**
 * Snap a target onto a device-supported value.
 *
 * The target is rounded to decimalPlaces and a supported value equal to the
 * rounded target is returned as-is. Supported values are not rounded. A match
 * may sit slightly above the raw target (0.1496 matches 0.15 at three places).
 * Otherwise the result is the greatest supported value strictly below the
 * target.
 *
 * @param target the value to snap
 * @param supportedValues values the device accepts, in any order
 * @param decimalPlaces precision used for the exact-match test
 * @return the matching or truncated supported value
 * @throws GuardrailError EmptyInputList if supportedValues is empty,
 *         NoMatchingDiscreteValue if every supported value exceeds the target
 */
[[nodiscard]] double matchingOrTruncatedValue(
    double target,
    std::span<const double> supportedValues,
    int decimalPlaces = BasalRatePolicy::DEFAULT_DECIMAL_PLACES);

/**
 * value rounded half away from zero to decimalPlaces.
 */
[[nodiscard]] double roundedToDecimalPlaces(double value, int decimalPlaces) noexcept;

/**
 * Whether supportedValue equals target rounded to decimalPlaces, within
 * floating point tolerance.
 */
[[nodiscard]] bool matchesWithinDecimalPlaces(double supportedValue, double target, int decimalPlaces) noexcept;

} // namespace loopguard
