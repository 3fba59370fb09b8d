#pragma once

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

#include "../GuardrailError.hpp"
#include "../Quantity.hpp"

namespace loopguard::settings {

/**
 * A single glucose level used as a safety threshold (the suspend threshold).
 * Construction rejects non-glucose units and non-finite values.
 */
class GlucoseThreshold {
public:
    GlucoseThreshold(Unit unit, double value)
        : unit_(unit)
        , value_(value)
    {
        if (dimensionOf(unit_) != Dimension::BloodGlucose) {
            throw std::invalid_argument(fmt::format(
                "Glucose threshold needs a glucose unit, got {}", loopguard::toString(unit_)));
        }
        if (!std::isfinite(value_)) {
            throw GuardrailError(GuardrailErrorCode::InvariantViolation,
                                 fmt::format("Glucose threshold must be finite, got {}", value_));
        }
    }

    Unit getUnit() const { return unit_; }
    double getValue() const { return value_; }

    Quantity quantity() const { return Quantity(unit_, value_); }

    std::string toString() const {
        return fmt::format("GlucoseThreshold[value:{}, unit:{}]", value_, loopguard::toString(unit_));
    }

    bool operator==(const GlucoseThreshold& other) const {
        return unit_ == other.unit_ && value_ == other.value_;
    }

    bool operator!=(const GlucoseThreshold& other) const {
        return !(*this == other);
    }

private:
    Unit unit_;
    double value_;
};

} // namespace loopguard::settings
