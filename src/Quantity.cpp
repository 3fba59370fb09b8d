#include "loopguard/Quantity.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace loopguard {

namespace {

// Multiplier from the unit into its dimension's base unit (mg/dL for glucose)
constexpr double toBaseFactor(Unit unit) noexcept {
    switch (unit) {
        case Unit::MillimolesPerLiter:
        case Unit::MillimolesPerLiterPerUnit:
            return MG_DL_PER_MMOL_L;
        default:
            return 1.0;
    }
}

} // namespace

double Quantity::doubleValue(Unit unit) const {
    if (unit == unit_) {
        return value_;
    }
    if (!isCompatible(unit)) {
        throw std::invalid_argument(fmt::format(
            "Cannot convert {} to {}", loopguard::toString(unit_), loopguard::toString(unit)));
    }
    return value_ * toBaseFactor(unit_) / toBaseFactor(unit);
}

bool Quantity::isApproximately(const Quantity& other, double tolerance) const {
    return std::abs(value_ - other.doubleValue(unit_)) <= tolerance;
}

std::string Quantity::toString() const {
    return fmt::format("{:g} {}", value_, loopguard::toString(unit_));
}

bool Quantity::operator==(const Quantity& other) const {
    return value_ == other.doubleValue(unit_);
}

bool Quantity::operator<(const Quantity& other) const {
    return value_ < other.doubleValue(unit_);
}

bool Quantity::operator<=(const Quantity& other) const {
    return value_ <= other.doubleValue(unit_);
}

} // namespace loopguard
