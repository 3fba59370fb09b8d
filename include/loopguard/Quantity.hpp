#pragma once

#include <string>

namespace loopguard {

/**
 * Physical dimension a unit measures. Quantities compare and convert
 * only within one dimension.
 */
enum class Dimension {
    BloodGlucose,
    InsulinSensitivity,
    CarbRatio,
    BasalRate,
    Insulin
};

enum class Unit {
    MilligramsPerDeciliter,
    MillimolesPerLiter,
    MilligramsPerDeciliterPerUnit,
    MillimolesPerLiterPerUnit,
    GramsPerUnit,
    InternationalUnitsPerHour,
    InternationalUnit
};

/**
 * Glucose molar mass conversion: 1 mmol/L = 18.01559 mg/dL.
 */
inline constexpr double MG_DL_PER_MMOL_L = 18.01559;

[[nodiscard]] constexpr Dimension dimensionOf(Unit unit) noexcept {
    switch (unit) {
        case Unit::MilligramsPerDeciliter:
        case Unit::MillimolesPerLiter:
            return Dimension::BloodGlucose;
        case Unit::MilligramsPerDeciliterPerUnit:
        case Unit::MillimolesPerLiterPerUnit:
            return Dimension::InsulinSensitivity;
        case Unit::GramsPerUnit:
            return Dimension::CarbRatio;
        case Unit::InternationalUnitsPerHour:
            return Dimension::BasalRate;
        case Unit::InternationalUnit:
            return Dimension::Insulin;
    }
    return Dimension::Insulin;
}

[[nodiscard]] constexpr bool isCompatible(Unit a, Unit b) noexcept {
    return dimensionOf(a) == dimensionOf(b);
}

[[nodiscard]] constexpr const char* toString(Unit unit) noexcept {
    switch (unit) {
        case Unit::MilligramsPerDeciliter:        return "mg/dL";
        case Unit::MillimolesPerLiter:            return "mmol/L";
        case Unit::MilligramsPerDeciliterPerUnit: return "mg/dL/U";
        case Unit::MillimolesPerLiterPerUnit:     return "mmol/L/U";
        case Unit::GramsPerUnit:                  return "g/U";
        case Unit::InternationalUnitsPerHour:     return "U/hr";
        case Unit::InternationalUnit:             return "U";
    }
    return "";
}

/**
 * Immutable unit-aware scalar.
 *
 * Relational operators convert the right operand into the left operand's
 * unit and throw std::invalid_argument when the dimensions differ.
 */
class Quantity {
public:
    Quantity(Unit unit, double value) noexcept
        : unit_(unit)
        , value_(value)
    {
    }

    Unit unit() const noexcept { return unit_; }

    /**
     * The value expressed in another unit of the same dimension.
     * @throws std::invalid_argument if the units are incompatible
     */
    double doubleValue(Unit unit) const;

    Quantity convertedTo(Unit unit) const { return Quantity(unit, doubleValue(unit)); }

    bool isCompatible(Unit unit) const noexcept { return loopguard::isCompatible(unit_, unit); }

    /**
     * Equality within an absolute tolerance, measured in this quantity's unit.
     */
    bool isApproximately(const Quantity& other, double tolerance = 1e-9) const;

    std::string toString() const;

    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const { return !(*this == other); }
    bool operator<(const Quantity& other) const;
    bool operator>(const Quantity& other) const { return other < *this; }
    bool operator<=(const Quantity& other) const;
    bool operator>=(const Quantity& other) const { return other <= *this; }

private:
    Unit unit_;
    double value_;
};

} // namespace loopguard
