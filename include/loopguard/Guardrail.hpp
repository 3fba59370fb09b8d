#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ClosedRange.hpp"
#include "Quantity.hpp"

namespace loopguard {

/**
 * Where a candidate value falls relative to a guardrail.
 */
enum class SafetyClassification {
    OutsideAbsolute,
    BelowRecommended,
    WithinRecommended,
    AboveRecommended
};

[[nodiscard]] constexpr const char* toString(SafetyClassification classification) noexcept {
    switch (classification) {
        case SafetyClassification::OutsideAbsolute:   return "outside_absolute";
        case SafetyClassification::BelowRecommended:  return "below_recommended";
        case SafetyClassification::WithinRecommended: return "within_recommended";
        case SafetyClassification::AboveRecommended:  return "above_recommended";
    }
    return "unknown";
}

/**
 * Absolute and recommended bounds for one therapy setting.
 *
 * Bounds are stored converted into unit(). The constructor enforces
 * absolute.lower <= recommended.lower <= recommended.upper <= absolute.upper
 * and throws GuardrailError(InvariantViolation) otherwise; it never
 * re-clamps. The starting suggestion is carried as given.
 */
class Guardrail {
public:
    Guardrail(const ClosedRange<Quantity>& absoluteBounds,
              const ClosedRange<Quantity>& recommendedBounds,
              Unit unit,
              std::optional<Quantity> startingSuggestion = std::nullopt);

    /**
     * Bounds given as plain numbers in unit.
     */
    Guardrail(const ClosedRange<double>& absoluteBounds,
              const ClosedRange<double>& recommendedBounds,
              Unit unit,
              std::optional<double> startingSuggestion = std::nullopt);

    const ClosedRange<Quantity>& absoluteBounds() const { return absoluteBounds_; }
    const ClosedRange<Quantity>& recommendedBounds() const { return recommendedBounds_; }
    Unit unit() const { return unit_; }
    const std::optional<Quantity>& startingSuggestion() const { return startingSuggestion_; }

    const Quantity& minValue() const { return absoluteBounds_.lowerBound(); }
    const Quantity& maxValue() const { return absoluteBounds_.upperBound(); }

    bool isWithinAbsoluteBounds(const Quantity& value) const { return absoluteBounds_.contains(value); }
    bool isWithinRecommendedBounds(const Quantity& value) const { return recommendedBounds_.contains(value); }

    /**
     * The value pulled into the absolute bounds, in unit().
     */
    Quantity clamp(const Quantity& value) const;

    SafetyClassification classify(const Quantity& value) const;

    /**
     * Every value from minValue() to maxValue() in steps of increment,
     * for populating pickers.
     * @throws std::invalid_argument if increment is not positive
     */
    std::vector<Quantity> allValues(const Quantity& increment) const;

    std::string toString() const;
    std::string toJson() const;

    bool operator==(const Guardrail& other) const;
    bool operator!=(const Guardrail& other) const { return !(*this == other); }

private:
    ClosedRange<Quantity> absoluteBounds_;
    ClosedRange<Quantity> recommendedBounds_;
    Unit unit_;
    std::optional<Quantity> startingSuggestion_;
};

} // namespace loopguard
