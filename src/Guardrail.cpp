#include "loopguard/Guardrail.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "loopguard/GuardrailError.hpp"

namespace loopguard {

namespace {

ClosedRange<Quantity> convertRange(const ClosedRange<Quantity>& range, Unit unit) {
    return ClosedRange<Quantity>(range.lowerBound().convertedTo(unit), range.upperBound().convertedTo(unit));
}

ClosedRange<Quantity> quantityRange(const ClosedRange<double>& range, Unit unit) {
    return ClosedRange<Quantity>(Quantity(unit, range.lowerBound()), Quantity(unit, range.upperBound()));
}

bool isFinite(const ClosedRange<Quantity>& range, Unit unit) {
    return std::isfinite(range.lowerBound().doubleValue(unit)) && std::isfinite(range.upperBound().doubleValue(unit));
}

std::string rangeJson(const ClosedRange<Quantity>& range, Unit unit) {
    return fmt::format(R"({{"lower":{},"upper":{}}})",
                       range.lowerBound().doubleValue(unit), range.upperBound().doubleValue(unit));
}

} // namespace

Guardrail::Guardrail(const ClosedRange<Quantity>& absoluteBounds,
                     const ClosedRange<Quantity>& recommendedBounds,
                     Unit unit,
                     std::optional<Quantity> startingSuggestion)
    : absoluteBounds_(convertRange(absoluteBounds, unit))
    , recommendedBounds_(convertRange(recommendedBounds, unit))
    , unit_(unit)
    , startingSuggestion_(startingSuggestion ? std::optional<Quantity>(startingSuggestion->convertedTo(unit))
                                             : std::nullopt)
{
    if (!isFinite(absoluteBounds_, unit_) || !isFinite(recommendedBounds_, unit_)) {
        throw GuardrailError(GuardrailErrorCode::InvariantViolation, fmt::format(
            "Guardrail bounds must be finite: absolute [{}, {}], recommended [{}, {}]",
            absoluteBounds_.lowerBound().toString(), absoluteBounds_.upperBound().toString(),
            recommendedBounds_.lowerBound().toString(), recommendedBounds_.upperBound().toString()));
    }
    if (!absoluteBounds_.contains(recommendedBounds_)) {
        throw GuardrailError(GuardrailErrorCode::InvariantViolation, fmt::format(
            "Recommended bounds [{}, {}] are not within absolute bounds [{}, {}]",
            recommendedBounds_.lowerBound().toString(), recommendedBounds_.upperBound().toString(),
            absoluteBounds_.lowerBound().toString(), absoluteBounds_.upperBound().toString()));
    }
}

Guardrail::Guardrail(const ClosedRange<double>& absoluteBounds,
                     const ClosedRange<double>& recommendedBounds,
                     Unit unit,
                     std::optional<double> startingSuggestion)
    : Guardrail(quantityRange(absoluteBounds, unit),
                quantityRange(recommendedBounds, unit),
                unit,
                startingSuggestion ? std::optional<Quantity>(Quantity(unit, *startingSuggestion)) : std::nullopt)
{
}

Quantity Guardrail::clamp(const Quantity& value) const {
    if (value < minValue()) return minValue();
    if (value > maxValue()) return maxValue();
    return value.convertedTo(unit_);
}

SafetyClassification Guardrail::classify(const Quantity& value) const {
    if (!isWithinAbsoluteBounds(value)) {
        return SafetyClassification::OutsideAbsolute;
    }
    if (value < recommendedBounds_.lowerBound()) {
        return SafetyClassification::BelowRecommended;
    }
    if (value > recommendedBounds_.upperBound()) {
        return SafetyClassification::AboveRecommended;
    }
    return SafetyClassification::WithinRecommended;
}

std::vector<Quantity> Guardrail::allValues(const Quantity& increment) const {
    double step = increment.doubleValue(unit_);
    if (!(step > 0.0)) {
        throw std::invalid_argument("Guardrail value increment must be positive");
    }
    double lower = minValue().doubleValue(unit_);
    double upper = maxValue().doubleValue(unit_);
    // Small slack keeps the upper bound when the span is an exact multiple of step
    auto count = static_cast<size_t>(std::floor((upper - lower) / step + 1e-9)) + 1;

    std::vector<Quantity> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.emplace_back(unit_, lower + static_cast<double>(i) * step);
    }
    return values;
}

std::string Guardrail::toString() const {
    return fmt::format("Guardrail[absolute:{}...{}, recommended:{}...{}, unit:{}, suggestion:{}]",
                       absoluteBounds_.lowerBound().doubleValue(unit_),
                       absoluteBounds_.upperBound().doubleValue(unit_),
                       recommendedBounds_.lowerBound().doubleValue(unit_),
                       recommendedBounds_.upperBound().doubleValue(unit_),
                       loopguard::toString(unit_),
                       startingSuggestion_ ? startingSuggestion_->toString() : "none");
}

std::string Guardrail::toJson() const {
    std::string json = fmt::format(R"({{"unit":"{}","absolute":{},"recommended":{})",
                                   loopguard::toString(unit_),
                                   rangeJson(absoluteBounds_, unit_),
                                   rangeJson(recommendedBounds_, unit_));
    if (startingSuggestion_) {
        json += fmt::format(R"(,"starting_suggestion":{})", startingSuggestion_->doubleValue(unit_));
    }
    json += "}";
    return json;
}

bool Guardrail::operator==(const Guardrail& other) const {
    return unit_ == other.unit_
        && absoluteBounds_ == other.absoluteBounds_
        && recommendedBounds_ == other.recommendedBounds_
        && startingSuggestion_ == other.startingSuggestion_;
}

} // namespace loopguard
