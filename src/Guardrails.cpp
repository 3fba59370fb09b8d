#include "loopguard/Guardrails.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <source_location>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "loopguard/DiscreteValues.hpp"
#include "loopguard/GuardrailError.hpp"
#include "loopguard/Log.hpp"

namespace loopguard {

using settings::CorrectionRangeOverrides;
using settings::GlucoseRangeSchedule;
using settings::GlucoseThreshold;

namespace {

[[noreturn]] void fail(GuardrailErrorCode code, const std::string& message,
                       const std::source_location& loc = std::source_location::current()) {
    Log::write(LogLevel::Error, fmt::format("Guardrails: {} ({})", message, toString(code)), loc);
    throw GuardrailError(code, message);
}

std::map<StaticSetting, Guardrail> buildStaticGuardrails() {
    std::map<StaticSetting, Guardrail> table;
    table.emplace(StaticSetting::SuspendThreshold, Guardrail(
        ClosedRange<double>(SuspendThresholdPolicy::ABSOLUTE_MIN, SuspendThresholdPolicy::ABSOLUTE_MAX),
        ClosedRange<double>(SuspendThresholdPolicy::RECOMMENDED_MIN, SuspendThresholdPolicy::RECOMMENDED_MAX),
        Unit::MilligramsPerDeciliter,
        SuspendThresholdPolicy::STARTING_SUGGESTION));
    table.emplace(StaticSetting::CorrectionRange, Guardrail(
        ClosedRange<double>(CorrectionRangePolicy::ABSOLUTE_MIN, CorrectionRangePolicy::ABSOLUTE_MAX),
        ClosedRange<double>(CorrectionRangePolicy::RECOMMENDED_MIN, CorrectionRangePolicy::RECOMMENDED_MAX),
        Unit::MilligramsPerDeciliter,
        CorrectionRangePolicy::STARTING_SUGGESTION));
    table.emplace(StaticSetting::InsulinSensitivity, Guardrail(
        ClosedRange<double>(InsulinSensitivityPolicy::ABSOLUTE_MIN, InsulinSensitivityPolicy::ABSOLUTE_MAX),
        ClosedRange<double>(InsulinSensitivityPolicy::RECOMMENDED_MIN, InsulinSensitivityPolicy::RECOMMENDED_MAX),
        Unit::MilligramsPerDeciliterPerUnit,
        InsulinSensitivityPolicy::STARTING_SUGGESTION));
    table.emplace(StaticSetting::CarbRatio, Guardrail(
        ClosedRange<double>(CarbRatioPolicy::ABSOLUTE_MIN, CarbRatioPolicy::ABSOLUTE_MAX),
        ClosedRange<double>(CarbRatioPolicy::RECOMMENDED_MIN, CarbRatioPolicy::RECOMMENDED_MAX),
        Unit::GramsPerUnit,
        CarbRatioPolicy::STARTING_SUGGESTION));
    return table;
}

Quantity glucose(double mgdl) {
    return Quantity(Unit::MilligramsPerDeciliter, mgdl);
}

Guardrail workoutCorrectionRange(const ClosedRange<Quantity>& correctionRangeScheduleRange,
                                 const std::optional<GlucoseThreshold>& suspendThreshold) {
    std::vector<Quantity> floors{glucose(CorrectionRangePolicy::WORKOUT_ABSOLUTE_MIN)};
    if (suspendThreshold) {
        floors.push_back(suspendThreshold->quantity());
    }
    Quantity absoluteLowerBound = *std::max_element(floors.begin(), floors.end());
    Quantity recommendedLowerBound = std::max(absoluteLowerBound, correctionRangeScheduleRange.upperBound());

    return Guardrail(
        ClosedRange<Quantity>(absoluteLowerBound, glucose(CorrectionRangePolicy::WORKOUT_ABSOLUTE_MAX)),
        ClosedRange<Quantity>(recommendedLowerBound, glucose(CorrectionRangePolicy::WORKOUT_RECOMMENDED_MAX)),
        Unit::MilligramsPerDeciliter);
}

Guardrail preMealCorrectionRange(const ClosedRange<Quantity>& correctionRangeScheduleRange,
                                 const std::optional<GlucoseThreshold>& suspendThreshold) {
    Quantity maximum = glucose(CorrectionRangePolicy::PRE_MEAL_MAX);
    Quantity absoluteLowerBound = suspendThreshold
        ? suspendThreshold->quantity()
        : Guardrails::suspendThreshold().absoluteBounds().lowerBound();
    Quantity recommendedUpperBound =
        std::min(std::max(absoluteLowerBound, correctionRangeScheduleRange.lowerBound()), maximum);

    return Guardrail(
        ClosedRange<Quantity>(absoluteLowerBound, maximum),
        ClosedRange<Quantity>(absoluteLowerBound, recommendedUpperBound),
        Unit::MilligramsPerDeciliter);
}

} // namespace

const Guardrail& Guardrails::staticGuardrail(StaticSetting setting) {
    static const std::map<StaticSetting, Guardrail> table = buildStaticGuardrails();
    return table.at(setting);
}

Quantity Guardrails::maxSuspendThresholdValue(
    const std::optional<GlucoseRangeSchedule>& correctionRangeSchedule,
    const std::optional<ClosedRange<Quantity>>& preMealTargetRange,
    const std::optional<ClosedRange<Quantity>>& workoutTargetRange) {
    std::vector<Quantity> ceilings{suspendThreshold().absoluteBounds().upperBound()};
    if (correctionRangeSchedule) {
        ceilings.push_back(correctionRangeSchedule->minLowerBound());
    }
    if (preMealTargetRange) {
        ceilings.push_back(preMealTargetRange->lowerBound());
    }
    if (workoutTargetRange) {
        ceilings.push_back(workoutTargetRange->lowerBound());
    }
    return std::min_element(ceilings.begin(), ceilings.end())->convertedTo(Unit::MilligramsPerDeciliter);
}

Quantity Guardrails::maxSuspendThresholdValue(
    const std::optional<GlucoseRangeSchedule>& correctionRangeSchedule,
    const CorrectionRangeOverrides& overrides) {
    return maxSuspendThresholdValue(correctionRangeSchedule, overrides.preMeal, overrides.workout);
}

Quantity Guardrails::minCorrectionRangeValue(const std::optional<GlucoseThreshold>& suspendThreshold) {
    std::vector<Quantity> floors{correctionRange().absoluteBounds().lowerBound()};
    if (suspendThreshold) {
        floors.push_back(suspendThreshold->quantity());
    }
    return std::max_element(floors.begin(), floors.end())->convertedTo(Unit::MilligramsPerDeciliter);
}

Guardrail Guardrails::correctionRangeOverride(
    CorrectionRangeOverrides::Preset preset,
    const ClosedRange<Quantity>& correctionRangeScheduleRange,
    const std::optional<GlucoseThreshold>& suspendThreshold) {
    switch (preset) {
        case CorrectionRangeOverrides::Preset::Workout:
            return workoutCorrectionRange(correctionRangeScheduleRange, suspendThreshold);
        case CorrectionRangeOverrides::Preset::PreMeal:
            return preMealCorrectionRange(correctionRangeScheduleRange, suspendThreshold);
    }
    throw std::invalid_argument("Unknown correction range override preset");
}

Guardrail Guardrails::basalRate(std::span<const double> supportedBasalRates) {
    std::vector<double> allowed;
    std::copy_if(supportedBasalRates.begin(), supportedBasalRates.end(), std::back_inserter(allowed),
                 [](double rate) {
                     return rate >= BasalRatePolicy::SCHEDULED_MIN && rate <= BasalRatePolicy::SCHEDULED_MAX;
                 });
    if (allowed.empty()) {
        fail(GuardrailErrorCode::EmptyInputList, fmt::format(
            "None of {} supported basal rates lie within [{}, {}] U/hr",
            supportedBasalRates.size(), BasalRatePolicy::SCHEDULED_MIN, BasalRatePolicy::SCHEDULED_MAX));
    }
    Log::debug(std::source_location::current(), "Basal rate: {} of {} supported rates allowed",
               allowed.size(), supportedBasalRates.size());

    ClosedRange<double> bounds(allowed.front(), allowed.back());
    return Guardrail(bounds, bounds, Unit::InternationalUnitsPerHour,
                     BasalRatePolicy::SCHEDULED_STARTING_SUGGESTION);
}

Guardrail Guardrails::maximumBasalRate(
    std::span<const double> supportedBasalRates,
    const std::optional<ClosedRange<double>>& scheduledBasalRange,
    std::optional<double> lowestCarbRatio,
    int decimalPlaces) {
    if (supportedBasalRates.empty()) {
        fail(GuardrailErrorCode::EmptyInputList, "No supported basal rates for maximum basal rate");
    }
    if (lowestCarbRatio && !(*lowestCarbRatio > 0.0)) {
        throw std::invalid_argument("Lowest carb ratio must be positive");
    }

    double carbRatioFloor = lowestCarbRatio.value_or(
        carbRatio().absoluteBounds().lowerBound().doubleValue(Unit::GramsPerUnit));
    double maximumUpperBound = BasalRatePolicy::MAXIMUM_DAILY_UNITS / carbRatioFloor;
    double absoluteUpperBound = matchingOrTruncatedValue(maximumUpperBound, supportedBasalRates, decimalPlaces);
    Log::debug(std::source_location::current(), "Maximum basal rate ceiling {} snapped to {}",
               maximumUpperBound, absoluteUpperBound);

    if (scheduledBasalRange) {
        double highestScheduledBasalRate = scheduledBasalRange->upperBound();
        double recommendedLowerBound = matchingOrTruncatedValue(
            BasalRatePolicy::RECOMMENDED_LOW_SCALE_FACTOR * highestScheduledBasalRate,
            supportedBasalRates, decimalPlaces);
        double recommendedUpperBound = matchingOrTruncatedValue(
            BasalRatePolicy::RECOMMENDED_HIGH_SCALE_FACTOR * highestScheduledBasalRate,
            supportedBasalRates, decimalPlaces);

        ClosedRange<double> absoluteBounds(highestScheduledBasalRate, absoluteUpperBound);
        ClosedRange<double> recommendedBounds =
            ClosedRange<double>(recommendedLowerBound, recommendedUpperBound).clamped(absoluteBounds);
        return Guardrail(absoluteBounds, recommendedBounds, Unit::InternationalUnitsPerHour);
    }

    ClosedRange<double> bounds(supportedBasalRates.front(), absoluteUpperBound);
    return Guardrail(bounds, bounds, Unit::InternationalUnitsPerHour,
                     BasalRatePolicy::MAXIMUM_STARTING_SUGGESTION);
}

Guardrail Guardrails::maximumBolus(std::span<const double> supportedBolusVolumes) {
    std::vector<double> allowed;
    std::copy_if(supportedBolusVolumes.begin(), supportedBolusVolumes.end(), std::back_inserter(allowed),
                 [](double volume) { return volume > 0.0 && volume <= BolusPolicy::MAXIMUM_UNITS; });
    if (allowed.size() < 2) {
        fail(GuardrailErrorCode::EmptyInputList, fmt::format(
            "Maximum bolus needs at least two supported volumes within (0, {}] U, found {}",
            BolusPolicy::MAXIMUM_UNITS, allowed.size()));
    }

    auto belowWarning = std::find_if(allowed.rbegin(), allowed.rend(),
                                     [](double volume) { return volume < BolusPolicy::WARNING_UNITS; });
    if (belowWarning == allowed.rend()) {
        fail(GuardrailErrorCode::EmptyInputList, fmt::format(
            "No supported bolus volume below {} U", BolusPolicy::WARNING_UNITS));
    }

    return Guardrail(
        ClosedRange<double>(allowed.front(), allowed.back()),
        ClosedRange<double>(allowed[1], *belowWarning),
        Unit::InternationalUnit,
        BolusPolicy::STARTING_SUGGESTION);
}

} // namespace loopguard
