#pragma once

#include <optional>
#include <span>

#include "ClosedRange.hpp"
#include "Guardrail.hpp"
#include "GuardrailPolicy.hpp"
#include "Quantity.hpp"
#include "settings/CorrectionRangeOverrides.hpp"
#include "settings/GlucoseRangeSchedule.hpp"
#include "settings/GlucoseThreshold.hpp"

namespace loopguard {

/**
 * Settings whose guardrail does not depend on any other setting.
 */
enum class StaticSetting {
    SuspendThreshold,
    CorrectionRange,
    InsulinSensitivity,
    CarbRatio
};

/**
 * Guardrail derivation for every therapy setting.
 *
 * All functions are pure: they read only their arguments and the fixed
 * policy in GuardrailPolicy.hpp, and may be called from any thread.
 * Derivations that cannot produce bounds throw GuardrailError.
 */
class Guardrails {
public:
    /**
     * Fixed guardrail for a setting, from a table built on first use.
     */
    [[nodiscard]] static const Guardrail& staticGuardrail(StaticSetting setting);

    // ------------------------------------------------------------------------
    // Glucose targets
    // ------------------------------------------------------------------------

    [[nodiscard]] static const Guardrail& suspendThreshold() {
        return staticGuardrail(StaticSetting::SuspendThreshold);
    }

    /**
     * Highest suspend threshold allowed by the configured targets: the lowest
     * of the static maximum and every present range's lower bound. Absent
     * inputs are ignored. Result is in mg/dL.
     */
    [[nodiscard]] static Quantity maxSuspendThresholdValue(
        const std::optional<settings::GlucoseRangeSchedule>& correctionRangeSchedule,
        const std::optional<ClosedRange<Quantity>>& preMealTargetRange,
        const std::optional<ClosedRange<Quantity>>& workoutTargetRange);

    [[nodiscard]] static Quantity maxSuspendThresholdValue(
        const std::optional<settings::GlucoseRangeSchedule>& correctionRangeSchedule,
        const settings::CorrectionRangeOverrides& overrides);

    [[nodiscard]] static const Guardrail& correctionRange() {
        return staticGuardrail(StaticSetting::CorrectionRange);
    }

    /**
     * Lowest correction range value: the static minimum, raised to the
     * suspend threshold when one is set. Result is in mg/dL.
     */
    [[nodiscard]] static Quantity minCorrectionRangeValue(
        const std::optional<settings::GlucoseThreshold>& suspendThreshold);

    /**
     * Guardrail for a pre-meal or workout override target.
     *
     * @param preset which override to derive
     * @param correctionRangeScheduleRange lowest lower to highest upper bound
     *        of the regular correction range schedule
     * @param suspendThreshold current suspend threshold, if configured
     */
    [[nodiscard]] static Guardrail correctionRangeOverride(
        settings::CorrectionRangeOverrides::Preset preset,
        const ClosedRange<Quantity>& correctionRangeScheduleRange,
        const std::optional<settings::GlucoseThreshold>& suspendThreshold);

    [[nodiscard]] static Guardrail correctionRangeOverride(
        settings::CorrectionRangeOverrides::Preset preset,
        const settings::GlucoseRangeSchedule& correctionRangeSchedule,
        const std::optional<settings::GlucoseThreshold>& suspendThreshold) {
        return correctionRangeOverride(preset, correctionRangeSchedule.scheduleRange(), suspendThreshold);
    }

    // ------------------------------------------------------------------------
    // Insulin dosing
    // ------------------------------------------------------------------------

    [[nodiscard]] static const Guardrail& insulinSensitivity() {
        return staticGuardrail(StaticSetting::InsulinSensitivity);
    }

    [[nodiscard]] static const Guardrail& carbRatio() {
        return staticGuardrail(StaticSetting::CarbRatio);
    }

    /**
     * Scheduled basal rate bounds: the extremes of the supported rates
     * that fall within [0.05, 30] U/hr.
     * @throws GuardrailError EmptyInputList if no supported rate is in range
     */
    [[nodiscard]] static Guardrail basalRate(std::span<const double> supportedBasalRates);

    /**
     * Maximum basal rate bounds.
     *
     * The ceiling is 70 U divided by the lowest carb ratio (or the static
     * carb ratio minimum), truncated to a supported rate. With a scheduled
     * basal range the floor is its highest rate and the recommended range
     * scales that rate by 2.1 and 6.4; otherwise both ranges start at the
     * first supported rate.
     */
    [[nodiscard]] static Guardrail maximumBasalRate(
        std::span<const double> supportedBasalRates,
        const std::optional<ClosedRange<double>>& scheduledBasalRange,
        std::optional<double> lowestCarbRatio,
        int decimalPlaces = BasalRatePolicy::DEFAULT_DECIMAL_PLACES);

    /**
     * Maximum bolus bounds over the supported volumes in (0, 30] U. The
     * recommended range skips the smallest volume and stops below 20 U.
     * @throws GuardrailError EmptyInputList unless at least two volumes are
     *         in range and one of them is below 20 U
     */
    [[nodiscard]] static Guardrail maximumBolus(std::span<const double> supportedBolusVolumes);

private:
    Guardrails() = delete; // Static utility class
};

} // namespace loopguard
