#pragma once

namespace loopguard {

/**
 * Library version information.
 * Defined here (not in LoopGuard.hpp) to avoid circular dependencies with ApiSchema.hpp.
 */
struct Version {
    static constexpr int MAJOR = 0;
    static constexpr int MINOR = 3;
    static constexpr int PATCH = 0;
    static constexpr const char* STRING = "0.3.0";
};

/**
 * Suspend threshold limits, in mg/dL.
 */
struct SuspendThresholdPolicy {
    static constexpr double ABSOLUTE_MIN = 67.0;
    static constexpr double ABSOLUTE_MAX = 110.0;
    static constexpr double RECOMMENDED_MIN = 74.0;
    static constexpr double RECOMMENDED_MAX = 80.0;
    static constexpr double STARTING_SUGGESTION = 80.0;
};

/**
 * Correction range limits, in mg/dL.
 */
struct CorrectionRangePolicy {
    static constexpr double ABSOLUTE_MIN = 87.0;
    static constexpr double ABSOLUTE_MAX = 180.0;
    static constexpr double RECOMMENDED_MIN = 101.0;
    static constexpr double RECOMMENDED_MAX = 115.0;
    static constexpr double STARTING_SUGGESTION = 100.0;

    // Workout override, before the suspend threshold and schedule constrain it
    static constexpr double WORKOUT_ABSOLUTE_MIN = 85.0;
    static constexpr double WORKOUT_ABSOLUTE_MAX = 250.0;
    static constexpr double WORKOUT_RECOMMENDED_MIN = 101.0;
    static constexpr double WORKOUT_RECOMMENDED_MAX = 180.0;

    static constexpr double PRE_MEAL_MAX = 130.0;
};

/**
 * Insulin sensitivity limits, in mg/dL per unit.
 */
struct InsulinSensitivityPolicy {
    static constexpr double ABSOLUTE_MIN = 10.0;
    static constexpr double ABSOLUTE_MAX = 500.0;
    static constexpr double RECOMMENDED_MIN = 16.0;
    static constexpr double RECOMMENDED_MAX = 399.0;
    static constexpr double STARTING_SUGGESTION = 50.0;
};

/**
 * Carb ratio limits, in grams per unit.
 */
struct CarbRatioPolicy {
    static constexpr double ABSOLUTE_MIN = 2.0;
    static constexpr double ABSOLUTE_MAX = 150.0;
    static constexpr double RECOMMENDED_MIN = 4.0;
    static constexpr double RECOMMENDED_MAX = 28.0;
    static constexpr double STARTING_SUGGESTION = 15.0;
};

/**
 * Scheduled and maximum basal rate limits, in U/hr.
 */
struct BasalRatePolicy {
    static constexpr double SCHEDULED_MIN = 0.05;
    static constexpr double SCHEDULED_MAX = 30.0;
    static constexpr double SCHEDULED_STARTING_SUGGESTION = 0.0;

    // Daily insulin proxy divided by the most aggressive carb ratio
    static constexpr double MAXIMUM_DAILY_UNITS = 70.0;
    static constexpr double RECOMMENDED_LOW_SCALE_FACTOR = 2.1;
    static constexpr double RECOMMENDED_HIGH_SCALE_FACTOR = 6.4;
    static constexpr double MAXIMUM_STARTING_SUGGESTION = 3.0;

    static constexpr int DEFAULT_DECIMAL_PLACES = 3;
};

/**
 * Maximum bolus limits, in units.
 */
struct BolusPolicy {
    static constexpr double MAXIMUM_UNITS = 30.0;
    static constexpr double WARNING_UNITS = 20.0;
    static constexpr double STARTING_SUGGESTION = 5.0;
};

} // namespace loopguard
