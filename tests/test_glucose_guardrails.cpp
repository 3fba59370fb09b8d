/**
 * @file test_glucose_guardrails.cpp
 * @brief Unit tests for suspend threshold, correction range and override guardrails
 */

#include <catch2/catch_all.hpp>
#include <loopguard/Guardrails.hpp>
#include <loopguard/GuardrailError.hpp>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace loopguard;
using namespace loopguard::settings;

namespace {

Quantity mgdl(double value) {
    return Quantity(Unit::MilligramsPerDeciliter, value);
}

ClosedRange<Quantity> mgdlRange(double lower, double upper) {
    return ClosedRange<Quantity>(mgdl(lower), mgdl(upper));
}

GlucoseRangeSchedule schedule(std::vector<GlucoseRangeSchedule::Item> items) {
    return GlucoseRangeSchedule(Unit::MilligramsPerDeciliter, std::move(items));
}

void checkOrdered(const Guardrail& guardrail) {
    CHECK(guardrail.absoluteBounds().lowerBound() <= guardrail.recommendedBounds().lowerBound());
    CHECK(guardrail.recommendedBounds().lowerBound() <= guardrail.recommendedBounds().upperBound());
    CHECK(guardrail.recommendedBounds().upperBound() <= guardrail.absoluteBounds().upperBound());
    if (guardrail.startingSuggestion()) {
        CHECK(guardrail.isWithinAbsoluteBounds(*guardrail.startingSuggestion()));
    }
}

} // namespace

// =============================================================================
// Static guardrails
// =============================================================================

TEST_CASE("Static guardrails are well ordered", "[Guardrails]") {
    for (auto setting : {StaticSetting::SuspendThreshold, StaticSetting::CorrectionRange,
                         StaticSetting::InsulinSensitivity, StaticSetting::CarbRatio}) {
        checkOrdered(Guardrails::staticGuardrail(setting));
    }
}

TEST_CASE("Static guardrail values", "[Guardrails]") {
    SECTION("Suspend threshold") {
        const auto& g = Guardrails::suspendThreshold();
        CHECK(g.unit() == Unit::MilligramsPerDeciliter);
        CHECK(g.absoluteBounds() == mgdlRange(67, 110));
        CHECK(g.recommendedBounds() == mgdlRange(74, 80));
        CHECK(*g.startingSuggestion() == mgdl(80));
    }

    SECTION("Correction range") {
        const auto& g = Guardrails::correctionRange();
        CHECK(g.absoluteBounds() == mgdlRange(87, 180));
        CHECK(g.recommendedBounds() == mgdlRange(101, 115));
        CHECK(*g.startingSuggestion() == mgdl(100));
    }

    SECTION("Insulin sensitivity") {
        const auto& g = Guardrails::insulinSensitivity();
        CHECK(g.unit() == Unit::MilligramsPerDeciliterPerUnit);
        CHECK(g.minValue().doubleValue(Unit::MilligramsPerDeciliterPerUnit) == 10.0);
        CHECK(g.maxValue().doubleValue(Unit::MilligramsPerDeciliterPerUnit) == 500.0);
        CHECK(g.recommendedBounds().lowerBound().doubleValue(Unit::MilligramsPerDeciliterPerUnit) == 16.0);
        CHECK(g.recommendedBounds().upperBound().doubleValue(Unit::MilligramsPerDeciliterPerUnit) == 399.0);
        CHECK(g.startingSuggestion()->doubleValue(Unit::MilligramsPerDeciliterPerUnit) == 50.0);
    }

    SECTION("Carb ratio") {
        const auto& g = Guardrails::carbRatio();
        CHECK(g.unit() == Unit::GramsPerUnit);
        CHECK(g.minValue().doubleValue(Unit::GramsPerUnit) == 2.0);
        CHECK(g.maxValue().doubleValue(Unit::GramsPerUnit) == 150.0);
        CHECK(g.recommendedBounds().lowerBound().doubleValue(Unit::GramsPerUnit) == 4.0);
        CHECK(g.recommendedBounds().upperBound().doubleValue(Unit::GramsPerUnit) == 28.0);
        CHECK(g.startingSuggestion()->doubleValue(Unit::GramsPerUnit) == 15.0);
    }

    SECTION("Accessors return the table entry") {
        CHECK(&Guardrails::carbRatio() == &Guardrails::staticGuardrail(StaticSetting::CarbRatio));
    }
}

// =============================================================================
// Suspend threshold ceiling
// =============================================================================

TEST_CASE("Guardrails::maxSuspendThresholdValue", "[Guardrails]") {
    SECTION("No targets configured") {
        CHECK(Guardrails::maxSuspendThresholdValue(std::nullopt, std::nullopt, std::nullopt) == mgdl(110));
    }

    SECTION("Schedule minimum lower bound") {
        auto s = schedule({{0, {100, 110}}, {8 * 3600, {95, 105}}, {20 * 3600, {105, 120}}});
        CHECK(Guardrails::maxSuspendThresholdValue(s, std::nullopt, std::nullopt) == mgdl(95));
    }

    SECTION("Schedule above the static maximum does not raise it") {
        auto s = schedule({{0, {150, 160}}});
        CHECK(Guardrails::maxSuspendThresholdValue(s, std::nullopt, std::nullopt) == mgdl(110));
    }

    SECTION("Pre-meal and workout floors") {
        auto s = schedule({{0, {100, 110}}});
        CHECK(Guardrails::maxSuspendThresholdValue(s, mgdlRange(80, 90), std::nullopt) == mgdl(80));
        CHECK(Guardrails::maxSuspendThresholdValue(s, std::nullopt, mgdlRange(140, 160)) == mgdl(100));
        CHECK(Guardrails::maxSuspendThresholdValue(std::nullopt, mgdlRange(90, 100), mgdlRange(85, 160)) == mgdl(85));
    }

    SECTION("Overrides struct overload") {
        CorrectionRangeOverrides overrides;
        overrides.preMeal = mgdlRange(78, 90);
        CHECK(Guardrails::maxSuspendThresholdValue(std::nullopt, overrides) == mgdl(78));
        CHECK(overrides.rangeFor(CorrectionRangeOverrides::Preset::PreMeal).has_value());
        CHECK_FALSE(overrides.rangeFor(CorrectionRangeOverrides::Preset::Workout).has_value());
    }

    SECTION("Inputs in mmol/L are compared and returned in mg/dL") {
        ClosedRange<Quantity> preMeal(Quantity(Unit::MillimolesPerLiter, 4.5), Quantity(Unit::MillimolesPerLiter, 5.0));
        Quantity result = Guardrails::maxSuspendThresholdValue(std::nullopt, preMeal, std::nullopt);
        CHECK(result.unit() == Unit::MilligramsPerDeciliter);
        CHECK(result.doubleValue(Unit::MilligramsPerDeciliter) == Catch::Approx(81.07016));
    }

    SECTION("Lowering a floor never raises the result") {
        auto s = schedule({{0, {100, 110}}});
        Quantity previous = Guardrails::maxSuspendThresholdValue(s, mgdlRange(120, 130), std::nullopt);
        for (double floor = 120; floor >= 60; floor -= 5) {
            Quantity current = Guardrails::maxSuspendThresholdValue(s, mgdlRange(floor, 130), std::nullopt);
            CHECK(current <= previous);
            previous = current;
        }
    }
}

// =============================================================================
// Correction range floor
// =============================================================================

TEST_CASE("Guardrails::minCorrectionRangeValue", "[Guardrails]") {
    SECTION("No suspend threshold") {
        CHECK(Guardrails::minCorrectionRangeValue(std::nullopt) ==
              Guardrails::correctionRange().absoluteBounds().lowerBound());
    }

    SECTION("Suspend threshold below the static minimum") {
        CHECK(Guardrails::minCorrectionRangeValue(GlucoseThreshold(Unit::MilligramsPerDeciliter, 75)) == mgdl(87));
    }

    SECTION("Suspend threshold above the static minimum") {
        CHECK(Guardrails::minCorrectionRangeValue(GlucoseThreshold(Unit::MilligramsPerDeciliter, 95)) == mgdl(95));
    }

    SECTION("Suspend threshold in mmol/L") {
        Quantity result = Guardrails::minCorrectionRangeValue(GlucoseThreshold(Unit::MillimolesPerLiter, 5.0));
        CHECK(result.doubleValue(Unit::MilligramsPerDeciliter) == Catch::Approx(90.07795));
    }
}

// =============================================================================
// Correction range overrides
// =============================================================================

TEST_CASE("Workout correction range override", "[Guardrails]") {
    using Preset = CorrectionRangeOverrides::Preset;

    SECTION("Suspend threshold below the workout minimum") {
        auto g = Guardrails::correctionRangeOverride(Preset::Workout, mgdlRange(100, 120),
                                                     GlucoseThreshold(Unit::MilligramsPerDeciliter, 75));
        CHECK(g.absoluteBounds() == mgdlRange(85, 250));
        CHECK(g.recommendedBounds() == mgdlRange(120, 180));
        CHECK_FALSE(g.startingSuggestion().has_value());
    }

    SECTION("Suspend threshold raises the absolute floor") {
        auto g = Guardrails::correctionRangeOverride(Preset::Workout, mgdlRange(90, 95),
                                                     GlucoseThreshold(Unit::MilligramsPerDeciliter, 100));
        CHECK(g.absoluteBounds() == mgdlRange(100, 250));
        CHECK(g.recommendedBounds() == mgdlRange(100, 180));
    }

    SECTION("No suspend threshold") {
        auto g = Guardrails::correctionRangeOverride(Preset::Workout, mgdlRange(100, 110), std::nullopt);
        CHECK(g.absoluteBounds() == mgdlRange(85, 250));
        CHECK(g.recommendedBounds() == mgdlRange(110, 180));
    }

    SECTION("Schedule overload uses the schedule range") {
        auto s = schedule({{0, {100, 110}}, {12 * 3600, {105, 125}}});
        auto g = Guardrails::correctionRangeOverride(Preset::Workout, s, std::nullopt);
        CHECK(g.recommendedBounds() == mgdlRange(125, 180));
    }

    SECTION("Correction range above the recommended ceiling cannot be bounded") {
        try {
            (void)Guardrails::correctionRangeOverride(Preset::Workout, mgdlRange(100, 200), std::nullopt);
            FAIL("Expected GuardrailError");
        } catch (const GuardrailError& e) {
            CHECK(e.code() == GuardrailErrorCode::InvariantViolation);
        }
    }
}

TEST_CASE("Pre-meal correction range override", "[Guardrails]") {
    using Preset = CorrectionRangeOverrides::Preset;

    SECTION("No suspend threshold falls back to the suspend threshold minimum") {
        auto g = Guardrails::correctionRangeOverride(Preset::PreMeal, mgdlRange(95, 110), std::nullopt);
        CHECK(g.absoluteBounds() == mgdlRange(67, 130));
        CHECK(g.recommendedBounds() == mgdlRange(67, 95));
    }

    SECTION("Suspend threshold above the schedule floor") {
        auto g = Guardrails::correctionRangeOverride(Preset::PreMeal, mgdlRange(70, 110),
                                                     GlucoseThreshold(Unit::MilligramsPerDeciliter, 80));
        CHECK(g.absoluteBounds() == mgdlRange(80, 130));
        CHECK(g.recommendedBounds() == mgdlRange(80, 80));
    }

    SECTION("Schedule floor above the pre-meal maximum") {
        auto g = Guardrails::correctionRangeOverride(Preset::PreMeal, mgdlRange(150, 160), std::nullopt);
        CHECK(g.recommendedBounds() == mgdlRange(67, 130));
    }

    SECTION("Every result is well ordered") {
        for (double lower = 60; lower <= 180; lower += 10) {
            checkOrdered(Guardrails::correctionRangeOverride(Preset::PreMeal, mgdlRange(lower, 180),
                                                             GlucoseThreshold(Unit::MilligramsPerDeciliter, 75)));
        }
    }
}

TEST_CASE("Glucose inputs must be finite", "[Guardrails]") {
    using Preset = CorrectionRangeOverrides::Preset;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("NaN suspend threshold") {
        try {
            (void)Guardrails::correctionRangeOverride(Preset::PreMeal, mgdlRange(95, 110),
                                                      GlucoseThreshold(Unit::MilligramsPerDeciliter, nan));
            FAIL("Expected GuardrailError");
        } catch (const GuardrailError& e) {
            CHECK(e.code() == GuardrailErrorCode::InvariantViolation);
        }
    }

    SECTION("Infinite suspend threshold") {
        CHECK_THROWS_AS(GlucoseThreshold(Unit::MilligramsPerDeciliter, std::numeric_limits<double>::infinity()),
                        GuardrailError);
    }

    SECTION("Suspend threshold needs a glucose unit") {
        CHECK_THROWS_AS(GlucoseThreshold(Unit::GramsPerUnit, 80), std::invalid_argument);
    }

    SECTION("NaN override range") {
        CHECK_THROWS_AS(Guardrails::maxSuspendThresholdValue(std::nullopt, mgdlRange(nan, 100), std::nullopt),
                        GuardrailError);
    }

    SECTION("NaN schedule entry") {
        CHECK_THROWS_AS(schedule({{0, {nan, 110}}}), GuardrailError);
    }
}

// =============================================================================
// Correction range schedule
// =============================================================================

TEST_CASE("GlucoseRangeSchedule", "[GlucoseRangeSchedule]") {
    SECTION("Aggregate bounds") {
        auto s = schedule({{0, {100, 110}}, {6 * 3600, {90, 100}}, {18 * 3600, {110, 140}}});
        CHECK(s.minLowerBound() == mgdl(90));
        CHECK(s.scheduleRange() == mgdlRange(90, 140));
    }

    SECTION("Invalid schedules are rejected") {
        CHECK_THROWS_AS(schedule({}), std::invalid_argument);
        CHECK_THROWS_AS(schedule({{60, {100, 110}}}), std::invalid_argument);
        CHECK_THROWS_AS(schedule({{0, {100, 110}}, {0, {90, 100}}}), std::invalid_argument);
        CHECK_THROWS_AS(schedule({{0, {100, 110}}, {GlucoseRangeSchedule::SECONDS_PER_DAY, {90, 100}}}),
                        std::invalid_argument);
        CHECK_THROWS_AS(GlucoseRangeSchedule(Unit::GramsPerUnit, {{0, {10, 20}}}), std::invalid_argument);
    }
}
