#pragma once

#include <optional>

#include "../ClosedRange.hpp"
#include "../Quantity.hpp"

namespace loopguard::settings {

/**
 * Temporary correction range targets the user can switch to.
 */
struct CorrectionRangeOverrides {
    enum class Preset {
        PreMeal,
        Workout
    };

    std::optional<ClosedRange<Quantity>> preMeal;
    std::optional<ClosedRange<Quantity>> workout;

    const std::optional<ClosedRange<Quantity>>& rangeFor(Preset preset) const {
        return preset == Preset::PreMeal ? preMeal : workout;
    }
};

[[nodiscard]] constexpr const char* toString(CorrectionRangeOverrides::Preset preset) noexcept {
    switch (preset) {
        case CorrectionRangeOverrides::Preset::PreMeal: return "pre_meal";
        case CorrectionRangeOverrides::Preset::Workout: return "workout";
    }
    return "unknown";
}

} // namespace loopguard::settings
