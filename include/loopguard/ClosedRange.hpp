#pragma once

#include <utility>

#include "GuardrailError.hpp"

namespace loopguard {

/**
 * Inclusive interval [lower, upper] over any totally ordered type.
 * Construction rejects lower > upper and bounds that do not compare,
 * such as NaN.
 */
template<typename T>
class ClosedRange {
public:
    ClosedRange(T lower, T upper)
        : lower_(std::move(lower))
        , upper_(std::move(upper))
    {
        if (!(lower_ <= upper_)) {
            throw GuardrailError(GuardrailErrorCode::InvariantViolation,
                                 "ClosedRange lower bound must not exceed upper bound");
        }
    }

    const T& lowerBound() const { return lower_; }
    const T& upperBound() const { return upper_; }

    bool contains(const T& value) const {
        return lower_ <= value && value <= upper_;
    }

    bool contains(const ClosedRange& other) const {
        return contains(other.lower_) && contains(other.upper_);
    }

    /**
     * Each bound pulled into limits. A range disjoint from limits
     * collapses onto the nearer limit.
     */
    ClosedRange clamped(const ClosedRange& limits) const {
        return ClosedRange(clampInto(lower_, limits), clampInto(upper_, limits));
    }

    bool operator==(const ClosedRange& other) const {
        return lower_ == other.lower_ && upper_ == other.upper_;
    }
    bool operator!=(const ClosedRange& other) const { return !(*this == other); }

private:
    static const T& clampInto(const T& value, const ClosedRange& limits) {
        if (value < limits.lower_) return limits.lower_;
        if (limits.upper_ < value) return limits.upper_;
        return value;
    }

    T lower_;
    T upper_;
};

} // namespace loopguard
