#include "loopguard/settings/GlucoseRangeSchedule.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace loopguard::settings {

GlucoseRangeSchedule::GlucoseRangeSchedule(Unit unit, std::vector<Item> items)
    : unit_(unit)
    , items_(std::move(items))
{
    if (dimensionOf(unit_) != Dimension::BloodGlucose) {
        throw std::invalid_argument("Glucose range schedule requires a blood glucose unit");
    }
    if (items_.empty()) {
        throw std::invalid_argument("Glucose range schedule must contain at least one item");
    }
    if (items_.front().startTimeSeconds != 0) {
        throw std::invalid_argument("Glucose range schedule must start at midnight");
    }
    for (size_t i = 1; i < items_.size(); ++i) {
        if (items_[i].startTimeSeconds <= items_[i - 1].startTimeSeconds) {
            throw std::invalid_argument("Glucose range schedule start times must be strictly increasing");
        }
    }
    if (items_.back().startTimeSeconds >= SECONDS_PER_DAY) {
        throw std::invalid_argument("Glucose range schedule start times must fall within one day");
    }
}

Quantity GlucoseRangeSchedule::minLowerBound() const {
    auto it = std::min_element(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
        return a.range.lowerBound() < b.range.lowerBound();
    });
    return Quantity(unit_, it->range.lowerBound());
}

ClosedRange<Quantity> GlucoseRangeSchedule::scheduleRange() const {
    auto highest = std::max_element(items_.begin(), items_.end(), [](const Item& a, const Item& b) {
        return a.range.upperBound() < b.range.upperBound();
    });
    return ClosedRange<Quantity>(minLowerBound(), Quantity(unit_, highest->range.upperBound()));
}

std::string GlucoseRangeSchedule::toString() const {
    std::string entries;
    for (const auto& item : items_) {
        if (!entries.empty()) {
            entries += ", ";
        }
        entries += fmt::format("{}s:{}-{}", item.startTimeSeconds, item.range.lowerBound(), item.range.upperBound());
    }
    return fmt::format("GlucoseRangeSchedule[unit:{}, items:[{}]]", loopguard::toString(unit_), entries);
}

} // namespace loopguard::settings
