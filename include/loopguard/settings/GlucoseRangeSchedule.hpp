#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../ClosedRange.hpp"
#include "../Quantity.hpp"

namespace loopguard::settings {

/**
 * Daily correction range schedule.
 *
 * Only the aggregate bounds are exposed; looking up the range in effect at
 * a given time of day is left to the consumer.
 */
class GlucoseRangeSchedule {
public:
    static constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

    struct Item {
        int64_t startTimeSeconds;  ///< Offset from midnight
        ClosedRange<double> range;
    };

    /**
     * @throws std::invalid_argument unless items is non-empty, starts at
     *         midnight and has strictly increasing start times within one day
     */
    GlucoseRangeSchedule(Unit unit, std::vector<Item> items);

    Unit getUnit() const { return unit_; }
    const std::vector<Item>& getItems() const { return items_; }

    /**
     * The lowest lower bound across every item.
     */
    Quantity minLowerBound() const;

    /**
     * From the lowest lower bound to the highest upper bound.
     */
    ClosedRange<Quantity> scheduleRange() const;

    std::string toString() const;

private:
    Unit unit_;
    std::vector<Item> items_;
};

} // namespace loopguard::settings
