/**
 * @file TimeSlotScheduler.hpp
 * @brief Tiles a time window with contiguous slots.
 */

#pragma once

#include <vector>

#include "domain/TimeOfDay.hpp"

namespace trekplanner::application {

struct TimeSlot {
    domain::TimeOfDay start;
    domain::TimeOfDay end;
};

struct SchedulerOptions {
    int alignmentMinutes = 1; ///< Intermediate slot lengths are multiples of this when possible.
};

/**
 * @class TimeSlotScheduler
 * @brief Splits [start, end] into n slots of floor(total / n) minutes; the last
 *        slot absorbs the remainder and always ends exactly at end.
 */
class TimeSlotScheduler {
public:
    explicit TimeSlotScheduler(SchedulerOptions options = {});

    /**
     * @return n slots aligned positionally with the caller's POI list, or an
     *         empty vector when n == 0, start >= end, or the window has fewer
     *         minutes than slots.
     */
    std::vector<TimeSlot> schedule(domain::TimeOfDay start, domain::TimeOfDay end, size_t n) const;

    /** @brief Length of every slot but the last, or 0 if the window cannot hold n slots. */
    int baseDuration(int totalMinutes, size_t n) const;

private:
    SchedulerOptions m_options;
};

} // namespace trekplanner::application
