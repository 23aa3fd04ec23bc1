/**
 * @file TimeSlotScheduler.cpp
 * @brief Implementation of TimeSlotScheduler.
 */

#include "application/TimeSlotScheduler.hpp"

namespace trekplanner::application {

TimeSlotScheduler::TimeSlotScheduler(SchedulerOptions options) : m_options(options) {
    if (m_options.alignmentMinutes < 1) {
        m_options.alignmentMinutes = 1;
    }
}

int TimeSlotScheduler::baseDuration(int totalMinutes, size_t n) const {
    if (n == 0 || totalMinutes <= 0) return 0;
    const int base = totalMinutes / static_cast<int>(n);
    const int aligned = (base / m_options.alignmentMinutes) * m_options.alignmentMinutes;
    return aligned > 0 ? aligned : base;
}

std::vector<TimeSlot> TimeSlotScheduler::schedule(domain::TimeOfDay start, domain::TimeOfDay end, size_t n) const {
    std::vector<TimeSlot> slots;
    const int total = end.minutes() - start.minutes();
    const int base = baseDuration(total, n);
    if (base == 0) return slots;

    slots.reserve(n);
    int cursor = start.minutes();
    for (size_t i = 0; i < n; ++i) {
        const int next = (i + 1 == n) ? end.minutes() : cursor + base;
        // Both bounds lie inside [start, end], so FromMinutes cannot fail here.
        slots.push_back({*domain::TimeOfDay::FromMinutes(cursor), *domain::TimeOfDay::FromMinutes(next)});
        cursor = next;
    }
    return slots;
}

} // namespace trekplanner::application
