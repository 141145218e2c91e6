#include "agenda/core/TimeInterval.hpp"

#include <algorithm>

namespace agenda {
namespace core {

IntervalList mergeIntervals(IntervalList intervals)
{
    IntervalList merged;
    if (intervals.empty()) {
        return merged;
    }
    std::sort(intervals.begin(), intervals.end(), [](const TimeInterval &lhs, const TimeInterval &rhs) {
        return lhs.start < rhs.start;
    });

    merged.reserve(intervals.size());
    merged.push_back(intervals.front());
    for (auto it = intervals.begin() + 1; it != intervals.end(); ++it) {
        TimeInterval &last = merged.back();
        if (it->start <= last.end) {
            last.end = std::max(last.end, it->end);
        } else {
            merged.push_back(*it);
        }
    }
    return merged;
}

IntervalList subtractIntervals(const IntervalList &base, const IntervalList &busy)
{
    IntervalList gaps;
    for (const TimeInterval &window : base) {
        QDateTime cursor = window.start;
        for (const TimeInterval &blocked : busy) {
            if (!(blocked.start < window.end && blocked.end > window.start)) {
                continue;
            }
            if (blocked.start > cursor) {
                gaps.push_back({cursor, std::min(blocked.start, window.end)});
            }
            cursor = std::max(cursor, blocked.end);
            if (cursor >= window.end) {
                break;
            }
        }
        if (cursor < window.end) {
            gaps.push_back({cursor, window.end});
        }
    }
    return gaps;
}

} // namespace core
} // namespace agenda
