#pragma once

#include <vector>

#include <QDateTime>

namespace agenda {
namespace core {

// Half-open [start, end).
struct TimeInterval
{
    QDateTime start;
    QDateTime end;

    bool overlaps(const TimeInterval &other) const { return start < other.end && end > other.start; }
    bool contains(const TimeInterval &other) const { return start <= other.start && other.end <= end; }
    qint64 durationSecs() const { return start.secsTo(end); }

    bool operator==(const TimeInterval &other) const { return start == other.start && end == other.end; }
    bool operator!=(const TimeInterval &other) const { return !(*this == other); }
};

using IntervalList = std::vector<TimeInterval>;

// Sorts by start and folds overlapping or touching intervals together.
IntervalList mergeIntervals(IntervalList intervals);

// Parts of each base interval not covered by any busy interval. Base must be
// sorted and disjoint; busy must be the output of mergeIntervals.
IntervalList subtractIntervals(const IntervalList &base, const IntervalList &busy);

} // namespace core
} // namespace agenda
