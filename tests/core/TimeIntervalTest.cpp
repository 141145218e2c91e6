#include <QtTest/QtTest>

#include "agenda/core/TimeInterval.hpp"

using namespace agenda::core;

namespace {

QDateTime at(int hour, int minute = 0)
{
    return QDateTime(QDate(2025, 3, 3), QTime(hour, minute), Qt::UTC);
}

TimeInterval span(int fromHour, int fromMinute, int toHour, int toMinute)
{
    return {at(fromHour, fromMinute), at(toHour, toMinute)};
}

bool covered(const QDateTime &point, const IntervalList &intervals)
{
    for (const TimeInterval &interval : intervals) {
        if (interval.start <= point && point < interval.end) {
            return true;
        }
    }
    return false;
}

} // namespace

class TimeIntervalTest : public QObject
{
    Q_OBJECT

private slots:
    void mergeEmpty();
    void mergeOverlappingAndTouching();
    void mergeKeepsGaps();
    void mergeIsIdempotent();
    void subtractMiddle();
    void subtractFullCover();
    void subtractDisjoint();
    void subtractResultLiesOutsideBusy();
};

void TimeIntervalTest::mergeEmpty()
{
    QVERIFY(mergeIntervals({}).empty());
}

void TimeIntervalTest::mergeOverlappingAndTouching()
{
    const IntervalList merged = mergeIntervals({span(10, 0, 11, 0), span(8, 0, 9, 0), span(9, 0, 9, 30), span(10, 30, 10, 45)});
    QCOMPARE(merged.size(), static_cast<size_t>(2));
    QVERIFY(merged[0] == span(8, 0, 9, 30));
    QVERIFY(merged[1] == span(10, 0, 11, 0));
}

void TimeIntervalTest::mergeKeepsGaps()
{
    const IntervalList merged = mergeIntervals({span(8, 0, 8, 30), span(8, 31, 9, 0)});
    QCOMPARE(merged.size(), static_cast<size_t>(2));
}

void TimeIntervalTest::mergeIsIdempotent()
{
    const std::vector<IntervalList> samples = {
        {},
        {span(8, 0, 9, 0)},
        {span(12, 0, 13, 0), span(8, 0, 9, 0), span(8, 30, 12, 0)},
        {span(8, 0, 8, 15), span(8, 15, 8, 30), span(9, 0, 9, 5), span(8, 50, 9, 1)},
    };
    for (const IntervalList &sample : samples) {
        const IntervalList once = mergeIntervals(sample);
        QVERIFY(mergeIntervals(once) == once);
    }
}

void TimeIntervalTest::subtractMiddle()
{
    const IntervalList gaps = subtractIntervals({span(8, 0, 12, 0)}, {span(9, 0, 10, 0)});
    QCOMPARE(gaps.size(), static_cast<size_t>(2));
    QVERIFY(gaps[0] == span(8, 0, 9, 0));
    QVERIFY(gaps[1] == span(10, 0, 12, 0));
}

void TimeIntervalTest::subtractFullCover()
{
    const IntervalList gaps = subtractIntervals({span(8, 0, 12, 0), span(14, 0, 15, 0)}, {span(7, 0, 12, 30)});
    QCOMPARE(gaps.size(), static_cast<size_t>(1));
    QVERIFY(gaps[0] == span(14, 0, 15, 0));
}

void TimeIntervalTest::subtractDisjoint()
{
    const IntervalList base = {span(8, 0, 12, 0), span(14, 0, 19, 0)};
    QVERIFY(subtractIntervals(base, {span(12, 0, 14, 0), span(19, 0, 20, 0)}) == base);
}

void TimeIntervalTest::subtractResultLiesOutsideBusy()
{
    const IntervalList base = {span(8, 0, 12, 0), span(14, 0, 19, 0)};
    const IntervalList busy = mergeIntervals(
        {span(7, 30, 8, 20), span(9, 0, 9, 30), span(9, 15, 10, 0), span(11, 45, 14, 15), span(18, 0, 18, 30)});
    const IntervalList gaps = subtractIntervals(base, busy);
    QVERIFY(!gaps.empty());

    for (const TimeInterval &gap : gaps) {
        QVERIFY(gap.start < gap.end);
        for (QDateTime point = gap.start; point < gap.end; point = point.addSecs(5 * 60)) {
            QVERIFY(covered(point, base));
            QVERIFY(!covered(point, busy));
        }
    }
    // Everything in base that is not busy shows up in some gap.
    for (const TimeInterval &window : base) {
        for (QDateTime point = window.start; point < window.end; point = point.addSecs(5 * 60)) {
            QCOMPARE(covered(point, gaps), !covered(point, busy));
        }
    }
}

QTEST_GUILESS_MAIN(TimeIntervalTest)
#include "TimeIntervalTest.moc"
