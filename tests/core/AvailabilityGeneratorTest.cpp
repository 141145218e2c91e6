#include <QtTest/QtTest>

#include <algorithm>

#include "agenda/core/AvailabilityGenerator.hpp"
#include "agenda/core/BusinessHours.hpp"

using namespace agenda;

namespace {

const QDate kDay(2025, 3, 3);

QDateTime at(int hour, int minute = 0)
{
    return QDateTime(kDay, QTime(hour, minute), Qt::UTC);
}

data::Appointment booking(int id, const QDateTime &start, int minutes,
                          data::AppointmentStatus status = data::AppointmentStatus::Scheduled)
{
    data::Appointment appointment;
    appointment.id = id;
    appointment.customerRef = 1;
    appointment.providerId = 1;
    appointment.start = start;
    appointment.durationMinutes = minutes;
    appointment.status = status;
    return appointment;
}

core::AvailabilityRequest request(int duration, int step, int buffer = 0)
{
    core::AvailabilityRequest r;
    r.providerId = 1;
    r.day = kDay;
    r.durationMinutes = duration;
    r.stepMinutes = step;
    r.bufferMinutes = buffer;
    return r;
}

bool hasStart(const std::vector<core::Slot> &slots, const QDateTime &start)
{
    return std::any_of(slots.begin(), slots.end(), [&](const core::Slot &slot) { return slot.start == start; });
}

} // namespace

class AvailabilityGeneratorTest : public QObject
{
    Q_OBJECT

private slots:
    void morningExample();
    void cancelledBookingFreesSlot();
    void bufferExtendsBusyTime();
    void slotsFitInsideFreeIntervals();
    void shortGapYieldsNothing();
    void rejectsNonPositiveStep();
    void sequenceIsRestartable();
    void openingHoursOnDay();
};

void AvailabilityGeneratorTest::morningExample()
{
    const core::IntervalList hours = {{at(8), at(12)}};
    const std::vector<data::Appointment> existing = {booking(1, at(8, 0), 30)};
    const auto slots = core::generateSlots(request(30, 15), hours, existing, core::TimeReference()).toVector();

    QVERIFY(!hasStart(slots, at(8, 0)));
    QVERIFY(!hasStart(slots, at(8, 15)));
    QVERIFY(hasStart(slots, at(8, 30)));
    QCOMPARE(slots.front().start, at(8, 30));
    QCOMPARE(slots.back().start, at(11, 30));
    QCOMPARE(slots.back().end, at(12, 0));
    // 08:30 .. 11:30 every 15 minutes.
    QCOMPARE(slots.size(), static_cast<size_t>(13));
}

void AvailabilityGeneratorTest::cancelledBookingFreesSlot()
{
    const core::IntervalList hours = {{at(8), at(12)}};
    const std::vector<data::Appointment> existing = {
        booking(1, at(8, 0), 30, data::AppointmentStatus::Cancelled),
        booking(2, at(9, 0), 30, data::AppointmentStatus::NoShow),
    };
    const auto slots = core::generateSlots(request(30, 15), hours, existing, core::TimeReference()).toVector();
    QVERIFY(hasStart(slots, at(8, 0)));
    QVERIFY(hasStart(slots, at(9, 0)));
    QCOMPARE(slots.size(), static_cast<size_t>(15));
}

void AvailabilityGeneratorTest::bufferExtendsBusyTime()
{
    const core::IntervalList hours = {{at(8), at(10)}};
    const std::vector<data::Appointment> existing = {booking(1, at(8, 0), 30)};
    const auto slots = core::generateSlots(request(30, 15, 10), hours, existing, core::TimeReference()).toVector();
    QVERIFY(!hasStart(slots, at(8, 30)));
    QCOMPARE(slots.front().start, at(8, 40));
}

void AvailabilityGeneratorTest::slotsFitInsideFreeIntervals()
{
    const core::IntervalList hours = {{at(8), at(12)}, {at(14), at(19)}};
    const std::vector<data::Appointment> existing = {
        booking(1, at(8, 20), 25),
        booking(2, at(10, 0), 50),
        booking(3, at(14, 5), 40),
        booking(4, at(18, 10), 30),
    };
    const auto sequence = core::generateSlots(request(45, 10, 5), hours, existing, core::TimeReference());
    QVERIFY(!sequence.empty());

    for (const core::Slot &slot : sequence) {
        QCOMPARE(slot.durationSecs(), static_cast<qint64>(45 * 60));
        const bool inside = std::any_of(sequence.freeIntervals().begin(),
                                        sequence.freeIntervals().end(),
                                        [&](const core::TimeInterval &window) { return window.contains(slot); });
        QVERIFY(inside);
        for (const data::Appointment &appointment : existing) {
            QVERIFY(!slot.overlaps({appointment.start, appointment.end()}));
        }
    }
}

void AvailabilityGeneratorTest::shortGapYieldsNothing()
{
    const core::IntervalList hours = {{at(8), at(9)}};
    const std::vector<data::Appointment> existing = {booking(1, at(8, 0), 20), booking(2, at(8, 45), 15)};
    QVERIFY(core::generateSlots(request(30, 5), hours, existing, core::TimeReference()).empty());
}

void AvailabilityGeneratorTest::rejectsNonPositiveStep()
{
    const core::IntervalList hours = {{at(8), at(12)}};
    QVERIFY(core::generateSlots(request(30, 0), hours, {}, core::TimeReference()).empty());
    QVERIFY(core::generateSlots(request(30, -5), hours, {}, core::TimeReference()).empty());
    QVERIFY(core::generateSlots(request(0, 15), hours, {}, core::TimeReference()).empty());
}

void AvailabilityGeneratorTest::sequenceIsRestartable()
{
    const core::IntervalList hours = {{at(8), at(10)}, {at(11), at(12)}};
    const auto sequence = core::generateSlots(request(60, 30), hours, {}, core::TimeReference());
    const auto first = sequence.toVector();
    const auto second = sequence.toVector();
    QVERIFY(first == second);
    QCOMPARE(first.size(), static_cast<size_t>(4));
    QCOMPARE(first[2].start, at(9, 0));
    QCOMPARE(first[3].start, at(11, 0));
}

void AvailabilityGeneratorTest::openingHoursOnDay()
{
    core::BusinessHoursProvider provider;
    provider.setProviderHours(1, *core::parseOpeningHours(QStringLiteral("08:00-12:00,14:00-19:00")));

    const core::TimeReference reference;
    const core::IntervalList own = provider.intervalsOn(1, kDay, reference);
    QCOMPARE(own.size(), static_cast<size_t>(2));
    QVERIFY(own[1] == core::TimeInterval({at(14), at(19)}));

    const core::IntervalList fallback = provider.intervalsOn(7, kDay, reference);
    QCOMPARE(fallback.size(), static_cast<size_t>(1));
    QVERIFY(fallback[0] == core::TimeInterval({at(9), at(19)}));
}

QTEST_GUILESS_MAIN(AvailabilityGeneratorTest)
#include "AvailabilityGeneratorTest.moc"
