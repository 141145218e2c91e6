#include <QtTest/QtTest>

#include "agenda/core/ConflictDetector.hpp"

using namespace agenda;

namespace {

QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2025, 3, day), QTime(hour, minute), Qt::UTC);
}

data::Appointment booking(int id, int providerId, const QDateTime &start, int minutes,
                          data::AppointmentStatus status = data::AppointmentStatus::Scheduled)
{
    data::Appointment appointment;
    appointment.id = id;
    appointment.customerRef = 100 + id;
    appointment.providerId = providerId;
    appointment.start = start;
    appointment.durationMinutes = minutes;
    appointment.status = status;
    return appointment;
}

} // namespace

class ConflictDetectorTest : public QObject
{
    Q_OBJECT

private slots:
    void detectsOverlap();
    void halfOpenBoundary();
    void ignoresInactiveStatuses();
    void ignoresOtherProvidersAndDays();
    void excludesOwnId();
    void returnsFirstInGivenOrder();
    void followsTimeZoneDay();
};

void ConflictDetectorTest::detectsOverlap()
{
    const std::vector<data::Appointment> existing = {booking(1, 1, at(3, 8, 0), 30)};
    const auto conflict = core::findConflict({1, at(3, 8, 15), 30, std::nullopt}, existing, core::TimeReference());
    QVERIFY(conflict.has_value());
    QCOMPARE(conflict->id, 1);
}

void ConflictDetectorTest::halfOpenBoundary()
{
    const std::vector<data::Appointment> existing = {booking(1, 1, at(3, 8, 0), 30)};
    const core::TimeReference reference;
    QVERIFY(!core::findConflict({1, at(3, 8, 30), 30, std::nullopt}, existing, reference));
    QVERIFY(!core::findConflict({1, at(3, 7, 30), 30, std::nullopt}, existing, reference));
    QVERIFY(core::findConflict({1, at(3, 7, 31), 30, std::nullopt}, existing, reference).has_value());
}

void ConflictDetectorTest::ignoresInactiveStatuses()
{
    const std::vector<data::Appointment> existing = {
        booking(1, 1, at(3, 8, 0), 60, data::AppointmentStatus::Cancelled),
        booking(2, 1, at(3, 8, 0), 60, data::AppointmentStatus::NoShow),
    };
    QVERIFY(!core::findConflict({1, at(3, 8, 0), 60, std::nullopt}, existing, core::TimeReference()));

    const std::vector<data::Appointment> completed = {booking(3, 1, at(3, 8, 0), 60, data::AppointmentStatus::Completed)};
    QVERIFY(core::findConflict({1, at(3, 8, 0), 60, std::nullopt}, completed, core::TimeReference()).has_value());
}

void ConflictDetectorTest::ignoresOtherProvidersAndDays()
{
    const std::vector<data::Appointment> existing = {
        booking(1, 2, at(3, 8, 0), 60),
        // Starts the previous evening and runs past midnight.
        booking(2, 1, at(2, 23, 30), 60),
    };
    QVERIFY(!core::findConflict({1, at(3, 0, 0), 30, std::nullopt}, existing, core::TimeReference()));
    QVERIFY(!core::findConflict({1, at(3, 8, 0), 30, std::nullopt}, existing, core::TimeReference()));
}

void ConflictDetectorTest::excludesOwnId()
{
    const std::vector<data::Appointment> existing = {booking(5, 1, at(3, 10, 0), 45)};
    QVERIFY(core::findConflict({1, at(3, 10, 15), 45, std::nullopt}, existing, core::TimeReference()).has_value());
    QVERIFY(!core::findConflict({1, at(3, 10, 15), 45, 5}, existing, core::TimeReference()));
}

void ConflictDetectorTest::returnsFirstInGivenOrder()
{
    const std::vector<data::Appointment> existing = {booking(9, 1, at(3, 9, 30), 30), booking(4, 1, at(3, 9, 0), 30)};
    const auto conflict = core::findConflict({1, at(3, 9, 0), 60, std::nullopt}, existing, core::TimeReference());
    QVERIFY(conflict.has_value());
    QCOMPARE(conflict->id, 9);
}

void ConflictDetectorTest::followsTimeZoneDay()
{
    const core::TimeReference vienna(QTimeZone("Europe/Vienna"));
    // 23:30 UTC on March 2nd is 00:30 on March 3rd in Vienna.
    const std::vector<data::Appointment> existing = {booking(1, 1, at(2, 23, 30), 60)};
    QVERIFY(core::findConflict({1, at(3, 0, 0), 30, std::nullopt}, existing, vienna).has_value());
    QVERIFY(!core::findConflict({1, at(3, 0, 0), 30, std::nullopt}, existing, core::TimeReference()));
}

QTEST_GUILESS_MAIN(ConflictDetectorTest)
#include "ConflictDetectorTest.moc"
