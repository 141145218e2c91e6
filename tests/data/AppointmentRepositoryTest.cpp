#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QTemporaryDir>
#include <memory>

#include "agenda/data/FileAppointmentRepository.hpp"
#include "agenda/data/FileAppointmentStorage.hpp"
#include "agenda/data/InMemoryAppointmentRepository.hpp"

using namespace agenda::data;

namespace {

QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2025, 3, day), QTime(hour, minute), Qt::UTC);
}

Appointment sample(int providerId, const QDateTime &start)
{
    Appointment appointment;
    appointment.customerRef = 12;
    appointment.providerId = providerId;
    appointment.start = start;
    appointment.durationMinutes = 45;
    return appointment;
}

} // namespace

class AppointmentRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void inMemoryAddAndFetch();
    void inMemoryUpdateAndRemove();
    void fileRoundTrip();
    void fileSharedBetweenInstances();
    void fileIdsAreNotReused();
    void fileScheduleLockIsExclusive();
    void fileReadFailureIsReported();
    void statusNames();
};

void AppointmentRepositoryTest::inMemoryAddAndFetch()
{
    InMemoryAppointmentRepository repo;
    const auto later = repo.addAppointment(sample(1, at(3, 10)));
    const auto earlier = repo.addAppointment(sample(1, at(3, 8)));
    repo.addAppointment(sample(2, at(3, 9)));
    repo.addAppointment(sample(1, at(4, 9)));

    QVERIFY(later.has_value() && earlier.has_value());
    QVERIFY(later->id > 0);
    QVERIFY(earlier->id != later->id);

    const auto dayOne = repo.fetchAppointments(at(3, 0), at(4, 0), 1);
    QCOMPARE(dayOne.size(), static_cast<size_t>(2));
    QCOMPARE(dayOne.front().id, earlier->id);
    QCOMPARE(dayOne.back().id, later->id);

    QCOMPARE(repo.fetchAppointments(at(3, 0), at(5, 0)).size(), static_cast<size_t>(4));
    QVERIFY(repo.fetchAppointments(at(3, 0), at(3, 8)).empty());
}

void AppointmentRepositoryTest::inMemoryUpdateAndRemove()
{
    InMemoryAppointmentRepository repo;
    const auto stored = repo.addAppointment(sample(1, at(3, 10)));
    QVERIFY(stored.has_value());

    Appointment toUpdate = *stored;
    toUpdate.notes = QStringLiteral("Updated");
    QVERIFY(repo.updateAppointment(toUpdate));
    QCOMPARE(repo.findById(stored->id)->notes, QStringLiteral("Updated"));

    QVERIFY(repo.removeAppointment(stored->id));
    QVERIFY(!repo.findById(stored->id).has_value());
    QVERIFY(!repo.updateAppointment(toUpdate));
    QVERIFY(!repo.removeAppointment(stored->id));
}

void AppointmentRepositoryTest::fileRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("appointments.ics"));

    Appointment full = sample(3, at(3, 14, 30));
    full.serviceRef = 8;
    full.status = AppointmentStatus::NoShow;
    full.channel = BookingChannel::WalkIn;
    full.price = 19.9;
    full.notes = QStringLiteral("first visit; allergic, see file\nsecond line \\ end");

    int id = 0;
    {
        FileAppointmentRepository repo(std::make_shared<FileAppointmentStorage>(path));
        const auto stored = repo.addAppointment(full);
        QVERIFY(stored.has_value());
        id = stored->id;
        QVERIFY(repo.addAppointment(sample(3, at(3, 9))).has_value());
    }

    FileAppointmentRepository reopened(std::make_shared<FileAppointmentStorage>(path));
    const auto loaded = reopened.findById(id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->customerRef, 12);
    QCOMPARE(loaded->providerId, 3);
    QCOMPARE(loaded->start, full.start);
    QCOMPARE(loaded->durationMinutes, 45);
    QCOMPARE(loaded->serviceRef, std::optional<int>(8));
    QCOMPARE(loaded->status, AppointmentStatus::NoShow);
    QCOMPARE(loaded->channel, BookingChannel::WalkIn);
    QVERIFY(loaded->price.has_value());
    QCOMPARE(*loaded->price, 19.9);
    QCOMPARE(loaded->notes, full.notes);

    const auto listed = reopened.fetchAppointments(at(3, 0), at(4, 0), 3);
    QCOMPARE(listed.size(), static_cast<size_t>(2));
    QCOMPARE(listed.front().start, at(3, 9));
}

void AppointmentRepositoryTest::fileSharedBetweenInstances()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("shared.ics"));

    FileAppointmentRepository first(std::make_shared<FileAppointmentStorage>(path));
    FileAppointmentRepository second(std::make_shared<FileAppointmentStorage>(path));

    const auto a = first.addAppointment(sample(1, at(3, 8)));
    const auto b = second.addAppointment(sample(1, at(3, 9)));
    QVERIFY(a.has_value() && b.has_value());
    QVERIFY(a->id != b->id);

    QCOMPARE(first.fetchAppointments(at(3, 0), at(4, 0)).size(), static_cast<size_t>(2));

    Appointment cancelled = *a;
    cancelled.status = AppointmentStatus::Cancelled;
    QVERIFY(second.updateAppointment(cancelled));
    QCOMPARE(first.findById(a->id)->status, AppointmentStatus::Cancelled);

    QVERIFY(first.removeAppointment(b->id));
    QVERIFY(!second.findById(b->id).has_value());
}

void AppointmentRepositoryTest::fileIdsAreNotReused()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileAppointmentRepository repo(std::make_shared<FileAppointmentStorage>(dir.filePath(QStringLiteral("ids.ics"))));

    const auto first = repo.addAppointment(sample(1, at(3, 8)));
    const auto second = repo.addAppointment(sample(1, at(3, 9)));
    QVERIFY(repo.removeAppointment(second->id));
    const auto third = repo.addAppointment(sample(1, at(3, 10)));
    QVERIFY(third.has_value());
    QVERIFY(third->id > second->id);
    QVERIFY(first->id < second->id);
}

void AppointmentRepositoryTest::fileScheduleLockIsExclusive()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto storage = std::make_shared<FileAppointmentStorage>(dir.filePath(QStringLiteral("locks.ics")));
    FileAppointmentRepository repo(storage);

    const QString lockPath = storage->scheduleLockPath(1, QDate(2025, 3, 3));
    QVERIFY(lockPath != storage->scheduleLockPath(2, QDate(2025, 3, 3)));
    QVERIFY(lockPath != storage->scheduleLockPath(1, QDate(2025, 3, 4)));

    {
        auto lock = repo.lockSchedule(1, QDate(2025, 3, 3));
        QVERIFY(lock != nullptr);
        QVERIFY(QFile::exists(lockPath));

        // Another provider's day is independent.
        auto other = repo.lockSchedule(2, QDate(2025, 3, 3));
        QVERIFY(other != nullptr);

        QLockFile competing(lockPath);
        QVERIFY(!competing.tryLock(0));
    }
    QVERIFY(!QFile::exists(lockPath));
}

void AppointmentRepositoryTest::fileReadFailureIsReported()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    bool ok = false;
    FileAppointmentRepository missing(std::make_shared<FileAppointmentStorage>(dir.filePath(QStringLiteral("new.ics"))));
    QVERIFY(missing.fetchAppointments(at(3, 0), at(4, 0), std::nullopt, &ok).empty());
    QVERIFY(ok);
    QVERIFY(!missing.findById(1, &ok).has_value());
    QVERIFY(ok);

    // A directory in place of the file exists but cannot be opened.
    const QString blocked = dir.filePath(QStringLiteral("blocked.ics"));
    QVERIFY(QDir().mkpath(blocked));
    FileAppointmentRepository unreadable(std::make_shared<FileAppointmentStorage>(blocked));
    ok = true;
    QVERIFY(unreadable.fetchAppointments(at(3, 0), at(4, 0), std::nullopt, &ok).empty());
    QVERIFY(!ok);
    ok = true;
    QVERIFY(!unreadable.findById(1, &ok).has_value());
    QVERIFY(!ok);
    QVERIFY(!unreadable.addAppointment(sample(1, at(3, 8))).has_value());
}

void AppointmentRepositoryTest::statusNames()
{
    QCOMPARE(statusToString(AppointmentStatus::NoShow), QStringLiteral("no_show"));
    QCOMPARE(statusFromString(QStringLiteral("Confirmed")), std::optional<AppointmentStatus>(AppointmentStatus::Confirmed));
    QVERIFY(!statusFromString(QStringLiteral("pending")).has_value());
    QCOMPARE(channelFromString(QStringLiteral("walk_in")), std::optional<BookingChannel>(BookingChannel::WalkIn));
    QVERIFY(!channelFromString(QStringLiteral("fax")).has_value());
}

QTEST_GUILESS_MAIN(AppointmentRepositoryTest)
#include "AppointmentRepositoryTest.moc"
