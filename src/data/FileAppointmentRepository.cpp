#include "agenda/data/FileAppointmentRepository.hpp"

#include "agenda/core/Logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLockFile>
#include <algorithm>

namespace agenda {
namespace data {

namespace {
constexpr int SCHEDULE_LOCK_TIMEOUT_MS = 10000;
constexpr int STALE_LOCK_MS = 60000;

// Lock file shared by every process that books against the same file.
class FileScheduleLock : public ScheduleLock
{
public:
    explicit FileScheduleLock(std::unique_ptr<QLockFile> lockFile)
        : m_lockFile(std::move(lockFile))
    {
    }

    ~FileScheduleLock() override { m_lockFile->unlock(); }

private:
    std::unique_ptr<QLockFile> m_lockFile;
};
} // namespace

FileAppointmentRepository::FileAppointmentRepository(std::shared_ptr<FileAppointmentStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Appointment> FileAppointmentRepository::fetchAppointments(const QDateTime &from,
                                                                      const QDateTime &to,
                                                                      std::optional<int> providerId,
                                                                      bool *ok) const
{
    std::vector<Appointment> result;
    if (!m_storage) {
        if (ok) {
            *ok = false;
        }
        return result;
    }

    for (const Appointment &appointment : m_storage->appointments(ok)) {
        if (providerId && appointment.providerId != *providerId) {
            continue;
        }
        if (appointment.start < from || appointment.start >= to) {
            continue;
        }
        result.push_back(appointment);
    }
    std::sort(result.begin(), result.end(), [](const Appointment &lhs, const Appointment &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.id < rhs.id;
        }
        return lhs.start < rhs.start;
    });
    return result;
}

std::optional<Appointment> FileAppointmentRepository::findById(int id, bool *ok) const
{
    if (!m_storage) {
        if (ok) {
            *ok = false;
        }
        return std::nullopt;
    }
    return m_storage->find(id, ok);
}

std::optional<Appointment> FileAppointmentRepository::addAppointment(Appointment appointment)
{
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->insert(std::move(appointment));
}

bool FileAppointmentRepository::updateAppointment(const Appointment &appointment)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replace(appointment);
}

bool FileAppointmentRepository::removeAppointment(int id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->remove(id);
}

std::unique_ptr<ScheduleLock> FileAppointmentRepository::lockSchedule(int providerId, const QDate &day)
{
    if (!m_storage) {
        return nullptr;
    }
    const QString path = m_storage->scheduleLockPath(providerId, day);
    QDir().mkpath(QFileInfo(path).absolutePath());

    auto lockFile = std::make_unique<QLockFile>(path);
    lockFile->setStaleLockTime(STALE_LOCK_MS);
    if (!lockFile->tryLock(SCHEDULE_LOCK_TIMEOUT_MS)) {
        qCWarning(lcStorage) << "schedule lock busy:" << path << "error" << lockFile->error();
        return nullptr;
    }
    return std::make_unique<FileScheduleLock>(std::move(lockFile));
}

} // namespace data
} // namespace agenda
