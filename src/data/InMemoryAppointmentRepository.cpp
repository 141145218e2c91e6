#include "agenda/data/InMemoryAppointmentRepository.hpp"

#include <algorithm>

#include <QMutexLocker>

namespace agenda {
namespace data {

namespace {

class MutexScheduleLock : public ScheduleLock
{
public:
    explicit MutexScheduleLock(std::shared_ptr<QMutex> mutex)
        : m_mutex(std::move(mutex))
    {
        m_mutex->lock();
    }

    ~MutexScheduleLock() override { m_mutex->unlock(); }

private:
    std::shared_ptr<QMutex> m_mutex;
};

} // namespace

InMemoryAppointmentRepository::InMemoryAppointmentRepository() = default;
InMemoryAppointmentRepository::~InMemoryAppointmentRepository() = default;

std::vector<Appointment> InMemoryAppointmentRepository::fetchAppointments(const QDateTime &from,
                                                                          const QDateTime &to,
                                                                          std::optional<int> providerId,
                                                                          bool *ok) const
{
    QMutexLocker locker(&m_mutex);
    if (ok) {
        *ok = true;
    }
    std::vector<Appointment> appointments;
    for (const auto &entry : m_appointments) {
        const Appointment &appointment = entry.second;
        if (providerId && appointment.providerId != *providerId) {
            continue;
        }
        if (appointment.start < from || appointment.start >= to) {
            continue;
        }
        appointments.push_back(appointment);
    }
    // Map order is id order, a stable sort keeps it for equal starts.
    std::stable_sort(appointments.begin(), appointments.end(), [](const Appointment &lhs, const Appointment &rhs) {
        return lhs.start < rhs.start;
    });
    return appointments;
}

std::optional<Appointment> InMemoryAppointmentRepository::findById(int id, bool *ok) const
{
    QMutexLocker locker(&m_mutex);
    if (ok) {
        *ok = true;
    }
    const auto it = m_appointments.find(id);
    if (it != m_appointments.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Appointment> InMemoryAppointmentRepository::addAppointment(Appointment appointment)
{
    QMutexLocker locker(&m_mutex);
    if (appointment.id <= 0 || m_appointments.count(appointment.id) > 0) {
        appointment.id = m_nextId;
    }
    m_nextId = std::max(m_nextId, appointment.id + 1);
    m_appointments[appointment.id] = appointment;
    return appointment;
}

bool InMemoryAppointmentRepository::updateAppointment(const Appointment &appointment)
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_appointments.find(appointment.id);
    if (it == m_appointments.end()) {
        return false;
    }
    it->second = appointment;
    return true;
}

bool InMemoryAppointmentRepository::removeAppointment(int id)
{
    QMutexLocker locker(&m_mutex);
    return m_appointments.erase(id) > 0;
}

std::unique_ptr<ScheduleLock> InMemoryAppointmentRepository::lockSchedule(int providerId, const QDate &day)
{
    std::shared_ptr<QMutex> mutex;
    {
        QMutexLocker locker(&m_mutex);
        const QString key = QStringLiteral("%1/%2").arg(providerId).arg(day.toString(Qt::ISODate));
        mutex = m_scheduleLocks.value(key);
        if (!mutex) {
            mutex = std::make_shared<QMutex>();
            m_scheduleLocks.insert(key, mutex);
        }
    }
    return std::make_unique<MutexScheduleLock>(std::move(mutex));
}

} // namespace data
} // namespace agenda
