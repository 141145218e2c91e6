#pragma once

#include <map>
#include <memory>

#include <QHash>
#include <QMutex>

#include "agenda/data/AppointmentRepository.hpp"

namespace agenda {
namespace data {

class InMemoryAppointmentRepository : public AppointmentRepository
{
public:
    InMemoryAppointmentRepository();
    ~InMemoryAppointmentRepository() override;

    std::vector<Appointment> fetchAppointments(const QDateTime &from,
                                               const QDateTime &to,
                                               std::optional<int> providerId = std::nullopt,
                                               bool *ok = nullptr) const override;
    std::optional<Appointment> findById(int id, bool *ok = nullptr) const override;
    std::optional<Appointment> addAppointment(Appointment appointment) override;
    bool updateAppointment(const Appointment &appointment) override;
    bool removeAppointment(int id) override;
    std::unique_ptr<ScheduleLock> lockSchedule(int providerId, const QDate &day) override;

private:
    mutable QMutex m_mutex;
    std::map<int, Appointment> m_appointments;
    int m_nextId = 1;
    QHash<QString, std::shared_ptr<QMutex>> m_scheduleLocks;
};

} // namespace data
} // namespace agenda
