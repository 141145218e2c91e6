#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QDate>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {

// Held while a provider's day is checked and written. Releasing the lock
// is the destructor's job.
class ScheduleLock
{
public:
    virtual ~ScheduleLock() = default;
};

class AppointmentRepository
{
public:
    virtual ~AppointmentRepository() = default;

    // Appointments whose start lies in [from, to), ordered by start then id.
    // When the store cannot be read the result is empty and *ok is false.
    virtual std::vector<Appointment> fetchAppointments(const QDateTime &from,
                                                       const QDateTime &to,
                                                       std::optional<int> providerId = std::nullopt,
                                                       bool *ok = nullptr) const = 0;
    virtual std::optional<Appointment> findById(int id, bool *ok = nullptr) const = 0;
    virtual std::optional<Appointment> addAppointment(Appointment appointment) = 0;
    virtual bool updateAppointment(const Appointment &appointment) = 0;
    virtual bool removeAppointment(int id) = 0;

    // Serializes check-and-commit for one provider on one calendar day.
    // Returns nullptr when the lock cannot be obtained.
    virtual std::unique_ptr<ScheduleLock> lockSchedule(int providerId, const QDate &day) = 0;
};

} // namespace data
} // namespace agenda
