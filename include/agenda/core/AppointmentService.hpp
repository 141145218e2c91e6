#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>

#include "agenda/core/AvailabilityGenerator.hpp"
#include "agenda/core/BookingResult.hpp"
#include "agenda/core/TimeReference.hpp"
#include "agenda/core/TransitionPolicy.hpp"
#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {
class AppointmentRepository;
class ServiceCatalog;
}

namespace core {

class BusinessHoursProvider;

// Restricts which provider's appointments a caller may see or touch. An
// empty scope is unrestricted.
struct AccessScope
{
    std::optional<int> providerId;

    bool permits(int appointmentProviderId) const
    {
        return !providerId || *providerId == appointmentProviderId;
    }
};

struct CreateRequest
{
    int providerId = 0;
    int customerRef = 0;
    std::optional<int> serviceRef;
    QDateTime start;
    std::optional<int> durationMinutes;
    std::optional<data::AppointmentStatus> status;
    std::optional<data::BookingChannel> channel;
    std::optional<double> price;
    QString notes;
};

// Only the fields that are set are applied.
struct AppointmentChanges
{
    std::optional<int> customerRef;
    std::optional<int> serviceRef;
    bool clearServiceRef = false;
    std::optional<int> providerId;
    std::optional<QDateTime> start;
    std::optional<int> durationMinutes;
    std::optional<data::AppointmentStatus> status;
    std::optional<data::BookingChannel> channel;
    std::optional<double> price;
    bool clearPrice = false;
    std::optional<QString> notes;
};

struct AppointmentFilter
{
    QDateTime from;
    QDateTime to;
    std::optional<int> providerId;
    std::optional<data::AppointmentStatus> status;
};

class AppointmentService
{
public:
    AppointmentService(data::AppointmentRepository &repository,
                       const BusinessHoursProvider &businessHours,
                       TimeReference reference = TimeReference(),
                       const data::ServiceCatalog *catalog = nullptr);

    void setTransitionPolicy(TransitionPolicy policy);
    void setDefaultDurationMinutes(int minutes);
    const TimeReference &timeReference() const;

    BookingResult<SlotSequence> listAvailability(const AvailabilityRequest &request) const;
    BookingResult<std::optional<data::Appointment>> checkConflict(int providerId,
                                                                  const QDateTime &start,
                                                                  int durationMinutes,
                                                                  std::optional<int> excludeId = std::nullopt) const;

    BookingResult<data::Appointment> createAppointment(const CreateRequest &request, const AccessScope &scope = {});
    BookingResult<data::Appointment> updateAppointment(int id,
                                                       const AppointmentChanges &changes,
                                                       const AccessScope &scope = {});
    BookingResult<data::Appointment> changeStatus(int id, data::AppointmentStatus status, const AccessScope &scope = {});
    BookingResult<Done> deleteAppointment(int id, const AccessScope &scope = {});

    BookingResult<data::Appointment> findAppointment(int id, const AccessScope &scope = {}) const;
    BookingResult<std::vector<data::Appointment>> listAppointments(const AppointmentFilter &filter,
                                                                   const AccessScope &scope = {}) const;

private:
    std::optional<BookingError> validate(const data::Appointment &appointment, const AccessScope &scope) const;
    BookingResult<std::vector<data::Appointment>> sameDayAppointments(int providerId, const QDateTime &start) const;
    BookingError conflictError(const data::Appointment &conflicting) const;
    BookingError scheduleBusyError(int providerId, const QDate &day) const;
    BookingError transitionError(data::AppointmentStatus from, data::AppointmentStatus to) const;
    BookingResult<data::Appointment> applyChanges(const data::Appointment &current,
                                                  const AppointmentChanges &changes) const;

    // Builds the new version of a record from its current stored version.
    using ChangeBuilder = std::function<BookingResult<data::Appointment>(const data::Appointment &current)>;
    // Rebuilds the change from a copy re-read under the schedule locks and
    // commits it, re-checking conflicts when the record's slot is affected.
    BookingResult<data::Appointment> commitChange(int id, const AccessScope &scope, const ChangeBuilder &build);

    data::AppointmentRepository &m_repository;
    const BusinessHoursProvider &m_businessHours;
    TimeReference m_reference;
    const data::ServiceCatalog *m_catalog = nullptr;
    TransitionPolicy m_transitionPolicy;
    int m_defaultDurationMinutes = 30;
};

} // namespace core
} // namespace agenda
