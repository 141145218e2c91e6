#include "agenda/core/AppointmentService.hpp"

#include "agenda/core/BusinessHours.hpp"
#include "agenda/core/ConflictDetector.hpp"
#include "agenda/core/Logging.hpp"
#include "agenda/data/AppointmentRepository.hpp"
#include "agenda/data/ServiceCatalog.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace agenda {
namespace core {

namespace {

BookingError validationError(const QString &message)
{
    return {ErrorKind::Validation, message, std::nullopt};
}

BookingError notFoundError(int id)
{
    return {ErrorKind::NotFound, QStringLiteral("appointment #%1 not found").arg(id), std::nullopt};
}

BookingError storageError(const QString &message)
{
    return {ErrorKind::Storage, message, std::nullopt};
}

constexpr int kMaxCommitAttempts = 3;

bool timingChanged(const data::Appointment &lhs, const data::Appointment &rhs)
{
    return lhs.start != rhs.start || lhs.durationMinutes != rhs.durationMinutes || lhs.providerId != rhs.providerId;
}

} // namespace

AppointmentService::AppointmentService(data::AppointmentRepository &repository,
                                       const BusinessHoursProvider &businessHours,
                                       TimeReference reference,
                                       const data::ServiceCatalog *catalog)
    : m_repository(repository)
    , m_businessHours(businessHours)
    , m_reference(std::move(reference))
    , m_catalog(catalog)
    , m_transitionPolicy(permissiveTransitions())
{
}

void AppointmentService::setTransitionPolicy(TransitionPolicy policy)
{
    m_transitionPolicy = policy ? std::move(policy) : permissiveTransitions();
}

void AppointmentService::setDefaultDurationMinutes(int minutes)
{
    if (minutes > 0) {
        m_defaultDurationMinutes = minutes;
    }
}

const TimeReference &AppointmentService::timeReference() const
{
    return m_reference;
}

BookingResult<SlotSequence> AppointmentService::listAvailability(const AvailabilityRequest &request) const
{
    if (request.providerId <= 0) {
        return validationError(QStringLiteral("providerId must be positive"));
    }
    if (!request.day.isValid()) {
        return validationError(QStringLiteral("date is not valid"));
    }
    if (request.durationMinutes <= 0) {
        return validationError(QStringLiteral("durationMinutes must be > 0"));
    }
    if (request.stepMinutes <= 0) {
        return validationError(QStringLiteral("stepMinutes must be > 0"));
    }
    if (request.bufferMinutes < 0) {
        return validationError(QStringLiteral("bufferMinutes must not be negative"));
    }

    const TimeInterval day = m_reference.dayWindow(request.day);
    bool readOk = false;
    const auto appointments = m_repository.fetchAppointments(day.start, day.end, request.providerId, &readOk);
    if (!readOk) {
        return storageError(QStringLiteral("appointment store could not be read"));
    }
    const IntervalList base = m_businessHours.intervalsOn(request.providerId, request.day, m_reference);
    return generateSlots(request, base, appointments, m_reference);
}

BookingResult<std::optional<data::Appointment>> AppointmentService::checkConflict(int providerId,
                                                                                  const QDateTime &start,
                                                                                  int durationMinutes,
                                                                                  std::optional<int> excludeId) const
{
    if (providerId <= 0) {
        return validationError(QStringLiteral("providerId must be positive"));
    }
    if (!start.isValid()) {
        return validationError(QStringLiteral("start is not a valid timestamp"));
    }
    if (durationMinutes <= 0) {
        return validationError(QStringLiteral("durationMinutes must be > 0"));
    }
    const auto sameDay = sameDayAppointments(providerId, start);
    if (!sameDay) {
        return sameDay.error();
    }
    const ConflictQuery query{providerId, start, durationMinutes, excludeId};
    return findConflict(query, sameDay.value(), m_reference);
}

BookingResult<data::Appointment> AppointmentService::createAppointment(const CreateRequest &request,
                                                                       const AccessScope &scope)
{
    data::Appointment appointment;
    appointment.providerId = request.providerId;
    appointment.customerRef = request.customerRef;
    appointment.serviceRef = request.serviceRef;
    appointment.start = request.start;
    appointment.status = request.status.value_or(data::AppointmentStatus::Scheduled);
    appointment.channel = request.channel.value_or(data::BookingChannel::Online);
    appointment.price = request.price;
    appointment.notes = request.notes;

    // Explicit duration wins over the catalog default, which wins over the
    // configured default.
    if (request.durationMinutes) {
        appointment.durationMinutes = *request.durationMinutes;
    } else {
        appointment.durationMinutes = m_defaultDurationMinutes;
        if (request.serviceRef && m_catalog) {
            if (const auto catalogDuration = m_catalog->defaultDurationMinutes(*request.serviceRef)) {
                appointment.durationMinutes = *catalogDuration;
            }
        }
    }

    if (const auto error = validate(appointment, scope)) {
        qCInfo(lcBooking) << "create rejected:" << error->message;
        return *error;
    }

    const QDate day = m_reference.dayOf(appointment.start);
    const auto lock = m_repository.lockSchedule(appointment.providerId, day);
    if (!lock) {
        return scheduleBusyError(appointment.providerId, day);
    }

    const auto sameDay = sameDayAppointments(appointment.providerId, appointment.start);
    if (!sameDay) {
        return sameDay.error();
    }
    const ConflictQuery query{appointment.providerId, appointment.start, appointment.durationMinutes, std::nullopt};
    if (const auto conflicting = findConflict(query, sameDay.value(), m_reference)) {
        qCInfo(lcBooking) << "create rejected for provider" << appointment.providerId << "at"
                          << m_reference.formatTimestamp(appointment.start) << ": overlaps #" << conflicting->id;
        return conflictError(*conflicting);
    }

    const auto stored = m_repository.addAppointment(std::move(appointment));
    if (!stored) {
        return storageError(QStringLiteral("appointment could not be stored"));
    }
    qCDebug(lcBooking) << "created appointment" << stored->id << "for provider" << stored->providerId << "at"
                       << m_reference.formatTimestamp(stored->start);
    return *stored;
}

BookingResult<data::Appointment> AppointmentService::updateAppointment(int id,
                                                                       const AppointmentChanges &changes,
                                                                       const AccessScope &scope)
{
    return commitChange(id, scope, [this, &changes](const data::Appointment &current) {
        return applyChanges(current, changes);
    });
}

BookingResult<data::Appointment> AppointmentService::changeStatus(int id,
                                                                  data::AppointmentStatus status,
                                                                  const AccessScope &scope)
{
    return commitChange(id, scope, [this, status](const data::Appointment &current) -> BookingResult<data::Appointment> {
        if (!m_transitionPolicy(current.status, status)) {
            return transitionError(current.status, status);
        }
        data::Appointment candidate = current;
        candidate.status = status;
        return candidate;
    });
}

BookingResult<Done> AppointmentService::deleteAppointment(int id, const AccessScope &scope)
{
    const auto existing = findAppointment(id, scope);
    if (!existing) {
        return existing.error();
    }
    if (!m_repository.removeAppointment(id)) {
        return notFoundError(id);
    }
    qCDebug(lcBooking) << "deleted appointment" << id;
    return Done{};
}

BookingResult<data::Appointment> AppointmentService::findAppointment(int id, const AccessScope &scope) const
{
    bool readOk = false;
    const auto appointment = m_repository.findById(id, &readOk);
    if (!readOk) {
        return storageError(QStringLiteral("appointment store could not be read"));
    }
    if (!appointment || !scope.permits(appointment->providerId)) {
        return notFoundError(id);
    }
    return *appointment;
}

BookingResult<std::vector<data::Appointment>> AppointmentService::listAppointments(const AppointmentFilter &filter,
                                                                                   const AccessScope &scope) const
{
    if (!filter.from.isValid() || !filter.to.isValid() || filter.to < filter.from) {
        return validationError(QStringLiteral("listing needs a valid from <= to range"));
    }
    std::optional<int> providerId = filter.providerId;
    if (scope.providerId) {
        if (providerId && *providerId != *scope.providerId) {
            return validationError(QStringLiteral("provider %1 is outside the caller's scope").arg(*providerId));
        }
        providerId = scope.providerId;
    }

    // The range end is inclusive for listings.
    bool readOk = false;
    auto appointments = m_repository.fetchAppointments(filter.from, filter.to.addMSecs(1), providerId, &readOk);
    if (!readOk) {
        return storageError(QStringLiteral("appointment store could not be read"));
    }
    if (filter.status) {
        const auto status = *filter.status;
        appointments.erase(std::remove_if(appointments.begin(),
                                          appointments.end(),
                                          [status](const data::Appointment &a) { return a.status != status; }),
                           appointments.end());
    }
    return appointments;
}

std::optional<BookingError> AppointmentService::validate(const data::Appointment &appointment,
                                                         const AccessScope &scope) const
{
    if (appointment.customerRef <= 0) {
        return validationError(QStringLiteral("customerRef is required"));
    }
    if (appointment.providerId <= 0) {
        return validationError(QStringLiteral("providerId must be positive"));
    }
    if (!scope.permits(appointment.providerId)) {
        return validationError(
            QStringLiteral("provider %1 is outside the caller's scope").arg(appointment.providerId));
    }
    if (!appointment.start.isValid()) {
        return validationError(QStringLiteral("start is not a valid timestamp"));
    }
    if (appointment.durationMinutes <= 0) {
        return validationError(QStringLiteral("durationMinutes must be > 0"));
    }
    if (appointment.serviceRef && *appointment.serviceRef <= 0) {
        return validationError(QStringLiteral("serviceRef must be positive"));
    }
    return std::nullopt;
}

BookingResult<std::vector<data::Appointment>> AppointmentService::sameDayAppointments(int providerId,
                                                                                     const QDateTime &start) const
{
    const TimeInterval day = m_reference.dayWindow(m_reference.dayOf(start));
    bool readOk = false;
    auto appointments = m_repository.fetchAppointments(day.start, day.end, providerId, &readOk);
    if (!readOk) {
        return storageError(QStringLiteral("appointment store could not be read"));
    }
    return appointments;
}

BookingError AppointmentService::conflictError(const data::Appointment &conflicting) const
{
    return {ErrorKind::Conflict,
            QStringLiteral("conflicts with appointment #%1 from %2 to %3")
                .arg(conflicting.id)
                .arg(m_reference.formatTimestamp(conflicting.start), m_reference.formatTimestamp(conflicting.end())),
            conflicting};
}

BookingResult<data::Appointment> AppointmentService::applyChanges(const data::Appointment &current,
                                                                  const AppointmentChanges &changes) const
{
    data::Appointment candidate = current;
    if (changes.customerRef) {
        candidate.customerRef = *changes.customerRef;
    }
    if (changes.clearServiceRef) {
        candidate.serviceRef.reset();
    } else if (changes.serviceRef) {
        candidate.serviceRef = changes.serviceRef;
    }
    if (changes.providerId) {
        candidate.providerId = *changes.providerId;
    }
    if (changes.start) {
        candidate.start = *changes.start;
    }
    if (changes.durationMinutes) {
        candidate.durationMinutes = *changes.durationMinutes;
    }
    if (changes.channel) {
        candidate.channel = *changes.channel;
    }
    if (changes.clearPrice) {
        candidate.price.reset();
    } else if (changes.price) {
        candidate.price = changes.price;
    }
    if (changes.notes) {
        candidate.notes = *changes.notes;
    }
    if (changes.status) {
        if (!m_transitionPolicy(current.status, *changes.status)) {
            return transitionError(current.status, *changes.status);
        }
        candidate.status = *changes.status;
    }
    return candidate;
}

BookingError AppointmentService::scheduleBusyError(int providerId, const QDate &day) const
{
    return storageError(QStringLiteral("schedule of provider %1 on %2 is busy, retry")
                            .arg(providerId)
                            .arg(day.toString(Qt::ISODate)));
}

BookingError AppointmentService::transitionError(data::AppointmentStatus from, data::AppointmentStatus to) const
{
    return validationError(QStringLiteral("status change from %1 to %2 is not allowed")
                               .arg(data::statusToString(from), data::statusToString(to)));
}

BookingResult<data::Appointment> AppointmentService::commitChange(int id,
                                                                  const AccessScope &scope,
                                                                  const ChangeBuilder &build)
{
    for (int attempt = 0; attempt < kMaxCommitAttempts; ++attempt) {
        const auto planned = findAppointment(id, scope);
        if (!planned) {
            return planned.error();
        }
        const auto plannedCandidate = build(planned.value());
        if (!plannedCandidate) {
            return plannedCandidate.error();
        }
        if (const auto error = validate(plannedCandidate.value(), scope)) {
            qCInfo(lcBooking) << "update of" << id << "rejected:" << error->message;
            return *error;
        }

        // Every writer of a record holds the schedule it currently sits in,
        // so the copy read below stays current until the write. The target
        // schedule is held as well when the record moves. Locks are taken in
        // (provider, day) order.
        const std::pair<int, QDate> source{planned->providerId, m_reference.dayOf(planned->start)};
        const std::pair<int, QDate> target{plannedCandidate->providerId, m_reference.dayOf(plannedCandidate->start)};
        std::vector<std::pair<int, QDate>> keys{std::min(source, target)};
        if (source != target) {
            keys.push_back(std::max(source, target));
        }
        std::vector<std::unique_ptr<data::ScheduleLock>> locks;
        for (const auto &key : keys) {
            auto lock = m_repository.lockSchedule(key.first, key.second);
            if (!lock) {
                return scheduleBusyError(key.first, key.second);
            }
            locks.push_back(std::move(lock));
        }

        const auto current = findAppointment(id, scope);
        if (!current) {
            return current.error();
        }
        if (current->providerId != source.first || m_reference.dayOf(current->start) != source.second) {
            qCDebug(lcBooking) << "appointment" << id << "moved while updating, retrying";
            continue;
        }
        const auto candidate = build(current.value());
        if (!candidate) {
            return candidate.error();
        }
        if (const auto error = validate(candidate.value(), scope)) {
            return *error;
        }

        // Only a change of time or provider, or a cancelled or no-show record
        // coming back into play, can collide with other bookings.
        const bool reactivated = candidate->isActive() && !current->isActive();
        if (candidate->isActive() && (timingChanged(current.value(), candidate.value()) || reactivated)) {
            const auto sameDay = sameDayAppointments(candidate->providerId, candidate->start);
            if (!sameDay) {
                return sameDay.error();
            }
            const ConflictQuery query{candidate->providerId, candidate->start, candidate->durationMinutes, id};
            if (const auto conflicting = findConflict(query, sameDay.value(), m_reference)) {
                qCInfo(lcBooking) << "update of" << id << "rejected: overlaps #" << conflicting->id;
                return conflictError(*conflicting);
            }
        }

        if (!m_repository.updateAppointment(candidate.value())) {
            // Removed by someone else between load and commit.
            bool readOk = false;
            if (!m_repository.findById(id, &readOk) && readOk) {
                return notFoundError(id);
            }
            return storageError(QStringLiteral("appointment #%1 could not be stored").arg(id));
        }
        qCDebug(lcBooking) << "updated appointment" << id << "status" << data::statusToString(candidate->status);
        return candidate.value();
    }
    return storageError(QStringLiteral("appointment #%1 kept moving while it was updated, retry").arg(id));
}

} // namespace core
} // namespace agenda
