#include "agenda/core/ConflictDetector.hpp"

namespace agenda {
namespace core {

std::optional<data::Appointment> findConflict(const ConflictQuery &query,
                                              const std::vector<data::Appointment> &existing,
                                              const TimeReference &reference)
{
    if (!query.start.isValid() || query.durationMinutes <= 0) {
        return std::nullopt;
    }
    const TimeInterval candidate{query.start, query.start.addSecs(static_cast<qint64>(query.durationMinutes) * 60)};
    const QDate day = reference.dayOf(query.start);

    for (const data::Appointment &appointment : existing) {
        if (appointment.providerId != query.providerId || !appointment.isActive()) {
            continue;
        }
        if (query.excludeId && appointment.id == *query.excludeId) {
            continue;
        }
        if (reference.dayOf(appointment.start) != day) {
            continue;
        }
        if (candidate.overlaps({appointment.start, appointment.end()})) {
            return appointment;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace agenda
