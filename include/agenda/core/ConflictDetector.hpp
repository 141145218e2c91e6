#pragma once

#include <optional>
#include <vector>

#include <QDateTime>

#include "agenda/core/TimeReference.hpp"
#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace core {

struct ConflictQuery
{
    int providerId = 0;
    QDateTime start;
    int durationMinutes = 0;
    std::optional<int> excludeId;
};

// First active appointment of the same provider, on the same calendar day,
// whose [start, end) overlaps the candidate window. Candidates are visited in
// the order given.
std::optional<data::Appointment> findConflict(const ConflictQuery &query,
                                              const std::vector<data::Appointment> &existing,
                                              const TimeReference &reference);

} // namespace core
} // namespace agenda
