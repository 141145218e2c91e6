#pragma once

#include <functional>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace core {

using TransitionPolicy = std::function<bool(data::AppointmentStatus from, data::AppointmentStatus to)>;

// Any status may follow any status.
TransitionPolicy permissiveTransitions();

// scheduled -> confirmed | cancelled | no_show
// confirmed -> completed | cancelled | no_show
// completed, cancelled, no_show are final. Re-applying the current status is
// always allowed.
TransitionPolicy strictTransitions();

} // namespace core
} // namespace agenda
