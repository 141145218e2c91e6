#include "agenda/core/TransitionPolicy.hpp"

namespace agenda {
namespace core {

using data::AppointmentStatus;

TransitionPolicy permissiveTransitions()
{
    return [](AppointmentStatus, AppointmentStatus) { return true; };
}

TransitionPolicy strictTransitions()
{
    return [](AppointmentStatus from, AppointmentStatus to) {
        if (from == to) {
            return true;
        }
        switch (from) {
        case AppointmentStatus::Scheduled:
            return to == AppointmentStatus::Confirmed || to == AppointmentStatus::Cancelled
                   || to == AppointmentStatus::NoShow;
        case AppointmentStatus::Confirmed:
            return to == AppointmentStatus::Completed || to == AppointmentStatus::Cancelled
                   || to == AppointmentStatus::NoShow;
        case AppointmentStatus::Completed:
        case AppointmentStatus::Cancelled:
        case AppointmentStatus::NoShow:
            return false;
        }
        return false;
    };
}

} // namespace core
} // namespace agenda
