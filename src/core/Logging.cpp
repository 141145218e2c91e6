#include "agenda/core/Logging.hpp"

namespace agenda {

Q_LOGGING_CATEGORY(lcBooking, "agenda.booking")
Q_LOGGING_CATEGORY(lcAvailability, "agenda.availability")
Q_LOGGING_CATEGORY(lcStorage, "agenda.storage")
Q_LOGGING_CATEGORY(lcConfig, "agenda.config")

} // namespace agenda
