#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {

QString statusToString(AppointmentStatus status)
{
    switch (status) {
    case AppointmentStatus::Confirmed:
        return QStringLiteral("confirmed");
    case AppointmentStatus::Completed:
        return QStringLiteral("completed");
    case AppointmentStatus::Cancelled:
        return QStringLiteral("cancelled");
    case AppointmentStatus::NoShow:
        return QStringLiteral("no_show");
    case AppointmentStatus::Scheduled:
    default:
        return QStringLiteral("scheduled");
    }
}

std::optional<AppointmentStatus> statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("scheduled")) {
        return AppointmentStatus::Scheduled;
    }
    if (normalized == QLatin1String("confirmed")) {
        return AppointmentStatus::Confirmed;
    }
    if (normalized == QLatin1String("completed")) {
        return AppointmentStatus::Completed;
    }
    if (normalized == QLatin1String("cancelled")) {
        return AppointmentStatus::Cancelled;
    }
    if (normalized == QLatin1String("no_show")) {
        return AppointmentStatus::NoShow;
    }
    return std::nullopt;
}

QString channelToString(BookingChannel channel)
{
    switch (channel) {
    case BookingChannel::Phone:
        return QStringLiteral("phone");
    case BookingChannel::WalkIn:
        return QStringLiteral("walk_in");
    case BookingChannel::Online:
    default:
        return QStringLiteral("online");
    }
}

std::optional<BookingChannel> channelFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("online")) {
        return BookingChannel::Online;
    }
    if (normalized == QLatin1String("phone")) {
        return BookingChannel::Phone;
    }
    if (normalized == QLatin1String("walk_in") || normalized == QLatin1String("walkin")) {
        return BookingChannel::WalkIn;
    }
    return std::nullopt;
}

} // namespace data
} // namespace agenda
