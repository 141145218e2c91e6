#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

namespace agenda {
namespace data {

enum class AppointmentStatus
{
    Scheduled,
    Confirmed,
    Completed,
    Cancelled,
    NoShow,
};

enum class BookingChannel
{
    Online,
    Phone,
    WalkIn,
};

struct Appointment
{
    int id = 0;
    int customerRef = 0;
    std::optional<int> serviceRef;
    int providerId = 0;
    QDateTime start;
    int durationMinutes = 30;
    AppointmentStatus status = AppointmentStatus::Scheduled;
    BookingChannel channel = BookingChannel::Online;
    std::optional<double> price;
    QString notes;

    QDateTime end() const { return start.addSecs(static_cast<qint64>(durationMinutes) * 60); }

    // Cancelled and no-show appointments never block a time window.
    bool isActive() const
    {
        return status != AppointmentStatus::Cancelled && status != AppointmentStatus::NoShow;
    }
};

QString statusToString(AppointmentStatus status);
std::optional<AppointmentStatus> statusFromString(const QString &value);

QString channelToString(BookingChannel channel);
std::optional<BookingChannel> channelFromString(const QString &value);

} // namespace data
} // namespace agenda
