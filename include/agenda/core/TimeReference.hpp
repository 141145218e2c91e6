#pragma once

#include <optional>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include "agenda/core/TimeInterval.hpp"

namespace agenda {
namespace core {

// The single time zone the business runs on. Calendar days, business hours
// and timestamps without an offset are all interpreted against it.
class TimeReference
{
public:
    TimeReference();
    explicit TimeReference(QTimeZone zone);

    const QTimeZone &zone() const;

    QDate dayOf(const QDateTime &timestamp) const;
    TimeInterval dayWindow(const QDate &day) const;
    QDateTime at(const QDate &day, const QTime &time) const;

    // Accepts YYYY-MM-DDTHH:MM[:SS] with an optional Z or +HH:MM suffix.
    std::optional<QDateTime> parseTimestamp(const QString &text) const;
    QString formatTimestamp(const QDateTime &timestamp) const;

private:
    QTimeZone m_zone;
};

} // namespace core
} // namespace agenda
