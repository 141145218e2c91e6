#include "agenda/core/TimeReference.hpp"

#include <QRegularExpression>

namespace agenda {
namespace core {

TimeReference::TimeReference()
    : m_zone(QTimeZone::utc())
{
}

TimeReference::TimeReference(QTimeZone zone)
    : m_zone(zone.isValid() ? std::move(zone) : QTimeZone::utc())
{
}

const QTimeZone &TimeReference::zone() const
{
    return m_zone;
}

QDate TimeReference::dayOf(const QDateTime &timestamp) const
{
    return timestamp.toTimeZone(m_zone).date();
}

TimeInterval TimeReference::dayWindow(const QDate &day) const
{
    return {day.startOfDay(m_zone), day.addDays(1).startOfDay(m_zone)};
}

QDateTime TimeReference::at(const QDate &day, const QTime &time) const
{
    return QDateTime(day, time, m_zone);
}

std::optional<QDateTime> TimeReference::parseTimestamp(const QString &text) const
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2})[T ](\\d{2}:\\d{2})(?::(\\d{2}))?(?:\\.\\d+)?(Z|[+-]\\d{2}:?\\d{2})?$"));
    const QRegularExpressionMatch match = pattern.match(text.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const QDate date = QDate::fromString(match.captured(1), Qt::ISODate);
    const QString seconds = match.captured(3).isEmpty() ? QStringLiteral("00") : match.captured(3);
    const QTime time = QTime::fromString(match.captured(2) + QLatin1Char(':') + seconds, QStringLiteral("HH:mm:ss"));
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }

    const QString offset = match.captured(4);
    if (offset.isEmpty()) {
        const QDateTime local(date, time, m_zone);
        if (!local.isValid()) {
            return std::nullopt;
        }
        return local;
    }
    if (offset == QLatin1String("Z")) {
        return QDateTime(date, time, Qt::UTC);
    }

    QString digits = offset.mid(1);
    digits.remove(QLatin1Char(':'));
    const int hours = digits.left(2).toInt();
    const int minutes = digits.mid(2, 2).toInt();
    if (hours > 14 || minutes > 59) {
        return std::nullopt;
    }
    const int sign = offset.startsWith(QLatin1Char('-')) ? -1 : 1;
    return QDateTime(date, time, Qt::OffsetFromUTC, sign * (hours * 3600 + minutes * 60));
}

QString TimeReference::formatTimestamp(const QDateTime &timestamp) const
{
    return timestamp.toTimeZone(m_zone).toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss"));
}

} // namespace core
} // namespace agenda
