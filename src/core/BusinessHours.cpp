#include "agenda/core/BusinessHours.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/TimeReference.hpp"

#include <QSettings>
#include <QStringList>
#include <algorithm>

namespace agenda {
namespace core {

namespace {
constexpr auto HOURS_GROUP = "hours";
constexpr auto PROVIDER_PREFIX = "provider_";

OpeningHours fallbackHours()
{
    return {{QTime(9, 0), QTime(19, 0)}};
}
} // namespace

std::optional<OpeningHours> parseOpeningHours(const QString &text)
{
    OpeningHours hours;
    const QStringList windows = text.split(',', Qt::SkipEmptyParts);
    for (const QString &window : windows) {
        const QStringList bounds = window.trimmed().split('-');
        if (bounds.size() != 2) {
            return std::nullopt;
        }
        const QTime open = QTime::fromString(bounds.at(0).trimmed(), QStringLiteral("H:mm"));
        const QTime close = QTime::fromString(bounds.at(1).trimmed(), QStringLiteral("H:mm"));
        if (!open.isValid() || !close.isValid() || close <= open) {
            return std::nullopt;
        }
        hours.push_back({open, close});
    }
    if (hours.empty()) {
        return std::nullopt;
    }
    std::sort(hours.begin(), hours.end(), [](const OpeningWindow &lhs, const OpeningWindow &rhs) {
        return lhs.open < rhs.open;
    });
    return hours;
}

QString formatOpeningHours(const OpeningHours &hours)
{
    QStringList parts;
    for (const OpeningWindow &window : hours) {
        parts << QStringLiteral("%1-%2").arg(window.open.toString(QStringLiteral("HH:mm")),
                                             window.close.toString(QStringLiteral("HH:mm")));
    }
    return parts.join(',');
}

BusinessHoursProvider::BusinessHoursProvider()
    : m_defaultHours(fallbackHours())
{
}

BusinessHoursProvider::BusinessHoursProvider(OpeningHours defaultHours)
    : m_defaultHours(defaultHours.empty() ? fallbackHours() : std::move(defaultHours))
{
}

void BusinessHoursProvider::load(QSettings &settings)
{
    m_sourceFile = settings.fileName();
    m_defaultHours = fallbackHours();
    m_providerHours.clear();

    settings.beginGroup(QLatin1String(HOURS_GROUP));
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys) {
        // QSettings splits unquoted comma lists into string lists.
        const QVariant value = settings.value(key);
        const QString text = value.type() == QVariant::StringList ? value.toStringList().join(',') : value.toString();
        const auto hours = parseOpeningHours(text);
        if (!hours) {
            qCWarning(lcConfig) << "ignoring malformed opening hours" << key << "=" << text;
            continue;
        }
        if (key == QLatin1String("default")) {
            m_defaultHours = *hours;
            continue;
        }
        if (!key.startsWith(QLatin1String(PROVIDER_PREFIX))) {
            qCWarning(lcConfig) << "unknown key in [hours]:" << key;
            continue;
        }
        bool ok = false;
        const int providerId = key.mid(static_cast<int>(qstrlen(PROVIDER_PREFIX))).toInt(&ok);
        if (!ok || providerId <= 0) {
            qCWarning(lcConfig) << "invalid provider id in [hours]:" << key;
            continue;
        }
        m_providerHours.insert(providerId, *hours);
    }
    settings.endGroup();

    qCDebug(lcConfig) << "loaded opening hours for" << m_providerHours.size() << "providers, default"
                      << formatOpeningHours(m_defaultHours);
}

void BusinessHoursProvider::reload()
{
    if (m_sourceFile.isEmpty()) {
        return;
    }
    QSettings settings(m_sourceFile, QSettings::IniFormat);
    load(settings);
}

void BusinessHoursProvider::setDefaultHours(OpeningHours hours)
{
    if (hours.empty()) {
        return;
    }
    m_defaultHours = std::move(hours);
}

void BusinessHoursProvider::setProviderHours(int providerId, OpeningHours hours)
{
    m_providerHours.insert(providerId, std::move(hours));
}

void BusinessHoursProvider::clearProviderHours(int providerId)
{
    m_providerHours.remove(providerId);
}

const OpeningHours &BusinessHoursProvider::defaultHours() const
{
    return m_defaultHours;
}

OpeningHours BusinessHoursProvider::hoursFor(int providerId) const
{
    return m_providerHours.value(providerId, m_defaultHours);
}

IntervalList BusinessHoursProvider::intervalsOn(int providerId, const QDate &day, const TimeReference &reference) const
{
    IntervalList intervals;
    for (const OpeningWindow &window : hoursFor(providerId)) {
        const QDateTime open = reference.at(day, window.open);
        const QDateTime close = reference.at(day, window.close);
        if (open < close) {
            intervals.push_back({open, close});
        }
    }
    return mergeIntervals(std::move(intervals));
}

} // namespace core
} // namespace agenda
