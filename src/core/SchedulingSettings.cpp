#include "agenda/core/SchedulingSettings.hpp"

#include "agenda/core/Logging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace agenda {
namespace core {

namespace {
constexpr auto SERVICE_PREFIX = "service_";

int positiveValue(QSettings &settings, const QString &key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcConfig) << "ignoring non-positive" << key << "=" << settings.value(key).toString();
        return fallback;
    }
    return value;
}
} // namespace

SchedulingSettings SchedulingSettings::fromSettings(QSettings &settings)
{
    SchedulingSettings result;

    settings.beginGroup(QStringLiteral("schedule"));
    const QString zoneId = settings.value(QStringLiteral("timeZone"), QStringLiteral("UTC")).toString();
    const QTimeZone zone(zoneId.toUtf8());
    if (zone.isValid()) {
        result.timeZone = zone;
    } else {
        qCWarning(lcConfig) << "unknown time zone" << zoneId << "- using UTC";
    }
    result.defaultDurationMinutes =
        positiveValue(settings, QStringLiteral("defaultDurationMinutes"), result.defaultDurationMinutes);
    result.slotStepMinutes = positiveValue(settings, QStringLiteral("slotStepMinutes"), result.slotStepMinutes);

    const int buffer = settings.value(QStringLiteral("bufferMinutes"), 0).toInt();
    if (buffer < 0) {
        qCWarning(lcConfig) << "ignoring negative bufferMinutes" << buffer;
    } else {
        result.bufferMinutes = buffer;
    }
    result.storageFile = settings.value(QStringLiteral("storageFile"), defaultStorageFile()).toString();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("services"));
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys) {
        if (!key.startsWith(QLatin1String(SERVICE_PREFIX))) {
            continue;
        }
        bool idOk = false;
        const int serviceRef = key.mid(static_cast<int>(qstrlen(SERVICE_PREFIX))).toInt(&idOk);
        bool durationOk = false;
        const int minutes = settings.value(key).toInt(&durationOk);
        if (!idOk || !durationOk || serviceRef <= 0 || minutes <= 0) {
            qCWarning(lcConfig) << "ignoring service duration" << key << "=" << settings.value(key).toString();
            continue;
        }
        result.serviceDurations.insert(serviceRef, minutes);
    }
    settings.endGroup();

    qCDebug(lcConfig) << "time zone" << result.timeZone.id() << "storage" << result.storageFile;
    return result;
}

QString SchedulingSettings::defaultStorageFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/agenda");
    }
    return QDir(storageFolder).filePath(QStringLiteral("appointments.ics"));
}

} // namespace core
} // namespace agenda
