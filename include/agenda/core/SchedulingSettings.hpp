#pragma once

#include <QHash>
#include <QString>
#include <QTimeZone>


class QSettings;

namespace agenda {
namespace core {

struct SchedulingSettings
{
    QTimeZone timeZone = QTimeZone::utc();
    int defaultDurationMinutes = 30;
    int slotStepMinutes = 15;
    int bufferMinutes = 0;
    QString storageFile;
    QHash<int, int> serviceDurations;

    static SchedulingSettings fromSettings(QSettings &settings);
    static QString defaultStorageFile();
};

} // namespace core
} // namespace agenda
