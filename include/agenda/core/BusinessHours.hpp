#pragma once

#include <optional>
#include <vector>

#include <QHash>
#include <QString>
#include <QTime>

#include "agenda/core/TimeInterval.hpp"

class QSettings;

namespace agenda {
namespace core {

class TimeReference;

struct OpeningWindow
{
    QTime open;
    QTime close;

    bool operator==(const OpeningWindow &other) const { return open == other.open && close == other.close; }
};

using OpeningHours = std::vector<OpeningWindow>;

// "08:00-12:00,14:00-19:00". Returns nullopt if any window is malformed or
// closes before it opens.
std::optional<OpeningHours> parseOpeningHours(const QString &text);
QString formatOpeningHours(const OpeningHours &hours);

// Per-provider opening hours with a fallback template for providers that
// have none. Filled from the "hours" settings group.
class BusinessHoursProvider
{
public:
    BusinessHoursProvider();
    explicit BusinessHoursProvider(OpeningHours defaultHours);

    void load(QSettings &settings);
    void reload();

    void setDefaultHours(OpeningHours hours);
    void setProviderHours(int providerId, OpeningHours hours);
    void clearProviderHours(int providerId);

    const OpeningHours &defaultHours() const;
    OpeningHours hoursFor(int providerId) const;
    IntervalList intervalsOn(int providerId, const QDate &day, const TimeReference &reference) const;

private:
    QString m_sourceFile;
    OpeningHours m_defaultHours;
    QHash<int, OpeningHours> m_providerHours;
};

} // namespace core
} // namespace agenda
