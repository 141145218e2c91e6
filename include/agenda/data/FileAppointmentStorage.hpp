#pragma once

#include <map>
#include <optional>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QMutex>
#include <QString>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace data {

// iCalendar-style text file holding one VEVENT per appointment. Every read
// goes back to the file so that several processes can share it; every
// write is reload-modify-save under a store-wide lock file.
class FileAppointmentStorage
{
public:
    explicit FileAppointmentStorage(QString filePath);
    ~FileAppointmentStorage() = default;

    const QString &filePath() const;

    // Both set *ok to false when the file exists but cannot be read.
    std::vector<Appointment> appointments(bool *ok = nullptr) const;
    std::optional<Appointment> find(int id, bool *ok = nullptr) const;

    std::optional<Appointment> insert(Appointment appointment);
    bool replace(const Appointment &appointment);
    bool remove(int id);

    QString scheduleLockPath(int providerId, const QDate &day) const;

private:
    struct Snapshot
    {
        std::map<int, Appointment> appointments;
        int nextId = 1;
    };

    bool load(Snapshot &snapshot) const;
    bool save(const Snapshot &snapshot) const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    mutable QMutex m_mutex;
};

} // namespace data
} // namespace agenda
