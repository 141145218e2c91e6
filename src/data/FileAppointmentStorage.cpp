#include "agenda/data/FileAppointmentStorage.hpp"

#include "agenda/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QMutexLocker>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace agenda {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr int STORE_LOCK_TIMEOUT_MS = 5000;
constexpr int STALE_LOCK_MS = 30000;

QString lockPathFor(const QString &filePath)
{
    return filePath + QStringLiteral(".lock");
}

std::optional<int> parsePositiveInt(const QString &value)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok || parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}
} // namespace

FileAppointmentStorage::FileAppointmentStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileAppointmentStorage::filePath() const
{
    return m_filePath;
}

std::vector<Appointment> FileAppointmentStorage::appointments(bool *ok) const
{
    QMutexLocker locker(&m_mutex);
    Snapshot snapshot;
    std::vector<Appointment> result;
    const bool loaded = load(snapshot);
    if (ok) {
        *ok = loaded;
    }
    if (!loaded) {
        return result;
    }
    result.reserve(snapshot.appointments.size());
    for (const auto &entry : snapshot.appointments) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<Appointment> FileAppointmentStorage::find(int id, bool *ok) const
{
    QMutexLocker locker(&m_mutex);
    Snapshot snapshot;
    const bool loaded = load(snapshot);
    if (ok) {
        *ok = loaded;
    }
    if (!loaded) {
        return std::nullopt;
    }
    const auto it = snapshot.appointments.find(id);
    if (it == snapshot.appointments.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Appointment> FileAppointmentStorage::insert(Appointment appointment)
{
    QMutexLocker locker(&m_mutex);
    QLockFile storeLock(lockPathFor(m_filePath));
    storeLock.setStaleLockTime(STALE_LOCK_MS);
    if (!storeLock.tryLock(STORE_LOCK_TIMEOUT_MS)) {
        qCWarning(lcStorage) << "could not lock" << m_filePath << "for insert";
        return std::nullopt;
    }

    Snapshot snapshot;
    if (!load(snapshot)) {
        return std::nullopt;
    }
    appointment.id = snapshot.nextId++;
    snapshot.appointments[appointment.id] = appointment;
    if (!save(snapshot)) {
        return std::nullopt;
    }
    return appointment;
}

bool FileAppointmentStorage::replace(const Appointment &appointment)
{
    QMutexLocker locker(&m_mutex);
    QLockFile storeLock(lockPathFor(m_filePath));
    storeLock.setStaleLockTime(STALE_LOCK_MS);
    if (!storeLock.tryLock(STORE_LOCK_TIMEOUT_MS)) {
        qCWarning(lcStorage) << "could not lock" << m_filePath << "for update";
        return false;
    }

    Snapshot snapshot;
    if (!load(snapshot)) {
        return false;
    }
    const auto it = snapshot.appointments.find(appointment.id);
    if (it == snapshot.appointments.end()) {
        return false;
    }
    it->second = appointment;
    return save(snapshot);
}

bool FileAppointmentStorage::remove(int id)
{
    QMutexLocker locker(&m_mutex);
    QLockFile storeLock(lockPathFor(m_filePath));
    storeLock.setStaleLockTime(STALE_LOCK_MS);
    if (!storeLock.tryLock(STORE_LOCK_TIMEOUT_MS)) {
        qCWarning(lcStorage) << "could not lock" << m_filePath << "for removal";
        return false;
    }

    Snapshot snapshot;
    if (!load(snapshot)) {
        return false;
    }
    if (snapshot.appointments.erase(id) == 0) {
        return false;
    }
    return save(snapshot);
}

QString FileAppointmentStorage::scheduleLockPath(int providerId, const QDate &day) const
{
    const QFileInfo info(m_filePath);
    const QString lockDir = info.dir().filePath(info.completeBaseName() + QStringLiteral(".locks"));
    return QDir(lockDir).filePath(
        QStringLiteral("provider-%1-%2.lock").arg(providerId).arg(day.toString(QStringLiteral("yyyyMMdd"))));
}

bool FileAppointmentStorage::load(Snapshot &snapshot) const
{
    snapshot = Snapshot{};

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot open" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inEvent = false;
    bool hasDuration = false;
    QDateTime eventEnd;
    Appointment current;

    auto finalizeEvent = [&]() {
        if (current.id <= 0) {
            qCWarning(lcStorage) << "skipping appointment without UID in" << m_filePath;
            return;
        }
        if (!hasDuration && current.start.isValid() && eventEnd > current.start) {
            current.durationMinutes = static_cast<int>(current.start.secsTo(eventEnd) / 60);
        }
        snapshot.appointments[current.id] = current;
        snapshot.nextId = std::max(snapshot.nextId, current.id + 1);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            hasDuration = false;
            eventEnd = QDateTime();
            current = Appointment{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeEvent();
            inEvent = false;
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }
        const QString name = line.left(colonIndex).section(';', 0, 0).toUpper();
        const QString rawValue = line.mid(colonIndex + 1);

        if (!inEvent) {
            if (name == QLatin1String("X-AGENDA-NEXT-ID")) {
                snapshot.nextId = std::max(snapshot.nextId, parsePositiveInt(rawValue).value_or(1));
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            current.id = parsePositiveInt(rawValue).value_or(0);
        } else if (name == QLatin1String("DTSTART")) {
            current.start = parseDateTime(rawValue);
        } else if (name == QLatin1String("DTEND")) {
            eventEnd = parseDateTime(rawValue);
        } else if (name == QLatin1String("X-AGENDA-DURATION")) {
            if (const auto duration = parsePositiveInt(rawValue)) {
                current.durationMinutes = *duration;
                hasDuration = true;
            }
        } else if (name == QLatin1String("X-AGENDA-PROVIDER")) {
            current.providerId = parsePositiveInt(rawValue).value_or(0);
        } else if (name == QLatin1String("X-AGENDA-CUSTOMER")) {
            current.customerRef = parsePositiveInt(rawValue).value_or(0);
        } else if (name == QLatin1String("X-AGENDA-SERVICE")) {
            current.serviceRef = parsePositiveInt(rawValue);
        } else if (name == QLatin1String("X-AGENDA-STATUS")) {
            current.status = statusFromString(rawValue).value_or(AppointmentStatus::Scheduled);
        } else if (name == QLatin1String("X-AGENDA-CHANNEL")) {
            current.channel = channelFromString(rawValue).value_or(BookingChannel::Online);
        } else if (name == QLatin1String("X-AGENDA-PRICE")) {
            bool ok = false;
            const double price = rawValue.toDouble(&ok);
            if (ok) {
                current.price = price;
            }
        } else if (name == QLatin1String("DESCRIPTION")) {
            current.notes = decodeText(rawValue);
        }
    };

    // Folded lines continue with a leading space or tab.
    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    return true;
}

bool FileAppointmentStorage::save(const Snapshot &snapshot) const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot write" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Agenda//EN\n";
    stream << "X-AGENDA-NEXT-ID:" << snapshot.nextId << '\n';

    std::vector<Appointment> appointments;
    appointments.reserve(snapshot.appointments.size());
    for (const auto &entry : snapshot.appointments) {
        appointments.push_back(entry.second);
    }
    std::stable_sort(appointments.begin(), appointments.end(), [](const Appointment &lhs, const Appointment &rhs) {
        return lhs.start < rhs.start;
    });

    for (const Appointment &appointment : appointments) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << appointment.id << '\n';
        stream << "DTSTART:" << formatDateTime(appointment.start) << '\n';
        stream << "DTEND:" << formatDateTime(appointment.end()) << '\n';
        stream << "X-AGENDA-DURATION:" << appointment.durationMinutes << '\n';
        stream << "X-AGENDA-PROVIDER:" << appointment.providerId << '\n';
        stream << "X-AGENDA-CUSTOMER:" << appointment.customerRef << '\n';
        if (appointment.serviceRef) {
            stream << "X-AGENDA-SERVICE:" << *appointment.serviceRef << '\n';
        }
        stream << "X-AGENDA-STATUS:" << statusToString(appointment.status) << '\n';
        stream << "X-AGENDA-CHANNEL:" << channelToString(appointment.channel) << '\n';
        if (appointment.price) {
            stream << "X-AGENDA-PRICE:" << QString::number(*appointment.price, 'g', 12) << '\n';
        }
        if (!appointment.notes.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(appointment.notes) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStorage) << "commit failed for" << m_filePath << file.errorString();
        return false;
    }
    qCDebug(lcStorage) << "wrote" << appointments.size() << "appointments to" << m_filePath;
    return true;
}

QString FileAppointmentStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileAppointmentStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != '\\' || i + 1 >= text.size()) {
            decoded += ch;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded += '\n';
        } else {
            decoded += next;
        }
    }
    return decoded;
}

QString FileAppointmentStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileAppointmentStorage::parseDateTime(const QString &value)
{
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime dt = QDateTime::fromString(value, "yyyyMMdd'T'hhmmss");
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

} // namespace data
} // namespace agenda
