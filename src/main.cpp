#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QDir>
#include <QTextStream>

#include <optional>

#include "version.h"

#include "agenda/core/AppContext.hpp"
#include "agenda/core/AppointmentService.hpp"

using namespace agenda;

namespace {

enum ExitCode
{
    ExitOk = 0,
    ExitUsage = 1,
    ExitValidation = 2,
    ExitNotFound = 3,
    ExitConflict = 4,
    ExitStorage = 5,
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int report(const core::BookingError &error)
{
    err() << error.message << Qt::endl;
    switch (error.kind) {
    case core::ErrorKind::Validation:
        return ExitValidation;
    case core::ErrorKind::NotFound:
        return ExitNotFound;
    case core::ErrorKind::Conflict:
        return ExitConflict;
    case core::ErrorKind::Storage:
        return ExitStorage;
    }
    return ExitStorage;
}

int usage(const QString &message)
{
    err() << message << Qt::endl;
    return ExitUsage;
}

int invalidOption(const QString &message)
{
    err() << message << Qt::endl;
    return ExitValidation;
}

QString describe(const data::Appointment &appointment, const core::TimeReference &reference)
{
    QString line = QStringLiteral("#%1 provider=%2 customer=%3 %4..%5 (%6 min) %7 %8")
                       .arg(appointment.id)
                       .arg(appointment.providerId)
                       .arg(appointment.customerRef)
                       .arg(reference.formatTimestamp(appointment.start), reference.formatTimestamp(appointment.end()))
                       .arg(appointment.durationMinutes)
                       .arg(data::statusToString(appointment.status), data::channelToString(appointment.channel));
    if (appointment.serviceRef) {
        line += QStringLiteral(" service=%1").arg(*appointment.serviceRef);
    }
    if (appointment.price) {
        line += QStringLiteral(" price=%1").arg(*appointment.price);
    }
    if (!appointment.notes.isEmpty()) {
        line += QStringLiteral(" notes=\"%1\"").arg(appointment.notes);
    }
    return line;
}

// Missing option -> nullopt without error; present but not a number -> error.
bool readInt(const QCommandLineParser &parser, const QString &name, std::optional<int> &value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const int parsed = parser.value(name).toInt(&ok);
    if (!ok) {
        err() << "--" << name << " expects a number" << Qt::endl;
        return false;
    }
    value = parsed;
    return true;
}

bool readTimestamp(const QCommandLineParser &parser,
                   const QString &name,
                   const core::TimeReference &reference,
                   std::optional<QDateTime> &value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    const auto parsed = reference.parseTimestamp(parser.value(name));
    if (!parsed) {
        err() << "--" << name << " must be ISO 8601: YYYY-MM-DDTHH:MM[:SS]" << Qt::endl;
        return false;
    }
    value = parsed;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Agenda"));
    QCoreApplication::setApplicationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kAgendaVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Appointment booking and availability"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("slots | check | book | update | status | delete | list"));
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("INI configuration file."), QStringLiteral("file"),
         QDir::current().filePath(QStringLiteral("agenda.ini"))},
        {QStringLiteral("scope"), QStringLiteral("Act only on this provider's appointments."), QStringLiteral("provider")},
        {QStringLiteral("id"), QStringLiteral("Appointment id."), QStringLiteral("id")},
        {QStringLiteral("provider"), QStringLiteral("Provider id."), QStringLiteral("id")},
        {QStringLiteral("customer"), QStringLiteral("Customer reference."), QStringLiteral("id")},
        {QStringLiteral("service"), QStringLiteral("Catalog service reference, 0 clears it."), QStringLiteral("id")},
        {QStringLiteral("date"), QStringLiteral("Day for slot listing (YYYY-MM-DD)."), QStringLiteral("date")},
        {QStringLiteral("start"), QStringLiteral("Start timestamp."), QStringLiteral("timestamp")},
        {QStringLiteral("from"), QStringLiteral("Listing range start."), QStringLiteral("timestamp")},
        {QStringLiteral("to"), QStringLiteral("Listing range end (inclusive)."), QStringLiteral("timestamp")},
        {QStringLiteral("duration"), QStringLiteral("Duration in minutes."), QStringLiteral("minutes")},
        {QStringLiteral("step"), QStringLiteral("Slot step in minutes."), QStringLiteral("minutes")},
        {QStringLiteral("buffer"), QStringLiteral("Buffer after each appointment."), QStringLiteral("minutes")},
        {QStringLiteral("exclude"), QStringLiteral("Appointment id to ignore in checks."), QStringLiteral("id")},
        {QStringLiteral("status"), QStringLiteral("scheduled | confirmed | completed | cancelled | no_show"),
         QStringLiteral("status")},
        {QStringLiteral("channel"), QStringLiteral("online | phone | walk_in"), QStringLiteral("channel")},
        {QStringLiteral("price"), QStringLiteral("Price override, empty clears it."), QStringLiteral("amount")},
        {QStringLiteral("notes"), QStringLiteral("Free text."), QStringLiteral("text")},
    });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        return usage(QStringLiteral("expected exactly one command, see --help"));
    }
    const QString command = positional.first();

    core::AppContext context(parser.value(QStringLiteral("config")));
    core::AppointmentService &service = context.appointmentService();
    const core::TimeReference &reference = service.timeReference();
    const core::SchedulingSettings &settings = context.settings();

    std::optional<int> scopeProvider;
    std::optional<int> id;
    std::optional<int> provider;
    std::optional<int> customer;
    std::optional<int> serviceRef;
    std::optional<int> duration;
    std::optional<int> step;
    std::optional<int> buffer;
    std::optional<int> exclude;
    std::optional<QDateTime> start;
    std::optional<QDateTime> from;
    std::optional<QDateTime> to;
    if (!readInt(parser, QStringLiteral("scope"), scopeProvider) || !readInt(parser, QStringLiteral("id"), id)
        || !readInt(parser, QStringLiteral("provider"), provider)
        || !readInt(parser, QStringLiteral("customer"), customer)
        || !readInt(parser, QStringLiteral("service"), serviceRef)
        || !readInt(parser, QStringLiteral("duration"), duration) || !readInt(parser, QStringLiteral("step"), step)
        || !readInt(parser, QStringLiteral("buffer"), buffer) || !readInt(parser, QStringLiteral("exclude"), exclude)
        || !readTimestamp(parser, QStringLiteral("start"), reference, start)
        || !readTimestamp(parser, QStringLiteral("from"), reference, from)
        || !readTimestamp(parser, QStringLiteral("to"), reference, to)) {
        return ExitValidation;
    }

    std::optional<data::AppointmentStatus> status;
    if (parser.isSet(QStringLiteral("status"))) {
        status = data::statusFromString(parser.value(QStringLiteral("status")));
        if (!status) {
            return invalidOption(QStringLiteral("unknown status %1").arg(parser.value(QStringLiteral("status"))));
        }
    }
    std::optional<data::BookingChannel> channel;
    if (parser.isSet(QStringLiteral("channel"))) {
        channel = data::channelFromString(parser.value(QStringLiteral("channel")));
        if (!channel) {
            return invalidOption(QStringLiteral("unknown channel %1").arg(parser.value(QStringLiteral("channel"))));
        }
    }
    std::optional<double> price;
    bool clearPrice = false;
    if (parser.isSet(QStringLiteral("price"))) {
        const QString text = parser.value(QStringLiteral("price")).trimmed();
        bool ok = false;
        const double value = text.toDouble(&ok);
        if (text.isEmpty()) {
            clearPrice = true;
        } else if (!ok) {
            return invalidOption(QStringLiteral("--price expects a number"));
        } else {
            price = value;
        }
    }

    core::AccessScope scope;
    scope.providerId = scopeProvider;

    if (command == QLatin1String("slots")) {
        const QDate day = QDate::fromString(parser.value(QStringLiteral("date")), Qt::ISODate);
        core::AvailabilityRequest request;
        request.providerId = provider.value_or(scopeProvider.value_or(0));
        request.day = day;
        request.durationMinutes = duration.value_or(settings.defaultDurationMinutes);
        request.stepMinutes = step.value_or(settings.slotStepMinutes);
        request.bufferMinutes = buffer.value_or(settings.bufferMinutes);
        const auto result = service.listAvailability(request);
        if (!result) {
            return report(result.error());
        }
        for (const core::Slot &slot : result.value()) {
            out() << reference.formatTimestamp(slot.start) << ' ' << reference.formatTimestamp(slot.end) << '\n';
        }
        return ExitOk;
    }

    if (command == QLatin1String("check")) {
        if (!start) {
            return usage(QStringLiteral("check needs --start"));
        }
        const auto result = service.checkConflict(provider.value_or(0),
                                                  *start,
                                                  duration.value_or(settings.defaultDurationMinutes),
                                                  exclude);
        if (!result) {
            return report(result.error());
        }
        if (result.value()) {
            out() << "conflict " << describe(*result.value(), reference) << '\n';
            return ExitConflict;
        }
        out() << "free\n";
        return ExitOk;
    }

    if (command == QLatin1String("book")) {
        if (!start) {
            return usage(QStringLiteral("book needs --start"));
        }
        core::CreateRequest request;
        request.providerId = provider.value_or(scopeProvider.value_or(0));
        request.customerRef = customer.value_or(0);
        if (serviceRef && *serviceRef > 0) {
            request.serviceRef = serviceRef;
        }
        request.start = *start;
        request.durationMinutes = duration;
        request.status = status;
        request.channel = channel;
        request.price = price;
        request.notes = parser.value(QStringLiteral("notes"));
        const auto result = service.createAppointment(request, scope);
        if (!result) {
            return report(result.error());
        }
        out() << describe(result.value(), reference) << '\n';
        return ExitOk;
    }

    if (command == QLatin1String("update")) {
        if (!id) {
            return usage(QStringLiteral("update needs --id"));
        }
        core::AppointmentChanges changes;
        changes.customerRef = customer;
        if (serviceRef) {
            if (*serviceRef == 0) {
                changes.clearServiceRef = true;
            } else {
                changes.serviceRef = serviceRef;
            }
        }
        changes.providerId = provider;
        changes.start = start;
        changes.durationMinutes = duration;
        changes.status = status;
        changes.channel = channel;
        changes.price = price;
        changes.clearPrice = clearPrice;
        if (parser.isSet(QStringLiteral("notes"))) {
            changes.notes = parser.value(QStringLiteral("notes"));
        }
        const auto result = service.updateAppointment(*id, changes, scope);
        if (!result) {
            return report(result.error());
        }
        out() << describe(result.value(), reference) << '\n';
        return ExitOk;
    }

    if (command == QLatin1String("status")) {
        if (!id || !status) {
            return usage(QStringLiteral("status needs --id and --status"));
        }
        const auto result = service.changeStatus(*id, *status, scope);
        if (!result) {
            return report(result.error());
        }
        out() << describe(result.value(), reference) << '\n';
        return ExitOk;
    }

    if (command == QLatin1String("delete")) {
        if (!id) {
            return usage(QStringLiteral("delete needs --id"));
        }
        const auto result = service.deleteAppointment(*id, scope);
        if (!result) {
            return report(result.error());
        }
        out() << "deleted #" << *id << '\n';
        return ExitOk;
    }

    if (command == QLatin1String("list")) {
        core::AppointmentFilter filter;
        const QDate today = reference.dayOf(QDateTime::currentDateTimeUtc());
        filter.from = from.value_or(reference.dayWindow(today).start);
        filter.to = to.value_or(reference.dayWindow(today.addDays(7)).start);
        filter.providerId = provider;
        filter.status = status;
        const auto result = service.listAppointments(filter, scope);
        if (!result) {
            return report(result.error());
        }
        for (const data::Appointment &appointment : result.value()) {
            out() << describe(appointment, reference) << '\n';
        }
        return ExitOk;
    }

    return usage(QStringLiteral("unknown command %1").arg(command));
}
