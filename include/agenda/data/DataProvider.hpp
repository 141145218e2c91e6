#pragma once

#include <memory>
#include <QHash>
#include <QString>

namespace agenda {
namespace data {

class AppointmentRepository;
class FileAppointmentStorage;
class ServiceCatalog;

class DataProvider
{
public:
    DataProvider(const QString &storageFile, QHash<int, int> serviceDurations);
    ~DataProvider();

    AppointmentRepository &appointmentRepository();
    const ServiceCatalog &serviceCatalog() const;

private:
    std::shared_ptr<FileAppointmentStorage> m_storage;
    std::unique_ptr<AppointmentRepository> m_appointmentRepository;
    std::unique_ptr<ServiceCatalog> m_serviceCatalog;
};

} // namespace data
} // namespace agenda
