#include "agenda/data/DataProvider.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/FileAppointmentRepository.hpp"
#include "agenda/data/FileAppointmentStorage.hpp"
#include "agenda/data/InMemoryServiceCatalog.hpp"

#include <QDir>
#include <QFileInfo>

namespace agenda {
namespace data {

DataProvider::DataProvider(const QString &storageFile, QHash<int, int> serviceDurations)
{
    QDir dir = QFileInfo(storageFile).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStorage) << "cannot create storage folder" << dir.path();
    }

    m_storage = std::make_shared<FileAppointmentStorage>(storageFile);
    m_appointmentRepository = std::make_unique<FileAppointmentRepository>(m_storage);
    m_serviceCatalog = std::make_unique<InMemoryServiceCatalog>(std::move(serviceDurations));
}

DataProvider::~DataProvider() = default;

AppointmentRepository &DataProvider::appointmentRepository()
{
    return *m_appointmentRepository;
}

const ServiceCatalog &DataProvider::serviceCatalog() const
{
    return *m_serviceCatalog;
}

} // namespace data
} // namespace agenda
