#include "agenda/core/AppContext.hpp"

#include "agenda/data/DataProvider.hpp"

#include "agenda/core/AppointmentService.hpp"
#include "agenda/core/BusinessHours.hpp"

#include <QSettings>

namespace agenda {
namespace core {

AppContext::AppContext(const QString &configFile)
    : m_businessHours(std::make_unique<BusinessHoursProvider>())
{
    QSettings settings(configFile, QSettings::IniFormat);
    m_settings = SchedulingSettings::fromSettings(settings);
    m_businessHours->load(settings);

    m_dataProvider = std::make_unique<data::DataProvider>(m_settings.storageFile, m_settings.serviceDurations);
    m_appointmentService = std::make_unique<AppointmentService>(m_dataProvider->appointmentRepository(),
                                                                *m_businessHours,
                                                                TimeReference(m_settings.timeZone),
                                                                &m_dataProvider->serviceCatalog());
    m_appointmentService->setDefaultDurationMinutes(m_settings.defaultDurationMinutes);
}

AppContext::~AppContext() = default;

const SchedulingSettings &AppContext::settings() const
{
    return m_settings;
}

data::AppointmentRepository &AppContext::appointmentRepository()
{
    return m_dataProvider->appointmentRepository();
}

BusinessHoursProvider &AppContext::businessHours()
{
    return *m_businessHours;
}

AppointmentService &AppContext::appointmentService()
{
    return *m_appointmentService;
}

void AppContext::reloadBusinessHours()
{
    m_businessHours->reload();
}

} // namespace core
} // namespace agenda
