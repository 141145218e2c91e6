#pragma once

#include <memory>

#include <QString>

#include "agenda/core/SchedulingSettings.hpp"

namespace agenda {
namespace data {
class DataProvider;
class AppointmentRepository;
}

namespace core {

class AppointmentService;
class BusinessHoursProvider;

// Wires settings, storage and the appointment service for one process.
class AppContext
{
public:
    explicit AppContext(const QString &configFile);
    ~AppContext();

    const SchedulingSettings &settings() const;
    data::AppointmentRepository &appointmentRepository();
    BusinessHoursProvider &businessHours();
    AppointmentService &appointmentService();

    // Re-reads opening hours from the configuration file.
    void reloadBusinessHours();

private:
    SchedulingSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<BusinessHoursProvider> m_businessHours;
    std::unique_ptr<AppointmentService> m_appointmentService;
};

} // namespace core
} // namespace agenda
