#pragma once

#include "agenda/data/AppointmentRepository.hpp"
#include "agenda/data/FileAppointmentStorage.hpp"

#include <memory>

namespace agenda {
namespace data {

class FileAppointmentRepository : public AppointmentRepository
{
public:
    explicit FileAppointmentRepository(std::shared_ptr<FileAppointmentStorage> storage);
    ~FileAppointmentRepository() override = default;

    std::vector<Appointment> fetchAppointments(const QDateTime &from,
                                               const QDateTime &to,
                                               std::optional<int> providerId = std::nullopt,
                                               bool *ok = nullptr) const override;
    std::optional<Appointment> findById(int id, bool *ok = nullptr) const override;
    std::optional<Appointment> addAppointment(Appointment appointment) override;
    bool updateAppointment(const Appointment &appointment) override;
    bool removeAppointment(int id) override;
    std::unique_ptr<ScheduleLock> lockSchedule(int providerId, const QDate &day) override;

private:
    std::shared_ptr<FileAppointmentStorage> m_storage;
};

} // namespace data
} // namespace agenda
