#pragma once

#include <QHash>

#include "agenda/data/ServiceCatalog.hpp"

namespace agenda {
namespace data {

class InMemoryServiceCatalog : public ServiceCatalog
{
public:
    InMemoryServiceCatalog();
    explicit InMemoryServiceCatalog(QHash<int, int> durations);
    ~InMemoryServiceCatalog() override;

    std::optional<int> defaultDurationMinutes(int serviceRef) const override;
    void setDuration(int serviceRef, int minutes);

private:
    QHash<int, int> m_durations;
};

} // namespace data
} // namespace agenda
