#include "agenda/data/InMemoryServiceCatalog.hpp"

namespace agenda {
namespace data {

InMemoryServiceCatalog::InMemoryServiceCatalog() = default;

InMemoryServiceCatalog::InMemoryServiceCatalog(QHash<int, int> durations)
    : m_durations(std::move(durations))
{
}

InMemoryServiceCatalog::~InMemoryServiceCatalog() = default;

std::optional<int> InMemoryServiceCatalog::defaultDurationMinutes(int serviceRef) const
{
    const auto it = m_durations.constFind(serviceRef);
    if (it == m_durations.constEnd() || it.value() <= 0) {
        return std::nullopt;
    }
    return it.value();
}

void InMemoryServiceCatalog::setDuration(int serviceRef, int minutes)
{
    m_durations.insert(serviceRef, minutes);
}

} // namespace data
} // namespace agenda
