#pragma once

#include <optional>

namespace agenda {
namespace data {

class ServiceCatalog
{
public:
    virtual ~ServiceCatalog() = default;

    virtual std::optional<int> defaultDurationMinutes(int serviceRef) const = 0;
};

} // namespace data
} // namespace agenda
