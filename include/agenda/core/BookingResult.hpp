#pragma once

#include <optional>
#include <utility>
#include <variant>

#include <QString>

#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace core {

enum class ErrorKind
{
    Validation,
    Conflict,
    NotFound,
    Storage,
};

struct BookingError
{
    ErrorKind kind = ErrorKind::Validation;
    QString message;
    // Set for ErrorKind::Conflict.
    std::optional<data::Appointment> conflicting;
};

template<typename T>
class BookingResult
{
public:
    BookingResult(T value)
        : m_state(std::move(value))
    {
    }

    BookingResult(BookingError error)
        : m_state(std::move(error))
    {
    }

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    const T &value() const { return std::get<T>(m_state); }
    T &value() { return std::get<T>(m_state); }
    const T *operator->() const { return &value(); }
    const T &operator*() const { return value(); }

    const BookingError &error() const { return std::get<BookingError>(m_state); }

private:
    std::variant<T, BookingError> m_state;
};

struct Done
{
};

} // namespace core
} // namespace agenda
