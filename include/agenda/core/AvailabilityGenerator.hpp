#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

#include <QDate>

#include "agenda/core/TimeInterval.hpp"
#include "agenda/core/TimeReference.hpp"
#include "agenda/data/Appointment.hpp"

namespace agenda {
namespace core {

using Slot = TimeInterval;

struct AvailabilityRequest
{
    int providerId = 0;
    QDate day;
    int durationMinutes = 30;
    int stepMinutes = 15;
    int bufferMinutes = 0;
};

// Slots are produced on demand while iterating; iterating again yields the
// same slots.
class SlotSequence
{
public:
    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Slot;
        using difference_type = std::ptrdiff_t;
        using pointer = const Slot *;
        using reference = const Slot &;

        const_iterator() = default;

        reference operator*() const { return m_slot; }
        pointer operator->() const { return &m_slot; }
        const_iterator &operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator &other) const;
        bool operator!=(const const_iterator &other) const { return !(*this == other); }

    private:
        friend class SlotSequence;
        const_iterator(const SlotSequence *sequence, std::size_t index);

        void settle();

        const SlotSequence *m_sequence = nullptr;
        std::size_t m_index = 0;
        Slot m_slot;
    };

    SlotSequence() = default;
    SlotSequence(IntervalList freeIntervals, int durationMinutes, int stepMinutes);

    const_iterator begin() const;
    const_iterator end() const;
    bool empty() const;
    std::vector<Slot> toVector() const;

    const IntervalList &freeIntervals() const;
    int durationMinutes() const;
    int stepMinutes() const;

private:
    IntervalList m_free;
    int m_durationMinutes = 0;
    int m_stepMinutes = 0;
};

// Busy intervals of the provider's active appointments on the requested day,
// each extended by the buffer, then merged.
IntervalList busyIntervals(const AvailabilityRequest &request,
                           const std::vector<data::Appointment> &appointments,
                           const TimeReference &reference);

// Returns an empty sequence for non-positive duration or step.
SlotSequence generateSlots(const AvailabilityRequest &request,
                           const IntervalList &businessHours,
                           const std::vector<data::Appointment> &appointments,
                           const TimeReference &reference);

} // namespace core
} // namespace agenda
