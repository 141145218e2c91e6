#include "agenda/core/AvailabilityGenerator.hpp"

#include "agenda/core/Logging.hpp"

#include <QtGlobal>

namespace agenda {
namespace core {

SlotSequence::const_iterator::const_iterator(const SlotSequence *sequence, std::size_t index)
    : m_sequence(sequence)
    , m_index(index)
{
    if (m_sequence && m_index < m_sequence->m_free.size()) {
        m_slot.start = m_sequence->m_free[m_index].start;
        settle();
    }
}

// Moves forward to the first position from which a full slot fits.
void SlotSequence::const_iterator::settle()
{
    const qint64 need = static_cast<qint64>(m_sequence->m_durationMinutes) * 60;
    const IntervalList &intervals = m_sequence->m_free;
    while (m_index < intervals.size()) {
        const QDateTime slotEnd = m_slot.start.addSecs(need);
        if (slotEnd <= intervals[m_index].end) {
            m_slot.end = slotEnd;
            return;
        }
        ++m_index;
        if (m_index < intervals.size()) {
            m_slot.start = intervals[m_index].start;
        }
    }
    m_slot = Slot{};
}

SlotSequence::const_iterator &SlotSequence::const_iterator::operator++()
{
    if (!m_sequence || m_index >= m_sequence->m_free.size()) {
        return *this;
    }
    m_slot.start = m_slot.start.addSecs(static_cast<qint64>(m_sequence->m_stepMinutes) * 60);
    settle();
    return *this;
}

SlotSequence::const_iterator SlotSequence::const_iterator::operator++(int)
{
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

bool SlotSequence::const_iterator::operator==(const const_iterator &other) const
{
    const bool atEnd = !m_sequence || m_index >= m_sequence->m_free.size();
    const bool otherAtEnd = !other.m_sequence || other.m_index >= other.m_sequence->m_free.size();
    if (atEnd || otherAtEnd) {
        return atEnd == otherAtEnd;
    }
    return m_sequence == other.m_sequence && m_index == other.m_index && m_slot == other.m_slot;
}

SlotSequence::SlotSequence(IntervalList freeIntervals, int durationMinutes, int stepMinutes)
    : m_free(std::move(freeIntervals))
    , m_durationMinutes(durationMinutes)
    , m_stepMinutes(stepMinutes)
{
    if (m_durationMinutes <= 0 || m_stepMinutes <= 0) {
        m_free.clear();
    }
}

SlotSequence::const_iterator SlotSequence::begin() const
{
    return const_iterator(this, 0);
}

SlotSequence::const_iterator SlotSequence::end() const
{
    return const_iterator(this, m_free.size());
}

bool SlotSequence::empty() const
{
    return begin() == end();
}

std::vector<Slot> SlotSequence::toVector() const
{
    return std::vector<Slot>(begin(), end());
}

const IntervalList &SlotSequence::freeIntervals() const
{
    return m_free;
}

int SlotSequence::durationMinutes() const
{
    return m_durationMinutes;
}

int SlotSequence::stepMinutes() const
{
    return m_stepMinutes;
}

IntervalList busyIntervals(const AvailabilityRequest &request,
                           const std::vector<data::Appointment> &appointments,
                           const TimeReference &reference)
{
    const qint64 buffer = static_cast<qint64>(qMax(0, request.bufferMinutes)) * 60;
    IntervalList busy;
    for (const data::Appointment &appointment : appointments) {
        if (appointment.providerId != request.providerId || !appointment.isActive()) {
            continue;
        }
        if (reference.dayOf(appointment.start) != request.day) {
            continue;
        }
        busy.push_back({appointment.start, appointment.end().addSecs(buffer)});
    }
    return mergeIntervals(std::move(busy));
}

SlotSequence generateSlots(const AvailabilityRequest &request,
                           const IntervalList &businessHours,
                           const std::vector<data::Appointment> &appointments,
                           const TimeReference &reference)
{
    if (request.durationMinutes <= 0 || request.stepMinutes <= 0) {
        qCWarning(lcAvailability) << "rejecting slot request with duration" << request.durationMinutes << "step"
                                  << request.stepMinutes;
        return {};
    }
    const IntervalList busy = busyIntervals(request, appointments, reference);
    IntervalList freeIntervals = subtractIntervals(businessHours, busy);
    qCDebug(lcAvailability) << "provider" << request.providerId << request.day << ":" << busy.size()
                            << "busy," << freeIntervals.size() << "free intervals";
    return SlotSequence(std::move(freeIntervals), request.durationMinutes, request.stepMinutes);
}

} // namespace core
} // namespace agenda
