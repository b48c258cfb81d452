#pragma once

#include <optional>
#include <utility>

namespace drift
{
// Bounded request queue of capacity 1.
//
// Offer() never appends: a newer request overwrites the pending one, so any
// number of offers between two Take() calls collapses into a single pending
// request carrying the latest payload.
template <typename T>
class CoalescingSlot
{
public:
    // Returns true if the slot was empty (the request was not coalesced).
    bool Offer(T value)
    {
        const bool was_empty = !m_pending.has_value();
        m_pending = std::move(value);
        return was_empty;
    }

    std::optional<T> Take()
    {
        std::optional<T> out = std::move(m_pending);
        m_pending.reset();
        return out;
    }

    void Clear() { m_pending.reset(); }
    bool HasPending() const { return m_pending.has_value(); }

private:
    std::optional<T> m_pending;
};
} // namespace drift
