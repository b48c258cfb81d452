#include "rotation/preload_cache.h"

#include "rotation/retry_fallback_resolver.h"
#include "rotation/rotation_state.h"

#include <cstdio>
#include <utility>

namespace drift
{
PreloadCache::PreloadCache(RotationState& state, RetryFallbackResolver& resolver)
    : m_state(state)
    , m_resolver(resolver)
{
}

PreloadCache::~PreloadCache()
{
    *m_alive = false;
}

bool PreloadCache::HasValue() const
{
    return m_state.preloaded.has_value();
}

std::optional<LoadResult> PreloadCache::Take()
{
    std::optional<LoadResult> out = std::move(m_state.preloaded);
    m_state.preloaded.reset();
    ++m_generation;
    return out;
}

void PreloadCache::Clear()
{
    m_state.preloaded.reset();
    ++m_generation;
}

void PreloadCache::Refill()
{
    if (RefillInFlight())
        return;

    const std::uint64_t gen = m_generation;
    m_inflight_gen = gen;

    std::shared_ptr<bool> alive = m_alive;
    m_resolver.LoadNextWithRetry([this, alive, gen](LoadOutcome outcome) {
        if (!*alive)
            return;
        if (m_inflight_gen == gen)
            m_inflight_gen = 0;

        // Superseded by a Take()/Clear() while loading.
        if (gen != m_generation)
            return;

        if (!outcome.ok)
        {
            std::fprintf(stderr, "[preload] refill failed: %s\n", outcome.message.c_str());
            return;
        }
        m_state.preloaded = std::move(outcome.result);
    });
}
} // namespace drift
