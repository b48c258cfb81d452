#pragma once

#include "rotation/rotation_types.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace drift
{
class RetryFallbackResolver;
struct RotationState;

// Single-slot cache of the next ready image (RotationState::preloaded).
//
// Every Take()/Clear() bumps a generation counter; a refill that completes
// under an older generation is not adopted, so a swap that resolved on its own
// can never be followed by a stale preloaded image.
class PreloadCache
{
public:
    PreloadCache(RotationState& state, RetryFallbackResolver& resolver);
    ~PreloadCache();

    PreloadCache(const PreloadCache&) = delete;
    PreloadCache& operator=(const PreloadCache&) = delete;

    bool HasValue() const;
    bool RefillInFlight() const { return m_inflight_gen != 0 && m_inflight_gen == m_generation; }

    // Removes and returns the cached image (if any). Clears synchronously.
    std::optional<LoadResult> Take();
    void Clear();

    // Starts an asynchronous resolve that stores its result in the slot.
    // No-op if a refill for the current generation is already running.
    void Refill();

    std::uint64_t Generation() const { return m_generation; }

private:
    RotationState& m_state;
    RetryFallbackResolver& m_resolver;

    std::uint64_t m_generation = 1;
    std::uint64_t m_inflight_gen = 0;

    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
} // namespace drift
