#include "rotation/config_store.h"

#include "core/key_value_store.h"
#include "rotation/rotation_state.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <string>

namespace drift
{
ConfigStore::ConfigStore(KeyValueStore& store, RotationState& state, DeviceHint hint)
    : m_store(store)
    , m_state(state)
    , m_hint(hint)
{
}

const std::vector<unsigned>& ConfigStore::IntervalChoices()
{
    static const std::vector<unsigned> kChoices = {0, 15, 30, 60, 300, 900, 1800};
    return kChoices;
}

const std::vector<unsigned>& ConfigStore::BlurChoices()
{
    static const std::vector<unsigned> kChoices = {0, 2, 4, 8, 12, 16, 24};
    return kChoices;
}

unsigned ConfigStore::ClampInterval(long long seconds) const
{
    return (unsigned)std::clamp<long long>(seconds, 0, std::max(0, m_hint.max_interval_s));
}

unsigned ConfigStore::ClampBlur(long long pixels) const
{
    return (unsigned)std::clamp<long long>(pixels, 0, std::max(0, m_hint.max_blur_px));
}

void ConfigStore::Load()
{
    const std::optional<long long> interval = m_store.GetInt(kIntervalKey);
    const std::optional<long long> blur = m_store.GetInt(kBlurKey);
    m_state.interval_seconds = ClampInterval(interval.value_or(kDefaultIntervalSeconds));
    m_state.blur_pixels = ClampBlur(blur.value_or(kDefaultBlurPixels));
}

unsigned ConfigStore::GetInterval() const
{
    return m_state.interval_seconds;
}

unsigned ConfigStore::GetBlur() const
{
    return m_state.blur_pixels;
}

unsigned ConfigStore::SetInterval(long long seconds)
{
    const unsigned v = ClampInterval(seconds);
    m_state.interval_seconds = v;
    if (m_on_interval)
    {
        try
        {
            m_on_interval(v);
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "[config] interval side effect failed: %s\n", e.what());
        }
    }
    Persist(kIntervalKey, v);
    return v;
}

unsigned ConfigStore::SetBlur(long long pixels)
{
    const unsigned v = ClampBlur(pixels);
    m_state.blur_pixels = v;
    if (m_on_blur)
    {
        try
        {
            m_on_blur(v);
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "[config] blur side effect failed: %s\n", e.what());
        }
    }
    Persist(kBlurKey, v);
    return v;
}

void ConfigStore::Persist(const char* key, unsigned value)
{
    std::string err;
    try
    {
        if (!m_store.SetInt(key, (long long)value, err))
            std::fprintf(stderr, "[config] failed to persist %s: %s\n", key, err.c_str());
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "[config] failed to persist %s: %s\n", key, e.what());
    }
}
} // namespace drift
