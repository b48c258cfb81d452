#pragma once

#include "rotation/rotation_types.h"

#include <functional>
#include <utility>
#include <vector>

namespace drift
{
class KeyValueStore;
struct RotationState;

// Persisted interval and blur settings with immediate side effects.
//
// Values are clamped to the device hint's maxima before they reach
// RotationState, the side-effect callback and the persisted store.
class ConfigStore
{
public:
    static constexpr unsigned kDefaultIntervalSeconds = 60;
    static constexpr unsigned kDefaultBlurPixels = 0;

    static constexpr const char* kIntervalKey = "bg-interval";
    static constexpr const char* kBlurKey = "bg-blur";

    using Effect = std::function<void(unsigned)>;

    ConfigStore(KeyValueStore& store, RotationState& state, DeviceHint hint);

    // Reads persisted values (or defaults) into RotationState. No side effects.
    void Load();

    void SetIntervalEffect(Effect fn) { m_on_interval = std::move(fn); }
    void SetBlurEffect(Effect fn) { m_on_blur = std::move(fn); }

    // Return the value actually applied. Never throw.
    unsigned SetInterval(long long seconds);
    unsigned SetBlur(long long pixels);

    unsigned GetInterval() const;
    unsigned GetBlur() const;

    unsigned ClampInterval(long long seconds) const;
    unsigned ClampBlur(long long pixels) const;

    const DeviceHint& Hint() const { return m_hint; }

    // Choices offered by the host's selectors.
    static const std::vector<unsigned>& IntervalChoices();
    static const std::vector<unsigned>& BlurChoices();

private:
    void Persist(const char* key, unsigned value);

    KeyValueStore& m_store;
    RotationState& m_state;
    DeviceHint m_hint;

    Effect m_on_interval;
    Effect m_on_blur;
};
} // namespace drift
