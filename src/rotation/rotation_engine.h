#pragma once

#include "rotation/provider_registry.h"
#include "rotation/render_outputs.h"
#include "rotation/rotation_types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace drift
{
class DoubleBuffer;
class EventLoop;
class ImageLoader;
class KeyValueStore;
class PreloadCache;
class RenderSurface;
class TransitionCoordinator;
struct RotationState;

struct EngineOptions
{
    std::vector<ProviderSpec> providers; // empty: built-in defaults
    std::string fallback_url;            // bundled local asset (path or file:// URL)
    DeviceHint hint;
    int viewport_w = 1920;
    int viewport_h = 1080;
    std::optional<std::uint32_t> seed; // provider nonce seed; random when unset
    bool swap_on_mount = true;
};

// Wires the rotation components together for one mounted backdrop.
//
// Mount() creates RotationState and every component that references it, reads
// the persisted settings, publishes the blur, starts the scheduler and requests
// the first swap. Unmount() clears the timer and destroys the whole session;
// late loader completions are dropped. The render outputs outlive sessions so
// the host can keep reading them.
class RotationEngine
{
public:
    RotationEngine(EventLoop& loop,
                   ImageLoader& loader,
                   KeyValueStore& store,
                   RenderSurface& surface_a,
                   RenderSurface& surface_b,
                   EngineOptions options);
    ~RotationEngine();

    RotationEngine(const RotationEngine&) = delete;
    RotationEngine& operator=(const RotationEngine&) = delete;

    void Mount();
    void Unmount();
    bool Mounted() const { return m_session != nullptr; }

    // Bound to the "next image" control. No-op when unmounted.
    void RequestSwap();

    // Bound to the selector controls. Return the applied (clamped) value.
    unsigned SetInterval(long long seconds);
    unsigned SetBlur(long long pixels);
    unsigned GetInterval() const;
    unsigned GetBlur() const;

    // Scales the requested image size for subsequent loads.
    void SetViewport(int width, int height);
    ImageSize RequestSize() const;

    const RenderOutputs& Outputs() const { return m_outputs; }
    const DeviceHint& Hint() const { return m_options.hint; }

    // Null while unmounted.
    const RotationState* State() const;
    const DoubleBuffer* Buffer() const;
    const TransitionCoordinator* Coordinator() const;
    const PreloadCache* Preload() const;
    const ProviderRegistry* Providers() const;

private:
    struct Session;

    EventLoop& m_loop;
    ImageLoader& m_loader;
    KeyValueStore& m_store;
    RenderSurface& m_surface_a;
    RenderSurface& m_surface_b;
    EngineOptions m_options;

    RenderOutputs m_outputs;
    std::unique_ptr<Session> m_session;
};
} // namespace drift
