#include "rotation/rotation_engine.h"

#include "core/event_loop.h"
#include "rotation/config_store.h"
#include "rotation/double_buffer.h"
#include "rotation/preload_cache.h"
#include "rotation/retry_fallback_resolver.h"
#include "rotation/rotation_scheduler.h"
#include "rotation/rotation_state.h"
#include "rotation/tone_analyzer.h"
#include "rotation/transition_coordinator.h"

#include <cstdio>
#include <random>
#include <utility>

namespace drift
{
// Declaration order is construction order; members only reference earlier ones.
struct RotationEngine::Session
{
    explicit Session(RotationEngine& e)
        : registry(e.m_options.providers, e.m_options.seed ? *e.m_options.seed : std::random_device{}())
        , resolver(registry, e.m_loader, e.m_options.fallback_url)
        , preload(state, resolver)
        , buffer(e.m_surface_a, e.m_surface_b)
        , coordinator(e.m_loop, state, buffer, preload, resolver, e.m_outputs, ToneAnalyzer(e.m_options.hint.max_grid_side))
        , scheduler(e.m_loop, [this](SwapTrigger t) { coordinator.RequestSwap(t); })
        , config(e.m_store, state, e.m_options.hint)
    {
    }

    RotationState state;
    ProviderRegistry registry;
    RetryFallbackResolver resolver;
    PreloadCache preload;
    DoubleBuffer buffer;
    TransitionCoordinator coordinator;
    RotationScheduler scheduler;
    ConfigStore config;
};

RotationEngine::RotationEngine(EventLoop& loop,
                               ImageLoader& loader,
                               KeyValueStore& store,
                               RenderSurface& surface_a,
                               RenderSurface& surface_b,
                               EngineOptions options)
    : m_loop(loop)
    , m_loader(loader)
    , m_store(store)
    , m_surface_a(surface_a)
    , m_surface_b(surface_b)
    , m_options(std::move(options))
{
}

RotationEngine::~RotationEngine()
{
    Unmount();
}

void RotationEngine::Mount()
{
    if (m_session)
        return;

    m_session = std::make_unique<Session>(*this);
    Session& s = *m_session;

    s.resolver.SetRequestSize(RequestSizeFor(m_options.viewport_w, m_options.viewport_h, m_options.hint));

    s.config.Load();
    s.config.SetIntervalEffect([this](unsigned seconds) { m_session->scheduler.SetInterval(seconds); });
    s.config.SetBlurEffect([this](unsigned px) { m_outputs.SetBlurPixels(px); });

    m_outputs.SetBlurPixels(s.state.blur_pixels);
    s.scheduler.SetInterval(s.state.interval_seconds);

    std::fprintf(stderr, "[engine] mounted: %zu providers, interval %us, blur %upx, request %dx%d\n",
                 s.registry.Count(), s.state.interval_seconds, s.state.blur_pixels,
                 s.resolver.RequestSize().width, s.resolver.RequestSize().height);

    if (m_options.swap_on_mount)
        s.coordinator.RequestSwap(SwapTrigger::Mount);
}

void RotationEngine::Unmount()
{
    if (!m_session)
        return;
    m_session->scheduler.Stop();
    m_session.reset();
}

void RotationEngine::RequestSwap()
{
    if (m_session)
        m_session->scheduler.TriggerNow();
}

unsigned RotationEngine::SetInterval(long long seconds)
{
    if (!m_session)
        return 0;
    return m_session->config.SetInterval(seconds);
}

unsigned RotationEngine::SetBlur(long long pixels)
{
    if (!m_session)
        return 0;
    return m_session->config.SetBlur(pixels);
}

unsigned RotationEngine::GetInterval() const
{
    return m_session ? m_session->config.GetInterval() : 0;
}

unsigned RotationEngine::GetBlur() const
{
    return m_session ? m_session->config.GetBlur() : 0;
}

void RotationEngine::SetViewport(int width, int height)
{
    m_options.viewport_w = width;
    m_options.viewport_h = height;
    if (m_session)
        m_session->resolver.SetRequestSize(RequestSizeFor(width, height, m_options.hint));
}

ImageSize RotationEngine::RequestSize() const
{
    return RequestSizeFor(m_options.viewport_w, m_options.viewport_h, m_options.hint);
}

const RotationState* RotationEngine::State() const
{
    return m_session ? &m_session->state : nullptr;
}

const DoubleBuffer* RotationEngine::Buffer() const
{
    return m_session ? &m_session->buffer : nullptr;
}

const TransitionCoordinator* RotationEngine::Coordinator() const
{
    return m_session ? &m_session->coordinator : nullptr;
}

const PreloadCache* RotationEngine::Preload() const
{
    return m_session ? &m_session->preload : nullptr;
}

const ProviderRegistry* RotationEngine::Providers() const
{
    return m_session ? &m_session->registry : nullptr;
}
} // namespace drift
