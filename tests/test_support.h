#pragma once

#include "core/bitmap.h"
#include "core/event_loop.h"
#include "core/key_value_store.h"
#include "rotation/double_buffer.h"
#include "rotation/image_loader.h"
#include "rotation/provider_registry.h"
#include "rotation/rotation_types.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace drift::test
{
inline Bitmap SolidBitmap(int w, int h, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255)
{
    Bitmap bmp;
    bmp.width = w;
    bmp.height = h;
    bmp.rgba.resize((size_t)w * (size_t)h * 4u);
    for (size_t i = 0; i < bmp.rgba.size(); i += 4)
    {
        bmp.rgba[i + 0] = r;
        bmp.rgba[i + 1] = g;
        bmp.rgba[i + 2] = b;
        bmp.rgba[i + 3] = a;
    }
    return bmp;
}

inline LoadOutcome Success(const std::string& url, Bitmap bmp = SolidBitmap(4, 4, 20, 20, 20))
{
    LoadOutcome o;
    o.ok = true;
    o.result.bitmap = std::move(bmp);
    o.result.source_url = url;
    return o;
}

inline LoadOutcome Failure(const std::string& url, LoadError err = LoadError::NetworkError)
{
    LoadOutcome o;
    o.ok = false;
    o.error = err;
    o.message = "scripted failure";
    o.result.source_url = url;
    return o;
}

// EventLoop driven by a manual clock.
struct ManualLoop
{
    EventLoop::TimePoint now{};
    EventLoop loop{[this]() { return now; }};

    // Moves time forward in `step` increments, draining the loop after each one,
    // so timers fire in the order and at the time they would in real life.
    void Advance(std::chrono::milliseconds total, std::chrono::milliseconds step = std::chrono::milliseconds(50))
    {
        loop.RunPending();
        while (total.count() > 0)
        {
            const auto d = std::min(total, step);
            now += d;
            total -= d;
            loop.RunPending();
        }
    }

    void Drain() { loop.RunPending(); }
};

// Scripted loader. Completions are posted to the loop, so they only run inside
// RunPending(), like the real worker pool. With `hold` set, or when `hold_when`
// returns true for the URL, jobs stay pending until Release().
class FakeImageLoader : public ImageLoader
{
public:
    using Responder = std::function<LoadOutcome(const std::string& url)>;

    explicit FakeImageLoader(EventLoop& loop)
        : m_loop(loop)
    {
    }

    void Load(const std::string& url, Callback done) override
    {
        requests.push_back(url);
        if (hold || (hold_when && hold_when(url)))
        {
            m_held.push_back({url, std::move(done)});
            return;
        }
        Deliver(url, std::move(done));
    }

    // Posts the completion of every held job.
    void Release()
    {
        std::vector<std::pair<std::string, Callback>> jobs;
        jobs.swap(m_held);
        for (auto& j : jobs)
            Deliver(j.first, std::move(j.second));
    }

    size_t HeldCount() const { return m_held.size(); }

    // Default: every URL decodes to a small dark bitmap.
    Responder responder = [](const std::string& url) { return Success(url); };
    bool hold = false;
    std::function<bool(const std::string& url)> hold_when;
    std::vector<std::string> requests;

private:
    void Deliver(const std::string& url, Callback done)
    {
        LoadOutcome outcome = responder(url);
        m_loop.Post([done = std::move(done), outcome]() mutable { done(std::move(outcome)); });
    }

    EventLoop& m_loop;
    std::vector<std::pair<std::string, Callback>> m_held;
};

// Records everything the buffer asks of it. End-of-fade events are held until
// FinishFade() unless `auto_finish` posts them straight to the loop.
class FakeSurface : public RenderSurface
{
public:
    explicit FakeSurface(EventLoop& loop)
        : m_loop(loop)
    {
    }

    void SetBitmap(Bitmap bitmap) override
    {
        bitmap_count++;
        last_bitmap = std::move(bitmap);
    }

    void FadeTo(bool v, std::function<void()> on_end) override
    {
        fade_count++;
        visible = v;
        // A superseded fade never reports its end.
        m_pending_end = nullptr;
        if (!on_end)
            return;
        if (auto_finish)
            m_loop.Post(std::move(on_end));
        else
            m_pending_end = std::move(on_end);
    }

    void SetVisibleImmediate(bool v) override
    {
        immediate_count++;
        visible = v;
        m_pending_end = nullptr;
    }

    void FlushLayout() override { flush_count++; }

    bool HasPendingEnd() const { return (bool)m_pending_end; }

    // Fires the held end event, as the compositor would when the fade finishes.
    void FinishFade()
    {
        std::function<void()> fn = std::move(m_pending_end);
        m_pending_end = nullptr;
        if (fn)
            fn();
    }

    bool auto_finish = false;
    bool visible = false;
    int bitmap_count = 0;
    int fade_count = 0;
    int immediate_count = 0;
    int flush_count = 0;
    Bitmap last_bitmap;

private:
    EventLoop& m_loop;
    std::function<void()> m_pending_end;
};

class MemoryStore : public KeyValueStore
{
public:
    std::optional<long long> GetInt(const std::string& key) const override
    {
        auto it = values.find(key);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    }

    bool SetInt(const std::string& key, long long value, std::string& err) override
    {
        values[key] = value;
        writes++;
        if (fail_writes)
        {
            err = "disk full";
            return false;
        }
        return true;
    }

    std::map<std::string, long long> values;
    bool fail_writes = false;
    int writes = 0;
};

// Three template providers whose URLs are easy to tell apart.
inline std::vector<ProviderSpec> TestProviders(int count = 3)
{
    std::vector<ProviderSpec> out;
    for (int i = 0; i < count; ++i)
    {
        const std::string name = "p" + std::to_string(i + 1);
        out.push_back(ProviderSpec::FromTemplate(i, name, "https://" + name + ".test/{w}x{h}?n={nonce}"));
    }
    return out;
}

inline bool IsFrom(const std::string& url, const std::string& provider)
{
    return url.rfind("https://" + provider + ".test/", 0) == 0;
}

inline constexpr const char* kFallbackPath = "/assets/fallback.ppm";
} // namespace drift::test
