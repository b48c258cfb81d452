#pragma once

#include "rotation/rotation_types.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace drift
{
class EventLoop;

// One asynchronous fetch-and-decode of an image URL. No retries: that is the
// resolver's job. `done` always runs on the EventLoop thread, exactly once,
// unless the loader is shut down first.
class ImageLoader
{
public:
    using Callback = std::function<void(LoadOutcome)>;

    virtual ~ImageLoader() = default;
    virtual void Load(const std::string& url, Callback done) = 0;
};

// libcurl + stb_image loader backed by a small worker pool.
// Local paths and file:// URLs are read from disk instead of the network.
class HttpImageLoader : public ImageLoader
{
public:
    explicit HttpImageLoader(EventLoop& loop, int worker_count = 2);
    ~HttpImageLoader() override;

    HttpImageLoader(const HttpImageLoader&) = delete;
    HttpImageLoader& operator=(const HttpImageLoader&) = delete;

    void Load(const std::string& url, Callback done) override;

    // Joins workers and drops queued jobs; in-flight completions are discarded.
    void Shutdown();

    // Synchronous fetch + decode used by the workers (exposed for reuse/tests).
    static LoadOutcome FetchAndDecode(const std::string& url);

private:
    struct Job
    {
        std::string url;
        Callback done;
    };

    void StartWorkers(int worker_count);
    void WorkerMain();

    EventLoop& m_loop;

    std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<Job> m_jobs; // guarded by m_mu
    bool m_running = false; // guarded by m_mu
    std::vector<std::thread> m_workers;

    // Cleared on shutdown; completions already posted to the loop check it first.
    std::shared_ptr<std::atomic<bool>> m_alive;
};

// True for "file://..." URLs and plain filesystem paths (no scheme).
bool IsLocalImageUrl(const std::string& url);

// False for bodies a server labels as text or markup (error pages, captive
// portal logins). Missing or generic types are accepted and left to the decoder.
bool IsAcceptableImageContentType(const std::string& content_type);
} // namespace drift
