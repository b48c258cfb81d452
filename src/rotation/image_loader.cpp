#include "rotation/image_loader.h"

#include "core/event_loop.h"
#include "io/http_client.h"
#include "io/image_decode.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>

namespace drift
{
namespace
{
static constexpr const char* kFileScheme = "file://";

static std::string LocalPathFromUrl(const std::string& url)
{
    if (url.rfind(kFileScheme, 0) == 0)
        return url.substr(std::char_traits<char>::length(kFileScheme));
    return url;
}

static bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& err)
{
    out.clear();
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = "Failed to open " + path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad())
    {
        err = "Failed to read " + path;
        out.clear();
        return false;
    }
    if (out.empty())
    {
        err = "Empty file " + path;
        return false;
    }
    return true;
}
} // namespace

bool IsLocalImageUrl(const std::string& url)
{
    if (url.rfind(kFileScheme, 0) == 0)
        return true;
    return url.find("://") == std::string::npos;
}

bool IsAcceptableImageContentType(const std::string& content_type)
{
    std::string t;
    for (char c : content_type)
    {
        if (c == ';')
            break;
        if (c != ' ')
            t.push_back((char)std::tolower((unsigned char)c));
    }
    return t.rfind("text/", 0) != 0 && t != "application/json" && t != "application/xhtml+xml";
}

LoadOutcome HttpImageLoader::FetchAndDecode(const std::string& url)
{
    LoadOutcome out;
    out.result.source_url = url;

    std::vector<std::uint8_t> bytes;
    if (IsLocalImageUrl(url))
    {
        std::string err;
        if (!ReadFileBytes(LocalPathFromUrl(url), bytes, err))
        {
            out.error = LoadError::NetworkError;
            out.message = err;
            return out;
        }
    }
    else
    {
        http::Response r = http::Get(url, {{"Accept", "image/*"}});
        if (!http::Ok(r))
        {
            out.error = LoadError::NetworkError;
            out.message = r.err.empty() ? "request failed" : r.err;
            return out;
        }
        if (!IsAcceptableImageContentType(r.content_type))
        {
            out.error = LoadError::DecodeError;
            out.message = "not an image (" + r.content_type + ")";
            return out;
        }
        bytes = std::move(r.body);
    }

    std::string err;
    if (!image_decode::DecodeMemoryRgba32(bytes, out.result.bitmap, err))
    {
        out.error = LoadError::DecodeError;
        out.message = err;
        return out;
    }

    out.ok = true;
    return out;
}

HttpImageLoader::HttpImageLoader(EventLoop& loop, int worker_count)
    : m_loop(loop)
    , m_alive(std::make_shared<std::atomic<bool>>(true))
{
    StartWorkers(std::clamp(worker_count, 1, 8));
}

HttpImageLoader::~HttpImageLoader()
{
    Shutdown();
}

void HttpImageLoader::StartWorkers(int worker_count)
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_running = true;
    }
    m_workers.reserve((size_t)worker_count);
    for (int i = 0; i < worker_count; ++i)
        m_workers.emplace_back([this]() { WorkerMain(); });
}

void HttpImageLoader::Shutdown()
{
    m_alive->store(false);
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (!m_running && m_workers.empty())
            return;
        m_running = false;
        m_jobs.clear();
    }
    m_cv.notify_all();
    for (auto& t : m_workers)
    {
        if (t.joinable())
            t.join();
    }
    m_workers.clear();
}

void HttpImageLoader::Load(const std::string& url, Callback done)
{
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (!m_running)
            return;
        m_jobs.push_back(Job{url, std::move(done)});
    }
    m_cv.notify_one();
}

void HttpImageLoader::WorkerMain()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mu);
            m_cv.wait(lock, [&]() { return !m_running || !m_jobs.empty(); });
            if (!m_running)
                return;
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }

        LoadOutcome outcome = FetchAndDecode(job.url);
        if (!outcome.ok)
        {
            std::fprintf(stderr, "[loader] %s failed (%s): %s\n",
                         job.url.c_str(), LoadErrorName(outcome.error), outcome.message.c_str());
        }

        // Hand the result back to the loop thread. The bitmap moves into a shared
        // holder because std::function requires a copyable callable.
        auto holder = std::make_shared<LoadOutcome>(std::move(outcome));
        std::shared_ptr<std::atomic<bool>> alive = m_alive;
        Callback done = std::move(job.done);
        m_loop.Post([alive, holder, done]() {
            if (!alive->load() || !done)
                return;
            done(std::move(*holder));
        });
    }
}
} // namespace drift
