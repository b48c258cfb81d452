#include "io/http_client.h"

#include "core/version.h"

#include <curl/curl.h>

#include <mutex>

namespace drift::http
{
namespace
{
struct Sink
{
    std::vector<std::uint8_t>* body = nullptr;
    std::size_t limit = 0;
    bool overflow = false;
};

// Returning less than the offered size makes curl abort with CURLE_WRITE_ERROR.
static size_t AppendBody(void* contents, size_t size, size_t nmemb, void* userp)
{
    auto* sink = static_cast<Sink*>(userp);
    const size_t n = size * nmemb;
    if (sink->body->size() + n > sink->limit)
    {
        sink->overflow = true;
        return 0;
    }
    const auto* p = static_cast<const std::uint8_t*>(contents);
    sink->body->insert(sink->body->end(), p, p + n);
    return n;
}

static void InitCurlOnce()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Owns the easy handle and header list for one request.
struct Request
{
    CURL* curl = nullptr;
    curl_slist* headers = nullptr;

    Request() : curl(curl_easy_init()) {}
    ~Request()
    {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;
};
} // namespace

Response Get(const std::string& url, const std::map<std::string, std::string>& headers, const Options& options)
{
    Response r;
    InitCurlOnce();

    Request req;
    if (!req.curl)
    {
        r.err = "curl_easy_init failed.";
        return r;
    }

    Sink sink;
    sink.body = &r.body;
    sink.limit = options.max_body_bytes;

    CURL* c = req.curl;
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_USERAGENT, DRIFT_USER_AGENT);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_s);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, options.timeout_s);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &sink);

    // Providers are public image hosts; nothing identifying goes out.
    curl_easy_setopt(c, CURLOPT_NETRC, (long)CURL_NETRC_IGNORED);
    curl_easy_setopt(c, CURLOPT_UNRESTRICTED_AUTH, 0L);
    curl_easy_setopt(c, CURLOPT_COOKIEFILE, nullptr);

    for (const auto& [name, value] : headers)
        req.headers = curl_slist_append(req.headers, (name + ": " + value).c_str());
    if (req.headers)
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, req.headers);

    const CURLcode code = curl_easy_perform(c);
    if (sink.overflow)
    {
        r.body.clear();
        r.err = "response larger than " + std::to_string(options.max_body_bytes) + " bytes";
        return r;
    }
    if (code != CURLE_OK)
    {
        r.body.clear();
        r.err = curl_easy_strerror(code);
        return r;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &r.status);
    const char* ct = nullptr;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct)
        r.content_type = ct;

    if (r.status < 200 || r.status >= 300)
        r.err = "HTTP " + std::to_string(r.status);
    return r;
}
} // namespace drift::http
