#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace drift::http
{
struct Options
{
    long connect_timeout_s = 10;
    long timeout_s = 20;
    // Downloads larger than this are aborted.
    std::size_t max_body_bytes = 64u * 1024u * 1024u;
};

struct Response
{
    long status = 0;
    std::string content_type;
    std::vector<std::uint8_t> body;
    std::string err;
};

// Blocking anonymous GET over libcurl, safe to call from worker threads.
// Redirects are followed; cookies, credentials and .netrc are never used.
// `err` is set on transport errors, oversized bodies and non-2xx statuses.
Response Get(const std::string& url,
             const std::map<std::string, std::string>& headers = {},
             const Options& options = {});

inline bool Ok(const Response& r) { return r.err.empty() && r.status >= 200 && r.status < 300; }
} // namespace drift::http
