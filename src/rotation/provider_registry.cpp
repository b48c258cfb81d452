#include "rotation/provider_registry.h"

#include <algorithm>
#include <utility>

namespace drift
{
namespace
{
static void ReplaceAll(std::string& s, const std::string& token, const std::string& value)
{
    std::size_t pos = 0;
    while ((pos = s.find(token, pos)) != std::string::npos)
    {
        s.replace(pos, token.size(), value);
        pos += value.size();
    }
}
} // namespace

std::string ExpandProviderTemplate(const std::string& tmpl, int width, int height, std::uint32_t nonce)
{
    std::string out = tmpl;
    ReplaceAll(out, "{w}", std::to_string(width));
    ReplaceAll(out, "{h}", std::to_string(height));
    ReplaceAll(out, "{nonce}", std::to_string(nonce));
    return out;
}

ProviderSpec ProviderSpec::FromTemplate(int priority, std::string name, std::string url_template)
{
    ProviderSpec p;
    p.priority = priority;
    p.name = std::move(name);
    p.build = [tmpl = std::move(url_template)](int w, int h, std::uint32_t nonce) {
        return ExpandProviderTemplate(tmpl, w, h, nonce);
    };
    return p;
}

std::vector<ProviderSpec> ProviderRegistry::DefaultProviders()
{
    std::vector<ProviderSpec> out;
    out.push_back(ProviderSpec::FromTemplate(0, "picsum", "https://picsum.photos/{w}/{h}?random={nonce}"));
    out.push_back(ProviderSpec::FromTemplate(1, "loremflickr", "https://loremflickr.com/{w}/{h}/landscape?lock={nonce}"));
    out.push_back(ProviderSpec::FromTemplate(2, "picsum-jpg", "https://picsum.photos/{w}/{h}.jpg?random={nonce}"));
    return out;
}

ProviderRegistry::ProviderRegistry(std::vector<ProviderSpec> providers, std::uint32_t seed)
    : m_rng(seed)
{
    providers.erase(std::remove_if(providers.begin(), providers.end(),
                                   [](const ProviderSpec& p) { return !p.build; }),
                    providers.end());
    if (providers.empty())
        providers = DefaultProviders();

    std::stable_sort(providers.begin(), providers.end(),
                     [](const ProviderSpec& a, const ProviderSpec& b) { return a.priority < b.priority; });
    m_providers = std::move(providers);
}

std::string ProviderRegistry::NextUrl(int width, int height)
{
    const ProviderSpec& p = m_providers[m_cursor];
    m_cursor = (m_cursor + 1) % m_providers.size();
    return p.build(width, height, (std::uint32_t)m_rng());
}
} // namespace drift
