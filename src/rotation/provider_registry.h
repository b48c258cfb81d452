#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace drift
{
// One external image source. Immutable once handed to the registry.
struct ProviderSpec
{
    int priority = 0; // lower runs first
    std::string name;
    std::function<std::string(int width, int height, std::uint32_t nonce)> build;

    // Template placeholders: {w}, {h}, {nonce}.
    static ProviderSpec FromTemplate(int priority, std::string name, std::string url_template);
};

// Ordered, round-robin set of URL builders.
class ProviderRegistry
{
public:
    // Providers are sorted by ascending priority (stable for equal priorities).
    // An empty list, or one without any usable builder, falls back to DefaultProviders().
    explicit ProviderRegistry(std::vector<ProviderSpec> providers = {},
                              std::uint32_t seed = std::random_device{}());

    // Builds the URL of the provider under the cursor, then advances the cursor
    // (mod provider count). Every URL carries a fresh cache-busting nonce.
    std::string NextUrl(int width, int height);

    std::size_t Count() const { return m_providers.size(); }
    std::size_t Cursor() const { return m_cursor; }
    const ProviderSpec& At(std::size_t i) const { return m_providers[i]; }

    static std::vector<ProviderSpec> DefaultProviders();

private:
    std::vector<ProviderSpec> m_providers;
    std::size_t m_cursor = 0;
    std::mt19937 m_rng;
};

// Replaces every occurrence of {w}, {h} and {nonce} in `tmpl`.
std::string ExpandProviderTemplate(const std::string& tmpl, int width, int height, std::uint32_t nonce);
} // namespace drift
