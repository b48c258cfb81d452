#pragma once

#include "rotation/rotation_types.h"

#include <functional>
#include <memory>
#include <string>

namespace drift
{
class ImageLoader;
class ProviderRegistry;

// Drives ProviderRegistry + ImageLoader through a bounded attempt sequence:
//
//   Providers(k tries) --all failed--> Fallback(1 try) --failed--> Exhausted
//          |                                 |
//          +--success--> Done                +--success--> Done
//
// At most `max_tries + 1` load operations are issued and the chain always
// terminates. Provider-level failures never escape: the caller only ever sees
// success or AllProvidersExhausted.
class RetryFallbackResolver
{
public:
    using Callback = std::function<void(LoadOutcome)>;

    RetryFallbackResolver(ProviderRegistry& providers, ImageLoader& loader, std::string fallback_url);
    ~RetryFallbackResolver();

    RetryFallbackResolver(const RetryFallbackResolver&) = delete;
    RetryFallbackResolver& operator=(const RetryFallbackResolver&) = delete;

    // Size passed to provider URL builders.
    void SetRequestSize(ImageSize size) { m_request = size; }
    ImageSize RequestSize() const { return m_request; }

    // max_tries defaults to the provider count.
    void LoadNextWithRetry(Callback done);
    void LoadNextWithRetry(int max_tries, Callback done);

    // Single attempt against the bundled local asset.
    void LoadFallback(Callback done);

private:
    struct Chain;

    void Step(const std::shared_ptr<Chain>& chain);

    ProviderRegistry& m_providers;
    ImageLoader& m_loader;
    std::string m_fallback_url;
    ImageSize m_request{1920, 1080};

    // Cleared on destruction so late loader completions become no-ops.
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
} // namespace drift
