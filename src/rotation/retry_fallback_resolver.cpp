#include "rotation/retry_fallback_resolver.h"

#include "rotation/image_loader.h"
#include "rotation/provider_registry.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace drift
{
struct RetryFallbackResolver::Chain
{
    enum class Phase
    {
        Providers,
        Fallback,
        Finished,
    };

    Phase phase = Phase::Providers;
    int remaining = 0; // provider tries left
    int attempts = 0;  // load operations issued so far
    Callback done;
};

RetryFallbackResolver::RetryFallbackResolver(ProviderRegistry& providers, ImageLoader& loader, std::string fallback_url)
    : m_providers(providers)
    , m_loader(loader)
    , m_fallback_url(std::move(fallback_url))
{
}

RetryFallbackResolver::~RetryFallbackResolver()
{
    *m_alive = false;
}

void RetryFallbackResolver::LoadNextWithRetry(Callback done)
{
    LoadNextWithRetry((int)m_providers.Count(), std::move(done));
}

void RetryFallbackResolver::LoadNextWithRetry(int max_tries, Callback done)
{
    auto chain = std::make_shared<Chain>();
    chain->remaining = std::max(0, max_tries);
    chain->phase = chain->remaining > 0 ? Chain::Phase::Providers : Chain::Phase::Fallback;
    chain->done = std::move(done);
    Step(chain);
}

void RetryFallbackResolver::LoadFallback(Callback done)
{
    auto chain = std::make_shared<Chain>();
    chain->phase = Chain::Phase::Fallback;
    chain->done = std::move(done);
    Step(chain);
}

void RetryFallbackResolver::Step(const std::shared_ptr<Chain>& chain)
{
    std::string url;
    switch (chain->phase)
    {
        case Chain::Phase::Providers:
            url = m_providers.NextUrl(m_request.width, m_request.height);
            break;
        case Chain::Phase::Fallback:
            url = m_fallback_url;
            break;
        case Chain::Phase::Finished:
            return;
    }

    chain->attempts++;
    std::shared_ptr<bool> alive = m_alive;
    m_loader.Load(url, [this, alive, chain](LoadOutcome outcome) {
        if (!*alive || chain->phase == Chain::Phase::Finished)
            return;

        if (outcome.ok)
        {
            outcome.attempts = chain->attempts;
            outcome.used_fallback = (chain->phase == Chain::Phase::Fallback);
            chain->phase = Chain::Phase::Finished;
            if (chain->done)
                chain->done(std::move(outcome));
            return;
        }

        if (chain->phase == Chain::Phase::Providers)
        {
            std::fprintf(stderr, "[resolver] attempt %d failed (%s), %d provider tries left\n",
                         chain->attempts, LoadErrorName(outcome.error), chain->remaining - 1);
            chain->remaining--;
            if (chain->remaining <= 0)
                chain->phase = Chain::Phase::Fallback;
            Step(chain);
            return;
        }

        // The fallback asset itself failed: give up for this cycle.
        std::fprintf(stderr, "[resolver] fallback %s failed: %s\n",
                     m_fallback_url.c_str(), outcome.message.c_str());
        chain->phase = Chain::Phase::Finished;
        LoadOutcome exhausted;
        exhausted.ok = false;
        exhausted.error = LoadError::AllProvidersExhausted;
        exhausted.message = "all providers and the local fallback failed";
        exhausted.attempts = chain->attempts;
        exhausted.used_fallback = true;
        if (chain->done)
            chain->done(std::move(exhausted));
    });
}
} // namespace drift
