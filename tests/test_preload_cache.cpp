#include <gtest/gtest.h>

#include "rotation/preload_cache.h"
#include "rotation/retry_fallback_resolver.h"
#include "rotation/rotation_state.h"
#include "test_support.h"

using namespace drift;

namespace
{
struct PreloadFixture
{
    test::ManualLoop m;
    test::FakeImageLoader loader{m.loop};
    ProviderRegistry registry{test::TestProviders(3), 3u};
    RetryFallbackResolver resolver{registry, loader, test::kFallbackPath};
    RotationState state;
    PreloadCache preload{state, resolver};
};
} // namespace

TEST(PreloadCache, RefillPopulatesSlotAsynchronously)
{
    PreloadFixture f;
    EXPECT_FALSE(f.preload.HasValue());

    f.preload.Refill();
    EXPECT_TRUE(f.preload.RefillInFlight());
    EXPECT_FALSE(f.preload.HasValue());

    f.m.Drain();
    EXPECT_FALSE(f.preload.RefillInFlight());
    ASSERT_TRUE(f.preload.HasValue());
    EXPECT_TRUE(test::IsFrom(f.state.preloaded->source_url, "p1"));
}

TEST(PreloadCache, TakeClearsSynchronously)
{
    PreloadFixture f;
    f.preload.Refill();
    f.m.Drain();

    std::optional<LoadResult> got = f.preload.Take();
    ASSERT_TRUE(got.has_value());
    EXPECT_TRUE(got->bitmap.Valid());
    EXPECT_FALSE(f.preload.HasValue());
    EXPECT_FALSE(f.state.preloaded.has_value());
    EXPECT_FALSE(f.preload.Take().has_value());
}

TEST(PreloadCache, ConcurrentRefillIsNotDuplicated)
{
    PreloadFixture f;
    f.loader.hold = true;
    f.preload.Refill();
    f.preload.Refill();
    EXPECT_EQ(f.loader.requests.size(), 1u);

    f.loader.Release();
    f.m.Drain();
    EXPECT_TRUE(f.preload.HasValue());
}

TEST(PreloadCache, SupersededRefillIsNotAdopted)
{
    PreloadFixture f;
    f.loader.hold = true;
    f.preload.Refill();
    const std::uint64_t gen = f.preload.Generation();

    // A swap resolved on its own in the meantime.
    f.preload.Clear();
    EXPECT_GT(f.preload.Generation(), gen);
    EXPECT_FALSE(f.preload.RefillInFlight());

    f.loader.Release();
    f.m.Drain();
    EXPECT_FALSE(f.preload.HasValue());
}

TEST(PreloadCache, NewRefillAfterClearIsAdopted)
{
    PreloadFixture f;
    f.loader.hold = true;
    f.preload.Refill();
    f.preload.Clear();
    f.preload.Refill();
    EXPECT_EQ(f.loader.requests.size(), 2u);

    f.loader.Release();
    f.m.Drain();
    ASSERT_TRUE(f.preload.HasValue());
    EXPECT_TRUE(test::IsFrom(f.state.preloaded->source_url, "p2"));
}

TEST(PreloadCache, FailedRefillLeavesSlotEmpty)
{
    PreloadFixture f;
    f.loader.responder = [](const std::string& url) { return test::Failure(url); };
    f.preload.Refill();
    f.m.Drain();
    EXPECT_FALSE(f.preload.HasValue());
    EXPECT_FALSE(f.preload.RefillInFlight());
    // 3 providers + fallback
    EXPECT_EQ(f.loader.requests.size(), 4u);
}

TEST(PreloadCache, FallbackImageIsCachedLikeAnyOther)
{
    PreloadFixture f;
    f.loader.responder = [](const std::string& url) {
        return url == test::kFallbackPath ? test::Success(url) : test::Failure(url);
    };
    f.preload.Refill();
    f.m.Drain();
    ASSERT_TRUE(f.preload.HasValue());
    EXPECT_EQ(f.state.preloaded->source_url, test::kFallbackPath);
}
