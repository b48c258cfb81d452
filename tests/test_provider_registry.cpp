#include <gtest/gtest.h>

#include "test_support.h"

#include <set>

using namespace drift;

TEST(ExpandProviderTemplate, ReplacesEveryPlaceholder)
{
    EXPECT_EQ(ExpandProviderTemplate("https://x.test/{w}/{h}?r={nonce}&w={w}", 800, 600, 42u),
              "https://x.test/800/600?r=42&w=800");
    EXPECT_EQ(ExpandProviderTemplate("https://x.test/static.jpg", 1, 1, 7u), "https://x.test/static.jpg");
}

TEST(ProviderRegistry, RoundRobinsInPriorityOrder)
{
    std::vector<ProviderSpec> specs;
    specs.push_back(ProviderSpec::FromTemplate(2, "c", "https://c.test/{w}"));
    specs.push_back(ProviderSpec::FromTemplate(0, "a", "https://a.test/{w}"));
    specs.push_back(ProviderSpec::FromTemplate(1, "b", "https://b.test/{w}"));
    ProviderRegistry reg(specs, 1u);

    ASSERT_EQ(reg.Count(), 3u);
    EXPECT_EQ(reg.At(0).name, "a");
    EXPECT_EQ(reg.At(1).name, "b");
    EXPECT_EQ(reg.At(2).name, "c");

    EXPECT_EQ(reg.NextUrl(10, 10), "https://a.test/10");
    EXPECT_EQ(reg.Cursor(), 1u);
    EXPECT_EQ(reg.NextUrl(10, 10), "https://b.test/10");
    EXPECT_EQ(reg.NextUrl(10, 10), "https://c.test/10");
    EXPECT_EQ(reg.Cursor(), 0u);
    EXPECT_EQ(reg.NextUrl(10, 10), "https://a.test/10");
}

TEST(ProviderRegistry, EqualPrioritiesKeepDeclarationOrder)
{
    std::vector<ProviderSpec> specs;
    specs.push_back(ProviderSpec::FromTemplate(0, "first", "https://first.test/"));
    specs.push_back(ProviderSpec::FromTemplate(0, "second", "https://second.test/"));
    ProviderRegistry reg(specs, 1u);
    EXPECT_EQ(reg.At(0).name, "first");
    EXPECT_EQ(reg.At(1).name, "second");
}

TEST(ProviderRegistry, EveryUrlCarriesAFreshNonce)
{
    ProviderRegistry reg(test::TestProviders(1), 99u);
    std::set<std::string> urls;
    for (int i = 0; i < 16; ++i)
        urls.insert(reg.NextUrl(640, 480));
    EXPECT_EQ(urls.size(), 16u);
    EXPECT_TRUE(test::IsFrom(*urls.begin(), "p1"));
}

TEST(ProviderRegistry, SameSeedSameSequence)
{
    ProviderRegistry a(test::TestProviders(), 7u);
    ProviderRegistry b(test::TestProviders(), 7u);
    for (int i = 0; i < 6; ++i)
        EXPECT_EQ(a.NextUrl(100, 50), b.NextUrl(100, 50));
}

TEST(ProviderRegistry, PassesRequestedSize)
{
    ProviderRegistry reg(test::TestProviders(1), 1u);
    const std::string url = reg.NextUrl(1280, 720);
    EXPECT_NE(url.find("1280x720"), std::string::npos);
}

TEST(ProviderRegistry, EmptyListUsesDefaults)
{
    ProviderRegistry reg({}, 1u);
    ASSERT_EQ(reg.Count(), ProviderRegistry::DefaultProviders().size());
    EXPECT_EQ(reg.At(0).name, "picsum");
    EXPECT_EQ(reg.NextUrl(1920, 1080).rfind("https://picsum.photos/1920/1080?random=", 0), 0u);
}

TEST(ProviderRegistry, ProvidersWithoutBuilderAreDropped)
{
    std::vector<ProviderSpec> specs;
    ProviderSpec broken;
    broken.name = "broken";
    specs.push_back(broken);
    specs.push_back(ProviderSpec::FromTemplate(5, "ok", "https://ok.test/"));
    ProviderRegistry reg(specs, 1u);
    ASSERT_EQ(reg.Count(), 1u);
    EXPECT_EQ(reg.At(0).name, "ok");
}
