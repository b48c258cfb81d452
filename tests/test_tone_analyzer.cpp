#include <gtest/gtest.h>

#include "rotation/tone_analyzer.h"
#include "test_support.h"

using namespace drift;

TEST(ToneAnalyzer, SrgbTransferFunction)
{
    EXPECT_DOUBLE_EQ(ToneAnalyzer::SrgbToLinear(0.0), 0.0);
    EXPECT_DOUBLE_EQ(ToneAnalyzer::SrgbToLinear(1.0), 1.0);
    // Linear segment up to and including the threshold.
    EXPECT_DOUBLE_EQ(ToneAnalyzer::SrgbToLinear(0.04045), 0.04045 / 12.92);
    EXPECT_NEAR(ToneAnalyzer::SrgbToLinear(0.5), 0.214041, 1e-6);
}

TEST(ToneAnalyzer, Bt709Weights)
{
    EXPECT_NEAR(ToneAnalyzer::RelativeLuminance(255, 0, 0), 0.2126, 1e-9);
    EXPECT_NEAR(ToneAnalyzer::RelativeLuminance(0, 255, 0), 0.7152, 1e-9);
    EXPECT_NEAR(ToneAnalyzer::RelativeLuminance(0, 0, 255), 0.0722, 1e-9);
    EXPECT_NEAR(ToneAnalyzer::RelativeLuminance(255, 255, 255), 1.0, 1e-9);
}

TEST(ToneAnalyzer, WhiteIsLightBlackIsDark)
{
    ToneAnalyzer a;
    EXPECT_EQ(a.Classify(test::SolidBitmap(64, 64, 255, 255, 255)), ToneClass::Light);
    EXPECT_EQ(a.Classify(test::SolidBitmap(64, 64, 0, 0, 0)), ToneClass::Dark);
}

TEST(ToneAnalyzer, ThresholdIsStrictlyAboveSixTenths)
{
    ToneAnalyzer a;
    // sRGB 203 -> 0.5972 linear, 204 -> 0.6038 linear.
    const Bitmap below = test::SolidBitmap(40, 30, 203, 203, 203);
    const Bitmap above = test::SolidBitmap(40, 30, 204, 204, 204);

    ASSERT_TRUE(a.AverageLuminance(below).has_value());
    EXPECT_LT(*a.AverageLuminance(below), ToneAnalyzer::kLightThreshold);
    EXPECT_GT(*a.AverageLuminance(above), ToneAnalyzer::kLightThreshold);

    EXPECT_EQ(a.Classify(below), ToneClass::Dark);
    EXPECT_EQ(a.Classify(above), ToneClass::Light);
}

TEST(ToneAnalyzer, AveragesInLinearLight)
{
    // Half white, half black: mean linear luminance is 0.5, not the ~0.2 of a
    // mid-grey sRGB average.
    Bitmap b = test::SolidBitmap(64, 64, 0, 0, 0);
    for (int y = 0; y < 64; ++y)
    {
        for (int x = 0; x < 32; ++x)
        {
            std::uint8_t* p = &b.rgba[((size_t)y * 64 + (size_t)x) * 4u];
            p[0] = p[1] = p[2] = 255;
        }
    }
    ToneAnalyzer a(32);
    ASSERT_TRUE(a.AverageLuminance(b).has_value());
    EXPECT_NEAR(*a.AverageLuminance(b), 0.5, 1e-9);
    EXPECT_EQ(a.Classify(b), ToneClass::Dark);
}

TEST(ToneAnalyzer, DeterministicForFixedInputAndGrid)
{
    Bitmap b = test::SolidBitmap(97, 61, 0, 0, 0);
    for (size_t i = 0; i < b.rgba.size(); i += 4)
    {
        b.rgba[i + 0] = (std::uint8_t)(i * 7 % 256);
        b.rgba[i + 1] = (std::uint8_t)(i * 13 % 256);
        b.rgba[i + 2] = (std::uint8_t)(i * 29 % 256);
    }
    ToneAnalyzer a(16);
    const double first = *a.AverageLuminance(b);
    for (int i = 0; i < 3; ++i)
        EXPECT_DOUBLE_EQ(*a.AverageLuminance(b), first);
    EXPECT_EQ(a.Classify(b), a.Classify(b));
}

TEST(ToneAnalyzer, TransparentSamplesAreSkipped)
{
    Bitmap b = test::SolidBitmap(32, 32, 255, 255, 255);
    // Left half: transparent black, which would drag the mean down if counted.
    for (int y = 0; y < 32; ++y)
    {
        for (int x = 0; x < 16; ++x)
        {
            std::uint8_t* p = &b.rgba[((size_t)y * 32 + (size_t)x) * 4u];
            p[0] = p[1] = p[2] = p[3] = 0;
        }
    }
    ToneAnalyzer a(32);
    EXPECT_EQ(a.Classify(b), ToneClass::Light);
}

TEST(ToneAnalyzer, FailuresAreUnknown)
{
    ToneAnalyzer a;
    EXPECT_EQ(a.Classify(Bitmap{}), ToneClass::Unknown);
    EXPECT_EQ(a.Classify(test::SolidBitmap(8, 8, 255, 255, 255, 0)), ToneClass::Unknown);

    Bitmap truncated = test::SolidBitmap(8, 8, 255, 255, 255);
    truncated.rgba.resize(10);
    EXPECT_EQ(a.Classify(truncated), ToneClass::Unknown);
    EXPECT_FALSE(a.AverageLuminance(truncated).has_value());
}

TEST(ToneAnalyzer, GridSideIsClamped)
{
    EXPECT_EQ(ToneAnalyzer(0).GridSide(), 1);
    EXPECT_EQ(ToneAnalyzer(16).GridSide(), 16);
    EXPECT_EQ(ToneAnalyzer(100000).GridSide(), 256);
}

TEST(ToneAnalyzer, ToneNames)
{
    EXPECT_STREQ(ToneClassName(ToneClass::Light), "light");
    EXPECT_STREQ(ToneClassName(ToneClass::Dark), "dark");
    EXPECT_STREQ(ToneClassName(ToneClass::Unknown), "unknown");
}
