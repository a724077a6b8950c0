#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <knotview/color_assigner.hpp>
#include <set>
#include <vector>

using namespace knotview;

TEST(ColorAssigner, HuesAreEvenlySpaced)
{
    auto hues = ColorAssigner::sample_hues(4);
    ASSERT_EQ(hues.size(), 4u);
    EXPECT_FLOAT_EQ(hues[0], 0.0f);
    EXPECT_FLOAT_EQ(hues[1], 0.25f);
    EXPECT_FLOAT_EQ(hues[2], 0.5f);
    EXPECT_FLOAT_EQ(hues[3], 0.75f);
}

TEST(ColorAssigner, EndpointIsDropped)
{
    // Hue 1 would repeat hue 0.
    for (size_t k : {1u, 2u, 3u, 7u, 50u})
    {
        auto hues = ColorAssigner::sample_hues(k);
        ASSERT_EQ(hues.size(), k);
        for (float h : hues)
        {
            EXPECT_GE(h, 0.0f);
            EXPECT_LT(h, 1.0f);
        }
    }
}

TEST(ColorAssigner, ZeroCurvesGivesNoColors)
{
    ColorAssigner assigner(1u);
    EXPECT_TRUE(ColorAssigner::sample_hues(0).empty());
    EXPECT_TRUE(assigner.assign(0).empty());
}

TEST(ColorAssigner, SingleCurveIsRed)
{
    ColorAssigner assigner(1u);
    auto          colors = assigner.assign(1);
    ASSERT_EQ(colors.size(), 1u);
    EXPECT_EQ(colors[0], hsv_to_rgb(0.0f, 1.0f, 1.0f));
}

TEST(ColorAssigner, ColorsAreFullySaturatedAndDistinct)
{
    ColorAssigner assigner(42u);
    auto          colors = assigner.assign(6);
    ASSERT_EQ(colors.size(), 6u);

    std::set<int> hue_slots;
    for (const auto& c : colors)
    {
        float maxc = std::max({c.r, c.g, c.b});
        float minc = std::min({c.r, c.g, c.b});
        EXPECT_NEAR(maxc, 1.0f, 1e-5f);
        EXPECT_NEAR(minc, 0.0f, 1e-5f);
        hue_slots.insert(static_cast<int>(std::lround(rgb_to_hue(c) * 6.0f)) % 6);
    }
    EXPECT_EQ(hue_slots.size(), 6u);
}

TEST(ColorAssigner, OutputIsPermutationOfHueSamples)
{
    ColorAssigner assigner(7u);
    auto          colors = assigner.assign(5);

    std::vector<float> hues;
    for (const auto& c : colors)
        hues.push_back(rgb_to_hue(c));
    std::sort(hues.begin(), hues.end());

    auto expected = ColorAssigner::sample_hues(5);
    ASSERT_EQ(hues.size(), expected.size());
    for (size_t i = 0; i < hues.size(); ++i)
        EXPECT_NEAR(hues[i], expected[i], 1e-4f);
}

TEST(ColorAssigner, SameSeedSameOrder)
{
    ColorAssigner a(1234u);
    ColorAssigner b(1234u);
    EXPECT_EQ(a.assign(8), b.assign(8));
    EXPECT_EQ(a.assign(3), b.assign(3));
}

TEST(ColorAssigner, InjectedEngineIsUsed)
{
    std::mt19937  engine(99u);
    ColorAssigner a(engine);
    ColorAssigner b(99u);
    EXPECT_EQ(a.assign(10), b.assign(10));
}

TEST(ColorAssigner, ShuffleChangesOrderForSomeSeed)
{
    // With 10 colors at least one of these seeds must leave hue order.
    bool shuffled = false;
    for (uint32_t seed = 0; seed < 8 && !shuffled; ++seed)
    {
        ColorAssigner assigner(seed);
        auto          colors = assigner.assign(10);
        for (size_t i = 0; i < colors.size(); ++i)
        {
            if (colors[i] != hsv_to_rgb(static_cast<float>(i) / 10.0f, 1.0f, 1.0f))
            {
                shuffled = true;
                break;
            }
        }
    }
    EXPECT_TRUE(shuffled);
}
