#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "ta_ngin/indicators/bollinger.hpp"
#include "test_utils.hpp"

using namespace ta_ngin;
using namespace ta_ngin::indicators;
using ta_ngin::testing::IsAbsent;
using ta_ngin::testing::IsPresentNear;
using ta_ngin::testing::first_present_index;
using ta_ngin::testing::make_zigzag_closes;

TEST(BollingerTest, ConstantWindowCollapsesBands) {
    std::vector<double> closes(15, 10.0);
    auto bands = compute_bollinger(closes, 14, 2.0);

    ASSERT_EQ(bands.middle.size(), 15u);
    for (size_t i = 0; i < 13; ++i) {
        EXPECT_THAT(bands.upper[i], IsAbsent());
        EXPECT_THAT(bands.middle[i], IsAbsent());
        EXPECT_THAT(bands.lower[i], IsAbsent());
    }
    ASSERT_TRUE(bands.middle[13].has_value());
    EXPECT_EQ(*bands.middle[13], 10.0);
    EXPECT_EQ(*bands.upper[13], 10.0);
    EXPECT_EQ(*bands.lower[13], 10.0);
    EXPECT_EQ(*bands.upper[14], *bands.lower[14]);
}

TEST(BollingerTest, UsesPopulationStandardDeviation) {
    // Window {2, 4, 4, 4, 5, 5, 7, 9}: mean 5, population std 2
    std::vector<double> closes{2, 4, 4, 4, 5, 5, 7, 9};
    auto bands = compute_bollinger(closes, 8, 2.0);

    EXPECT_EQ(first_present_index(bands.middle), 7u);
    EXPECT_THAT(bands.middle[7], IsPresentNear(5.0, 1e-12));
    EXPECT_THAT(bands.upper[7], IsPresentNear(9.0, 1e-12));
    EXPECT_THAT(bands.lower[7], IsPresentNear(1.0, 1e-12));
}

TEST(BollingerTest, SlidesTrailingWindow) {
    std::vector<double> closes{1, 2, 3, 4, 5};
    auto bands = compute_bollinger(closes, 3, 1.0);

    const double std_dev = std::sqrt(2.0 / 3.0);
    EXPECT_THAT(bands.middle[2], IsPresentNear(2.0, 1e-12));
    EXPECT_THAT(bands.middle[3], IsPresentNear(3.0, 1e-12));
    EXPECT_THAT(bands.middle[4], IsPresentNear(4.0, 1e-12));
    EXPECT_THAT(bands.upper[4], IsPresentNear(4.0 + std_dev, 1e-12));
    EXPECT_THAT(bands.lower[4], IsPresentNear(4.0 - std_dev, 1e-12));
}

TEST(BollingerTest, BandsAreOrderedWherePresent) {
    auto closes = make_zigzag_closes(200);
    auto bands = compute_bollinger(closes);

    ASSERT_EQ(bands.upper.size(), closes.size());
    EXPECT_EQ(first_present_index(bands.middle), 19u);
    for (size_t i = 19; i < closes.size(); ++i) {
        ASSERT_TRUE(bands.upper[i].has_value());
        ASSERT_TRUE(bands.middle[i].has_value());
        ASSERT_TRUE(bands.lower[i].has_value());
        EXPECT_LE(*bands.lower[i], *bands.middle[i]);
        EXPECT_LE(*bands.middle[i], *bands.upper[i]);
    }
}

TEST(BollingerTest, ZeroMultiplierCollapsesOntoMiddle) {
    auto closes = make_zigzag_closes(40);
    auto bands = compute_bollinger(closes, 20, 0.0);

    for (size_t i = 19; i < closes.size(); ++i) {
        EXPECT_EQ(*bands.upper[i], *bands.middle[i]);
        EXPECT_EQ(*bands.lower[i], *bands.middle[i]);
    }
}

TEST(BollingerTest, InsufficientInputIsEntirelyAbsent) {
    auto closes = make_zigzag_closes(19);
    auto bands = compute_bollinger(closes, 20, 2.0);

    ASSERT_EQ(bands.upper.size(), 19u);
    EXPECT_THAT(bands.upper, ::testing::Each(IsAbsent()));
    EXPECT_THAT(bands.middle, ::testing::Each(IsAbsent()));
    EXPECT_THAT(bands.lower, ::testing::Each(IsAbsent()));

    auto invalid = compute_bollinger(closes, 0, 2.0);
    ASSERT_EQ(invalid.middle.size(), 19u);
    EXPECT_THAT(invalid.middle, ::testing::Each(IsAbsent()));
}
