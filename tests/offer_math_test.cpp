#include <gtest/gtest.h>
#include <limits>
#include "approval/offer_math.hpp"

using namespace approval;
using namespace approval::offer;

// =============================================================================
// Approval Score Tests
// =============================================================================

TEST(OfferMathTest, ApprovalScore_MaximumRequested_ShouldBeOne) {
    EXPECT_EQ(approval_score(100, 2400, 24), 1.0);
}

TEST(OfferMathTest, ApprovalScore_ShouldUseRealDivision) {
    // 100 / 800 truncates to 0 with integer division
    EXPECT_DOUBLE_EQ(approval_score(100, 800, 12), 1.5);
    EXPECT_LT(approval_score(100, 2000, 12), 1.0);
}

// =============================================================================
// Max Amount Tests
// =============================================================================

TEST(OfferMathTest, MaxAmount_BelowCap_ShouldBeFactorTimesPeriod) {
    EXPECT_DOUBLE_EQ(max_amount_for_period(100, 12, OfferBounds{}), 1200);
}

TEST(OfferMathTest, MaxAmount_AboveCap_ShouldBeCapped) {
    EXPECT_DOUBLE_EQ(max_amount_for_period(500, 24, OfferBounds{}), 5000);
}

TEST(OfferMathTest, MaxAmount_LargeFactor_ShouldNotOverflow) {
    EXPECT_DOUBLE_EQ(max_amount_for_period(std::numeric_limits<int32_t>::max(), 24, OfferBounds{}),
                     5000);
}

// =============================================================================
// Nearest Offer Tests
// =============================================================================

TEST(OfferMathTest, NearestOffer_ShouldReturnFirstValidPeriod) {
    // 15 * 13 = 195, 15 * 14 = 210
    auto nearest = find_nearest_offer(15, 6, OfferBounds{});

    ASSERT_TRUE(nearest.has_value());
    EXPECT_DOUBLE_EQ(nearest->amount, 210);
    EXPECT_EQ(nearest->period, 14);
}

TEST(OfferMathTest, NearestOffer_ShouldSkipRequestedPeriod) {
    // 20 * 10 = 200 is valid, but only later periods are searched
    auto nearest = find_nearest_offer(20, 10, OfferBounds{});

    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(nearest->period, 11);
    EXPECT_DOUBLE_EQ(nearest->amount, 220);
}

TEST(OfferMathTest, NearestOffer_NoValidPeriod_ShouldReturnNullopt) {
    // 5 * 24 = 120
    EXPECT_FALSE(find_nearest_offer(5, 6, OfferBounds{}).has_value());
}

TEST(OfferMathTest, NearestOffer_NegativeFactor_ShouldReturnNullopt) {
    EXPECT_FALSE(find_nearest_offer(-1, 6, OfferBounds{}).has_value());
}

TEST(OfferMathTest, NearestOffer_AtMaximumPeriod_ShouldReturnNullopt) {
    EXPECT_FALSE(find_nearest_offer(100, 24, OfferBounds{}).has_value());
}

TEST(OfferMathTest, NearestOffer_ShouldBeSmallestQualifyingPeriod) {
    OfferBounds bounds;
    for (int32_t factor = 1; factor <= 40; ++factor) {
        for (int32_t start = bounds.min_period; start <= bounds.max_period; ++start) {
            auto nearest = find_nearest_offer(factor, start, bounds);
            for (int32_t m = start + 1; m <= bounds.max_period; ++m) {
                bool valid = bounds.contains_amount(max_amount_for_period(factor, m, bounds));
                if (valid) {
                    ASSERT_TRUE(nearest.has_value()) << "factor " << factor << " start " << start;
                    EXPECT_EQ(nearest->period, m);
                    break;
                }
                EXPECT_TRUE(!nearest || nearest->period > m);
            }
            if (nearest) {
                EXPECT_GT(nearest->period, start);
                EXPECT_LE(nearest->period, bounds.max_period);
            }
        }
    }
}
