// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Conflict Detector Unit Tests
// ============================================================================

#include "confluence/analysis/conflict_detector.hpp"

#include <gtest/gtest.h>

using namespace confluence;
using namespace confluence::analysis;

namespace {

FundamentalsSummary fundamentals(Valuation valuation, Growth growth,
                                 std::optional<double> pe = std::nullopt) {
    FundamentalsSummary f;
    f.valuation = valuation;
    f.growth = growth;
    f.pe_ratio = pe;
    return f;
}

}  // namespace

// ============================================================================
// Bullish Bias
// ============================================================================

TEST(ConflictTest, OvervaluedBullish) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Overvalued, Growth::Strong, 35.0));

    EXPECT_TRUE(result.has_conflict);
    EXPECT_EQ(result.conflict_type, ConflictType::OvervaluedBullish);
    EXPECT_EQ(to_string(result.conflict_type), "OVERVALUED_BULLISH");
    EXPECT_EQ(result.confidence_adjustment, -15);
    EXPECT_EQ(result.technical_bias, Bias::Bullish);
    EXPECT_EQ(result.fundamental_verdict, "overvalued valuation with strong growth");
    ASSERT_EQ(result.details.size(), 1u);
    EXPECT_NE(result.details[0].find("P/E 35.0"), std::string::npos);
    EXPECT_NE(result.recommendation.find("caution"), std::string::npos);
}

TEST(ConflictTest, OvervaluedLabelNeedsHighPe) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Overvalued, Growth::Strong, 28.0));
    EXPECT_FALSE(result.has_conflict);
    EXPECT_EQ(result.confidence_adjustment, 0);
}

TEST(ConflictTest, WeakGrowthBullish) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Fair, Growth::Weak, 20.0));

    EXPECT_TRUE(result.has_conflict);
    EXPECT_EQ(result.conflict_type, ConflictType::WeakGrowthBullish);
    EXPECT_EQ(result.confidence_adjustment, -10);
}

TEST(ConflictTest, WeakGrowthKeepsLargerOvervaluationPenalty) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Overvalued, Growth::Weak, 40.0));

    EXPECT_EQ(result.conflict_type, ConflictType::WeakGrowthBullish);
    EXPECT_EQ(result.confidence_adjustment, -15);
    EXPECT_EQ(result.details.size(), 2u);
}

TEST(ConflictTest, UndervaluedOverridesAdjustmentButNotType) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Undervalued, Growth::Weak, 10.0));

    EXPECT_TRUE(result.has_conflict);
    EXPECT_EQ(result.conflict_type, ConflictType::WeakGrowthBullish);
    EXPECT_EQ(result.confidence_adjustment, 15);
}

TEST(ConflictTest, UndervaluedBullishIsAligned) {
    const auto result =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Undervalued, Growth::Strong, 10.0));

    EXPECT_FALSE(result.has_conflict);
    EXPECT_EQ(result.confidence_adjustment, 15);
    EXPECT_EQ(result.recommendation,
              "Fundamental and technical analysis aligned. Higher confidence.");
}

// ============================================================================
// Bearish / Neutral Bias
// ============================================================================

TEST(ConflictTest, UndervaluedBearish) {
    const auto result =
        detect_conflict(Bias::Bearish, fundamentals(Valuation::Undervalued, Growth::Strong, 12.0));

    EXPECT_TRUE(result.has_conflict);
    EXPECT_EQ(result.conflict_type, ConflictType::UndervaluedBearish);
    EXPECT_EQ(result.confidence_adjustment, -10);
}

TEST(ConflictTest, OvervaluedBearishConfirms) {
    const auto result =
        detect_conflict(Bias::Bearish, fundamentals(Valuation::Overvalued, Growth::Moderate, 45.0));

    EXPECT_FALSE(result.has_conflict);
    EXPECT_EQ(result.conflict_type, ConflictType::None);
    EXPECT_EQ(result.confidence_adjustment, 10);
}

TEST(ConflictTest, NeutralBiasSkips) {
    const auto result =
        detect_conflict(Bias::Neutral, fundamentals(Valuation::Overvalued, Growth::Weak, 50.0));

    EXPECT_FALSE(result.has_conflict);
    EXPECT_EQ(result.confidence_adjustment, 0);
    EXPECT_NE(result.recommendation.find("SKIP"), std::string::npos);
}

TEST(ConflictTest, AdjustmentIsBounded) {
    FundamentalThresholds t;
    t.undervalued_bullish_adjustment = 80;

    const auto result = detect_conflict(
        Bias::Bullish, fundamentals(Valuation::Undervalued, Growth::Strong, 10.0), t);
    EXPECT_EQ(result.confidence_adjustment, 30);
}

// ============================================================================
// Summary Line
// ============================================================================

TEST(ConflictSummaryTest, ConflictAndAlignment) {
    const auto conflict =
        detect_conflict(Bias::Bullish, fundamentals(Valuation::Overvalued, Growth::Strong, 35.0));
    EXPECT_EQ(conflict_summary(conflict),
              "Conflict detected: BULLISH technical but overvalued valuation with strong growth");

    const auto aligned = detect_conflict(Bias::Neutral, fundamentals(Valuation::Fair, Growth::Unknown));
    EXPECT_EQ(conflict_summary(aligned),
              "Fundamental-technical alignment: fair valuation with unknown growth");
}
