// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Fundamentals Classification Unit Tests
// ============================================================================

#include "confluence/analysis/confidence_scorer.hpp"
#include "confluence/analysis/fundamentals.hpp"

#include <gtest/gtest.h>

using namespace confluence;
using namespace confluence::analysis;

TEST(ValuationTest, PeBands) {
    EXPECT_EQ(classify_valuation(std::nullopt), Valuation::Unknown);
    EXPECT_EQ(classify_valuation(10.0), Valuation::Undervalued);
    EXPECT_EQ(classify_valuation(15.0), Valuation::Fair);
    EXPECT_EQ(classify_valuation(30.0), Valuation::Fair);
    EXPECT_EQ(classify_valuation(31.0), Valuation::Overvalued);
}

TEST(ValuationTest, CustomThresholds) {
    FundamentalThresholds t;
    t.undervalued_pe = 8.0;
    t.overvalued_pe = 12.0;
    EXPECT_EQ(classify_valuation(10.0, t), Valuation::Fair);
    EXPECT_EQ(classify_valuation(13.0, t), Valuation::Overvalued);
}

TEST(GrowthTest, RevenueGrowthBands) {
    EXPECT_EQ(classify_growth(std::nullopt), Growth::Unknown);
    EXPECT_EQ(classify_growth(0.20), Growth::Strong);
    EXPECT_EQ(classify_growth(0.15), Growth::Moderate);
    EXPECT_EQ(classify_growth(0.08), Growth::Moderate);
    EXPECT_EQ(classify_growth(0.05), Growth::Weak);
    EXPECT_EQ(classify_growth(-0.10), Growth::Weak);
}

TEST(FundamentalsTest, ClassifyFillsLabels) {
    FundamentalsSummary raw;
    raw.pe_ratio = 35.0;
    raw.revenue_growth = 0.25;
    raw.sector = SectorComparison::Outperforming;

    const auto f = classify_fundamentals(raw);
    EXPECT_EQ(f.valuation, Valuation::Overvalued);
    EXPECT_EQ(f.growth, Growth::Strong);
    EXPECT_EQ(f.sector, SectorComparison::Outperforming);
    EXPECT_DOUBLE_EQ(*f.pe_ratio, 35.0);
}

TEST(SectorTest, ReturnOnEquityBands) {
    EXPECT_EQ(classify_sector(std::nullopt), SectorComparison::Unknown);
    EXPECT_EQ(classify_sector(0.25), SectorComparison::Outperforming);
    EXPECT_EQ(classify_sector(0.20), SectorComparison::Inline);
    EXPECT_EQ(classify_sector(0.15), SectorComparison::Inline);
    EXPECT_EQ(classify_sector(0.10), SectorComparison::Underperforming);
    EXPECT_EQ(classify_sector(-0.05), SectorComparison::Underperforming);
}

TEST(SectorTest, CustomThresholds) {
    FundamentalThresholds t;
    t.outperforming_roe = 0.30;
    t.inline_roe = 0.05;
    EXPECT_EQ(classify_sector(0.25, t), SectorComparison::Inline);
    EXPECT_EQ(classify_sector(0.06, t), SectorComparison::Inline);
    EXPECT_EQ(classify_sector(0.31, t), SectorComparison::Outperforming);
}

TEST(FundamentalsTest, ReturnOnEquityOverridesSuppliedSector) {
    FundamentalsSummary raw;
    raw.return_on_equity = 0.05;
    raw.sector = SectorComparison::Outperforming;

    EXPECT_EQ(classify_fundamentals(raw).sector, SectorComparison::Underperforming);
}

TEST(FundamentalsTest, SectorFromReturnOnEquityMovesFundamentalScore) {
    FundamentalsSummary strong;
    strong.return_on_equity = 0.25;
    FundamentalsSummary weak;
    weak.return_on_equity = 0.05;

    const int strong_score = score_fundamental_strength(classify_fundamentals(strong));
    const int weak_score = score_fundamental_strength(classify_fundamentals(weak));
    EXPECT_GT(strong_score, 50);
    EXPECT_LT(weak_score, 50);
}

TEST(FundamentalsTest, Labels) {
    EXPECT_EQ(to_string(Valuation::Undervalued), "undervalued");
    EXPECT_EQ(to_string(Growth::Unknown), "unknown");
    EXPECT_EQ(to_string(SectorComparison::Underperforming), "underperforming");
}
