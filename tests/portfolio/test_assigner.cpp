/// @file tests/portfolio/test_assigner.cpp
/// @brief PortfolioAssigner: per-period decile thresholds.

#include <gtest/gtest.h>
#include "qmj/portfolio.hpp"

#include <string>
#include <vector>

using namespace qmj;
using namespace qmj::portfolio;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<RankedEntity> ranked_n(std::size_t n) {
    std::vector<RankedEntity> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(RankedEntity{
            .entity_id = "E" + std::to_string(i),
            .period    = {2019, 0},
            .quality   = static_cast<double>(n - i),
            .rank      = i + 1,
        });
    }
    return out;
}

static std::size_t count_bucket(const std::vector<PortfolioAssignment>& a, Bucket b) {
    std::size_t n = 0;
    for (const auto& x : a) n += (x.bucket == b);
    return n;
}

// ─── Ten entities ────────────────────────────────────────────────────────────

TEST(PortfolioAssigner, TenEntitiesTopIsQualityBottomIsJunk) {
    const auto out = PortfolioAssigner{}.assign(ranked_n(10));
    ASSERT_EQ(out.size(), 10u);
    EXPECT_EQ(out[0].bucket, Bucket::Quality);
    EXPECT_EQ(out[9].bucket, Bucket::Junk);
    for (std::size_t i = 1; i <= 8; ++i) {
        EXPECT_EQ(out[i].bucket, Bucket::Neutral) << "rank " << i + 1;
    }
}

// ─── Bucket counts ───────────────────────────────────────────────────────────

TEST(PortfolioAssigner, CountsMatchCeilAndFloorFormulae) {
    const PortfolioAssigner assigner;
    for (std::size_t n = 2; n <= 250; ++n) {
        const auto out = assigner.assign(ranked_n(n));
        const std::size_t expect_q = (n + 9) / 10;      // ceil(0.1 · N)
        const std::size_t expect_j = n - (9 * n) / 10;  // N − floor(0.9 · N)
        EXPECT_EQ(count_bucket(out, Bucket::Quality), expect_q) << "N=" << n;
        EXPECT_EQ(count_bucket(out, Bucket::Junk), expect_j) << "N=" << n;
        EXPECT_EQ(count_bucket(out, Bucket::Neutral), n - expect_q - expect_j) << "N=" << n;
    }
}

TEST(PortfolioAssigner, ThresholdsUsePerPeriodCount) {
    const PortfolioAssigner assigner;
    const auto t30 = assigner.thresholds(30);
    EXPECT_EQ(t30.quality_cutoff, 3u);
    EXPECT_EQ(t30.junk_threshold, 27u);
    const auto t11 = assigner.thresholds(11);
    EXPECT_EQ(t11.quality_cutoff, 2u);
    EXPECT_EQ(t11.junk_threshold, 9u);
}

TEST(PortfolioAssigner, CustomFractions) {
    const PortfolioAssigner assigner(0.2, 0.3);
    const auto out = assigner.assign(ranked_n(10));
    EXPECT_EQ(count_bucket(out, Bucket::Quality), 2u);
    EXPECT_EQ(count_bucket(out, Bucket::Junk), 3u);
    EXPECT_EQ(out[7].bucket, Bucket::Junk);
    EXPECT_EQ(out[6].bucket, Bucket::Neutral);
}

TEST(PortfolioAssigner, SingleEntityIsQuality) {
    const auto out = PortfolioAssigner{}.assign(ranked_n(1));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].bucket, Bucket::Quality);
}

TEST(PortfolioAssigner, TwoEntitiesSplit) {
    const auto out = PortfolioAssigner{}.assign(ranked_n(2));
    EXPECT_EQ(out[0].bucket, Bucket::Quality);
    EXPECT_EQ(out[1].bucket, Bucket::Junk);
}

TEST(PortfolioAssigner, EmptyInput) {
    EXPECT_TRUE(PortfolioAssigner{}.assign({}).empty());
}

// ─── bucket_size ─────────────────────────────────────────────────────────────

TEST(PortfolioAssigner_BucketSize, RoundingNoiseDoesNotAddEntity) {
    // fraction · n can land one ulp above an integer; the size must not round up.
    EXPECT_EQ(PortfolioAssigner::bucket_size(0.1, 30), 3u);
    EXPECT_EQ(PortfolioAssigner::bucket_size(0.3, 10), 3u);
    EXPECT_EQ(PortfolioAssigner::bucket_size(0.1, 0), 0u);
    EXPECT_EQ(PortfolioAssigner::bucket_size(0.5, 3), 2u);
}
