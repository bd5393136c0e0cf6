/**
 * @file test_gap_planner.cpp
 * @brief Unit tests for gap construction and target picking.
 *
 * Tests cover:
 * - Gap construction with and without a target window
 * - Carving a picked target out of the gap list
 * - Edge-biased offsets within a gap
 * - Slack-weighted gap choice
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "progspace/constants.hpp"
#include "progspace/gap_planner.hpp"
#include "progspace/random_source.hpp"

using namespace progspace;

// =============================================================================
// Gap construction
// =============================================================================

TEST(BuildGaps, EmptyMemoryIsOneGap) {
    auto gaps = build_gaps({}, 64, 2, std::nullopt, std::nullopt);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (Gap{0, 64}));
}

TEST(BuildGaps, GapsBetweenAndAboveSections) {
    // [0, 16) and [48, 56) in 64 bytes
    auto gaps = build_gaps({{0, 4}, {48, 2}}, 64, 2, std::nullopt, std::nullopt);
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0], (Gap{16, 32}));
    EXPECT_EQ(gaps[1], (Gap{56, 8}));
}

TEST(BuildGaps, GapsTooSmallForMinLenAreDropped) {
    auto gaps = build_gaps({{0, 4}, {48, 2}}, 64, 3, std::nullopt, std::nullopt);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (Gap{16, 32}));
}

TEST(BuildGaps, WindowClipsGap) {
    auto gaps = build_gaps({}, 64, 1, 20u, 30u);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (Gap{20, 12}));  // starts 20, 24, 28
}

TEST(BuildGaps, GapBelowSectionNeedsMinStrictlyBelowBase) {
    const std::vector<OccupiedRange> ranges = {{32, 4}};

    auto below = build_gaps(ranges, 128, 1, 28u, std::nullopt);
    ASSERT_EQ(below.size(), 2u);
    EXPECT_EQ(below[0], (Gap{28, 4}));

    auto at_base = build_gaps(ranges, 128, 1, 32u, std::nullopt);
    ASSERT_EQ(at_base.size(), 1u);
    EXPECT_EQ(at_base[0].lo, 48u);
}

TEST(BuildGaps, GapStartingAtMaxIsKept) {
    auto gaps = build_gaps({{0, 4}, {64, 4}}, 128, 1, std::nullopt, 16u);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (Gap{16, 4}));
}

TEST(BuildGaps, ZeroLengthRangeStillSplits) {
    auto gaps = build_gaps({{32, 0}}, 64, 1, std::nullopt, std::nullopt);
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0], (Gap{0, 32}));
    EXPECT_EQ(gaps[1], (Gap{32, 32}));
}

TEST(BuildGaps, OverlappingRangesThrow) {
    EXPECT_THROW(build_gaps({{0, 8}, {16, 2}}, 64, 1, std::nullopt, std::nullopt),
                 std::invalid_argument);
}

// =============================================================================
// Reserving targets
// =============================================================================

TEST(ReserveTarget, SplitsGap) {
    std::vector<Gap> gaps = {{0, 64}};
    reserve_target(gaps, 16, 2);
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0], (Gap{0, 16}));
    EXPECT_EQ(gaps[1], (Gap{24, 40}));
}

TEST(ReserveTarget, DropsPiecesTooSmallForMinLen) {
    std::vector<Gap> gaps = {{0, 64}};
    reserve_target(gaps, 4, 2);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0], (Gap{12, 52}));
}

TEST(ReserveTarget, OtherGapsUntouched) {
    std::vector<Gap> gaps = {{0, 16}, {32, 32}};
    reserve_target(gaps, 40, 1);
    ASSERT_EQ(gaps.size(), 3u);
    EXPECT_EQ(gaps[0], (Gap{0, 16}));
    EXPECT_EQ(gaps[1], (Gap{32, 8}));
    EXPECT_EQ(gaps[2], (Gap{44, 20}));
}

TEST(ReserveTarget, ExactFitGapDisappears) {
    std::vector<Gap> gaps = {{24, 8}};
    reserve_target(gaps, 24, 2);
    EXPECT_TRUE(gaps.empty());
}

// =============================================================================
// Picking within a gap
// =============================================================================

TEST(PickInGap, ExactFitGivesGapStart) {
    RandomSource rng(11);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(pick_in_gap(Gap{24, 8}, 2, rng), 24u);
    }
}

TEST(PickInGap, StaysInsideGap) {
    RandomSource rng(12);
    const Gap gap{100, 400};
    for (int i = 0; i < 2000; ++i) {
        const uint32_t tgt = pick_in_gap(gap, 3, rng);
        EXPECT_EQ(tgt % INSN_BYTES, 0u);
        EXPECT_GE(tgt, 100u);
        EXPECT_LE(tgt, 100u + 400u - 3u * INSN_BYTES);
    }
}

TEST(PickInGap, EdgesAreFavoured) {
    // 1000 possible offsets: each edge band holds 10% of them but gets
    // EDGE_BIAS / 2 of the draws
    RandomSource rng(13);
    const Gap gap{0, 4000};
    const int n = 20000;
    int low = 0;
    int high = 0;
    for (int i = 0; i < n; ++i) {
        const uint32_t off = pick_in_gap(gap, 1, rng) / INSN_BYTES;
        if (off < 100) {
            ++low;
        } else if (off >= 900) {
            ++high;
        }
    }
    EXPECT_NEAR(double(low) / n, EDGE_BIAS / 2, 0.03);
    EXPECT_NEAR(double(high) / n, EDGE_BIAS / 2, 0.03);
}

// =============================================================================
// Picking across gaps
// =============================================================================

TEST(PickTargets, SlackDominatesGapChoice) {
    // Weights 1 and 1 + 392^2
    int small_picks = 0;
    for (uint64_t seed = 0; seed < 1000; ++seed) {
        RandomSource rng(seed);
        auto tgts = pick_targets({{0, 8}, {100, 400}}, 2, 1, rng);
        ASSERT_TRUE(tgts.has_value());
        if ((*tgts)[0] < 100) {
            ++small_picks;
        }
    }
    EXPECT_LT(small_picks, 5);
}

TEST(PickTargets, EqualGapsShareEvenly) {
    int first = 0;
    const int n = 4000;
    for (int seed = 0; seed < n; ++seed) {
        RandomSource rng(seed);
        auto tgts = pick_targets({{0, 64}, {128, 64}}, 1, 1, rng);
        ASSERT_TRUE(tgts.has_value());
        if ((*tgts)[0] < 128) {
            ++first;
        }
    }
    EXPECT_NEAR(double(first) / n, 0.5, 0.05);
}

TEST(PickTargets, RunsOutOfGaps) {
    RandomSource rng(0);
    EXPECT_EQ(pick_targets({{0, 16}}, 4, 2, rng), std::nullopt);

    rng.reseed(0);
    auto one = pick_targets({{0, 16}}, 4, 1, rng);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(*one, std::vector<uint32_t>{0});
}

TEST(PickTargets, FillsMemoryWhenEveryPlaceIsNeeded) {
    // Sixteen single-insn targets use every slot in 64 bytes
    RandomSource rng(21);
    auto tgts = pick_targets({{0, 64}}, 1, 16, rng);
    ASSERT_TRUE(tgts.has_value());

    std::vector<uint32_t> sorted = *tgts;
    std::sort(sorted.begin(), sorted.end());
    for (uint32_t i = 0; i < 16; ++i) {
        EXPECT_EQ(sorted[i], i * INSN_BYTES);
    }
}

TEST(PickTargets, ZeroCountIsEmpty) {
    RandomSource rng(0);
    auto tgts = pick_targets({}, 1, 0, rng);
    ASSERT_TRUE(tgts.has_value());
    EXPECT_TRUE(tgts->empty());
}
