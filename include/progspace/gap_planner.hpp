/**
 * @file gap_planner.hpp
 * @brief Free-gap construction and weighted branch-target picking.
 *
 * Picking a target happens in two steps. First, the occupied ranges
 * (committed sections plus the open one) are turned into a list of
 * gaps, each clipped to the caller's target window and shortened so a
 * sequence of min_len instructions fits before the next section. Then,
 * for each requested target:
 *
 *   1. choose a gap, weighted by 1 + slack^GAP_WEIGHT_POW
 *   2. choose a band of the gap:
 *
 *        | low |     middle      | high |
 *
 *      where low and high are each 10% of the offset range and get
 *      EDGE_BIAS / 2 of the weight each (edges are favoured so gaps are
 *      not split up more than necessary)
 *   3. choose an instruction offset uniformly in the band
 *
 * and carve the picked sequence out of the gap list so the next pick
 * can't land on top of it.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "progspace/random_source.hpp"

namespace progspace {

/**
 * @struct OccupiedRange
 * @brief A section's occupied byte range [base, base + 4 * insns).
 */
struct OccupiedRange {
    uint32_t base;   ///< Base address
    uint32_t insns;  ///< Number of instructions placed there
};

/**
 * @struct Gap
 * @brief Free bytes [lo, lo + len) where a branch target sequence may go.
 *
 * A gap always has room for at least min_len instructions, so the valid
 * target addresses are lo, lo + 4, ..., lo + len - 4 * min_len.
 */
struct Gap {
    uint32_t lo;   ///< First byte (4-byte aligned)
    uint32_t len;  ///< Length in bytes (multiple of 4)

    bool operator==(const Gap& other) const { return lo == other.lo && len == other.len; }
};

/**
 * @brief Build the list of candidate gaps.
 *
 * A gap below a section is only considered if tgt_min lies strictly
 * below the section's base and the gap starts at or below tgt_max.
 * The gap above the last section is always considered.
 *
 * @param ranges Occupied ranges, sorted by base and non-overlapping.
 * @param imem_size IMEM size in bytes.
 * @param min_len Minimum number of instructions at each target (> 0).
 * @param tgt_min Lowest allowed target, if any.
 * @param tgt_max Highest allowed target, if any.
 * @return Gaps in ascending address order.
 * @throws std::invalid_argument if ranges are unsorted or overlap.
 */
std::vector<Gap> build_gaps(const std::vector<OccupiedRange>& ranges,
                            uint32_t imem_size,
                            uint32_t min_len,
                            std::optional<uint32_t> tgt_min,
                            std::optional<uint32_t> tgt_max);

/**
 * @brief Choose a target inside one gap, biased towards its edges.
 *
 * Consumes two draws (band, then offset).
 */
uint32_t pick_in_gap(const Gap& gap, uint32_t min_len, RandomSource& rng);

/**
 * @brief Remove [tgt, tgt + 4 * min_len) from every gap.
 *
 * Gaps may split in two. Pieces too small to hold min_len instructions
 * are dropped.
 */
void reserve_target(std::vector<Gap>& gaps, uint32_t tgt, uint32_t min_len);

/**
 * @brief Pick count targets from a gap list.
 *
 * Consumes three draws per target.
 *
 * @return Targets in pick order, or std::nullopt if the gaps run out.
 */
std::optional<std::vector<uint32_t>> pick_targets(std::vector<Gap> gaps,
                                                  uint32_t min_len,
                                                  uint32_t count,
                                                  RandomSource& rng);

}  // namespace progspace
