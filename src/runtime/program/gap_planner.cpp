/**
 * @file gap_planner.cpp
 * @brief Gap construction and branch-target picking.
 */

#include "progspace/gap_planner.hpp"
#include "progspace/constants.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace progspace {

namespace {

int64_t align_up(int64_t addr) {
    return (addr + INSN_BYTES - 1) / INSN_BYTES * INSN_BYTES;
}

}  // namespace

std::vector<Gap> build_gaps(const std::vector<OccupiedRange>& ranges,
                            uint32_t imem_size,
                            uint32_t min_len,
                            std::optional<uint32_t> tgt_min,
                            std::optional<uint32_t> tgt_max) {
    const int64_t seq_bytes = int64_t(INSN_BYTES) * min_len;
    std::vector<Gap> gaps;

    // Start of the free space below the next section
    int64_t gap_vma = 0;

    auto add_gap = [&](int64_t top) {
        // Lowest usable start: the gap start, bumped up to tgt_min
        int64_t gap_lo = gap_vma;
        if (tgt_min) {
            gap_lo = align_up(std::max<int64_t>(gap_lo, *tgt_min));
        }

        // Highest usable start: room for min_len insns before top, and
        // at most tgt_max
        int64_t gap_hi = top - seq_bytes;
        if (tgt_max) {
            gap_hi = std::min<int64_t>(gap_hi, *tgt_max);
        }
        if (gap_hi < gap_lo) {
            return;
        }
        gap_hi -= gap_hi % INSN_BYTES;

        if (gap_lo <= gap_hi) {
            gaps.push_back(Gap{static_cast<uint32_t>(gap_lo),
                               static_cast<uint32_t>(gap_hi - gap_lo + seq_bytes)});
        }
    };

    for (const auto& range : ranges) {
        if (range.base < gap_vma) {
            std::ostringstream oss;
            oss << "build_gaps: range at 0x" << std::hex << range.base
                << " starts below the end of the previous one (0x" << gap_vma << ")";
            throw std::invalid_argument(oss.str());
        }

        // Skip the gap if it's completely below tgt_min or above tgt_max.
        // Strict on the low side, inclusive on the high side.
        if ((!tgt_min || *tgt_min < range.base) &&
            (!tgt_max || gap_vma <= *tgt_max)) {
            add_gap(range.base);
        }

        gap_vma = int64_t(range.base) + int64_t(INSN_BYTES) * range.insns;
    }

    // Space above everything
    add_gap(imem_size);

    return gaps;
}

uint32_t pick_in_gap(const Gap& gap, uint32_t min_len, RandomSource& rng) {
    const uint64_t max_insn_off = gap.len / INSN_BYTES - min_len;

    const std::array<std::pair<uint64_t, uint64_t>, 3> bands = {{
        {0, max_insn_off / 10},
        {max_insn_off / 10, max_insn_off * 9 / 10},
        {max_insn_off * 9 / 10, max_insn_off},
    }};
    const std::vector<double> band_weights = {
        EDGE_BIAS / 2, 1.0 - EDGE_BIAS, EDGE_BIAS / 2
    };

    const auto& band = bands[rng.choice(band_weights)];
    const uint64_t band_len = band.second - band.first;
    const uint64_t insn_off =
        band.first + static_cast<uint64_t>(0.5 + rng.random() * static_cast<double>(band_len));

    return gap.lo + static_cast<uint32_t>(INSN_BYTES * insn_off);
}

void reserve_target(std::vector<Gap>& gaps, uint32_t tgt, uint32_t min_len) {
    const int64_t seq_bytes = int64_t(INSN_BYTES) * min_len;
    std::vector<Gap> remaining;
    remaining.reserve(gaps.size() + 1);

    for (const auto& gap : gaps) {
        const int64_t gap_lo = gap.lo;
        const int64_t gap_top = gap_lo + gap.len;

        // Piece to the left of the reserved sequence
        const int64_t left_top = std::min<int64_t>(gap_top, tgt);
        if (left_top - gap_lo >= seq_bytes) {
            remaining.push_back(Gap{gap.lo, static_cast<uint32_t>(left_top - gap_lo)});
        }

        // And to the right
        const int64_t right_lo = std::max<int64_t>(gap_lo, int64_t(tgt) + seq_bytes);
        if (gap_top - right_lo >= seq_bytes) {
            remaining.push_back(Gap{static_cast<uint32_t>(right_lo),
                                    static_cast<uint32_t>(gap_top - right_lo)});
        }
    }

    gaps = std::move(remaining);
}

std::optional<std::vector<uint32_t>> pick_targets(std::vector<Gap> gaps,
                                                  uint32_t min_len,
                                                  uint32_t count,
                                                  RandomSource& rng) {
    const double seq_bytes = double(INSN_BYTES) * min_len;
    std::vector<uint32_t> targets;
    targets.reserve(count);

    std::vector<double> weights;
    for (uint32_t i = 0; i < count; ++i) {
        if (gaps.empty()) {
            return std::nullopt;
        }

        // Favour gaps with slack beyond the minimum sequence
        weights.clear();
        for (const auto& gap : gaps) {
            const double extra = double(gap.len) - seq_bytes;
            weights.push_back(1.0 + std::pow(extra, GAP_WEIGHT_POW));
        }

        const Gap gap = gaps[rng.choice(weights)];
        const uint32_t tgt = pick_in_gap(gap, min_len, rng);
        targets.push_back(tgt);

        reserve_target(gaps, tgt, min_len);
    }

    return targets;
}

}  // namespace progspace
