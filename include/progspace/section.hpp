/**
 * @file section.hpp
 * @brief Contiguous runs of placed instructions.
 *
 * A Section is a committed block of program memory. An OpenSection is
 * the block currently being appended to; it knows how many more
 * instructions fit before it would run into the next section (or the
 * top of IMEM).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "progspace/constants.hpp"
#include "progspace/placed_insn.hpp"

namespace progspace {

/**
 * @struct Section
 * @brief Committed instructions occupying [base, base + 4 * insns.size()).
 */
struct Section {
    uint32_t base;                  ///< Base address (VMA), 4-byte aligned
    std::vector<PlacedInsn> insns;  ///< Instructions in address order

    Section(uint32_t b, std::vector<PlacedInsn> i) : base(b), insns(std::move(i)) {}

    /// One past the last occupied byte
    uint32_t end() const noexcept {
        return base + INSN_BYTES * static_cast<uint32_t>(insns.size());
    }
};

/**
 * @class OpenSection
 * @brief A section that instructions are currently being added to.
 */
class OpenSection {
public:
    /**
     * @param insns_left Number of instructions that can still be added.
     * @param insns Initial content (a merged predecessor, or empty).
     * @throws std::invalid_argument if insns_left is 0.
     */
    OpenSection(size_t insns_left, std::vector<PlacedInsn> insns);

    /**
     * @brief Append instructions to the section.
     * @throws std::logic_error if there is no room for all of them. The
     *         section is unchanged in that case.
     */
    void add_insns(const std::vector<PlacedInsn>& insns);

    size_t insns_left() const noexcept { return insns_left_; }
    const std::vector<PlacedInsn>& insns() const noexcept { return insns_; }

    /// Hand the instruction list over when the section is committed
    std::vector<PlacedInsn> take_insns() { return std::move(insns_); }

private:
    size_t insns_left_;
    std::vector<PlacedInsn> insns_;
};

}  // namespace progspace
