/**
 * @file program.hpp
 * @brief Layout of a generated program in instruction memory.
 *
 * The Program tracks which parts of IMEM hold instructions. Callers
 * open a section at an address, append instructions to it, and either
 * close it or open another section elsewhere. It also answers "how much
 * room is there at addr?" and picks random branch targets in free space.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "progspace/constants.hpp"
#include "progspace/gap_planner.hpp"
#include "progspace/placed_insn.hpp"
#include "progspace/random_source.hpp"
#include "progspace/section.hpp"

namespace progspace {

/**
 * @class Program
 * @brief The random program being generated.
 */
class Program {
public:
    /**
     * @struct Config
     * @brief Program configuration parameters.
     */
    struct Config {
        uint32_t imem_size = DEFAULT_IMEM_BYTES;  ///< IMEM size in bytes
        bool     trace = false;                   ///< Trace layout changes to stderr
    };

    /**
     * @struct Stats
     * @brief Layout statistics.
     */
    struct Stats {
        uint64_t sections_opened = 0;  ///< Calls to open_section
        uint64_t merges = 0;           ///< Opens that continued an adjacent section
        uint64_t insns_added = 0;      ///< Instructions appended
        uint64_t targets_picked = 0;   ///< Branch targets returned
        uint64_t pick_failures = 0;    ///< Pick requests that found no space
    };

    /**
     * @brief Construct an empty program.
     * @param config Program configuration.
     * @throws std::invalid_argument if imem_size is not a multiple of 4.
     */
    explicit Program(const Config& config);

    // Non-copyable, movable
    Program(const Program&) = delete;
    Program& operator=(const Program&) = delete;
    Program(Program&&) noexcept = default;
    Program& operator=(Program&&) noexcept = default;

    /**
     * @brief Start a new section at addr, closing any current one.
     *
     * If a section ends exactly at addr, it is reopened and extended
     * instead, so adjacent code ends up in a single section.
     *
     * @throws std::invalid_argument if addr is misaligned.
     * @throws std::out_of_range if addr is above IMEM.
     * @throws std::logic_error if addr lies inside an existing section
     *         or leaves no room before the next one.
     */
    void open_section(uint32_t addr);

    /**
     * @brief Commit the current section, if any.
     *
     * A section that holds no instructions is dropped rather than
     * committed, so its base stays free.
     *
     * @throws std::logic_error if its base is already taken.
     */
    void close_section();

    /**
     * @brief The section currently being added to, or nullptr.
     *
     * Callers may append to it directly once they have checked
     * insns_left(); those appends are not counted in Stats::insns_added.
     */
    OpenSection* cur_section();
    const OpenSection* cur_section() const;

    /// Base address of the current section, if there is one
    std::optional<uint32_t> cur_section_base() const;

    /**
     * @brief Append to the current section.
     * @throws std::logic_error if no section is open or the
     *         instructions don't fit in it.
     */
    void append_insns(const std::vector<PlacedInsn>& insns);

    /**
     * @brief Add a sequence of instructions, starting at addr.
     *
     * Checked up front, so on failure the layout is unchanged.
     *
     * @throws std::logic_error if the instructions don't fit at addr
     *         (plus everything open_section throws).
     */
    void add_insns(uint32_t addr, const std::vector<PlacedInsn>& insns);

    /**
     * @brief How many instructions fit starting at addr.
     *
     * Counts up to the next occupied range (committed or open) or the
     * top of IMEM. Zero if addr is at or above the top or inside a
     * section.
     */
    uint32_t get_insn_space_at(uint32_t addr) const;

    /**
     * @brief Pick count random branch targets.
     *
     * Each target has room for at least min_len instructions, is at least
     * tgt_min and at most tgt_max (if given), and no two targets are
     * closer than min_len instructions. Targets favour places with more
     * room. The layout itself is not changed.
     *
     * @return Targets in pick order, or std::nullopt if there isn't room.
     * @throws std::invalid_argument if min_len is 0.
     */
    std::optional<std::vector<uint32_t>> pick_branch_targets(
        RandomSource& rng,
        uint32_t min_len,
        uint32_t count,
        std::optional<uint32_t> tgt_min = std::nullopt,
        std::optional<uint32_t> tgt_max = std::nullopt);

    /// Single-target wrapper around pick_branch_targets
    std::optional<uint32_t> pick_branch_target(
        RandomSource& rng,
        uint32_t min_len,
        std::optional<uint32_t> tgt_min = std::nullopt,
        std::optional<uint32_t> tgt_max = std::nullopt);

    /**
     * @brief Write an assembly listing of the program.
     *
     * Closes the current section first.
     */
    void dump_asm(std::ostream& os);

    /// Committed sections keyed by base address (excludes the open one)
    const std::map<uint32_t, Section>& sections() const noexcept { return sections_; }

    /// Close the current section and return every section
    const std::map<uint32_t, Section>& finalize();

    uint32_t imem_size() const noexcept { return config_.imem_size; }
    Stats stats() const noexcept { return stats_; }
    void reset_stats() noexcept { stats_ = Stats{}; }

private:
    Config config_;
    std::map<uint32_t, Section> sections_;
    std::optional<std::pair<uint32_t, OpenSection>> cur_section_;
    Stats stats_;

    // Occupied ranges (sections plus the open one) in address order
    std::vector<OccupiedRange> occupied_ranges() const;

    // Validate addr as a section start; returns insns that fit there
    size_t check_section_start(uint32_t addr) const;
};

}  // namespace progspace
