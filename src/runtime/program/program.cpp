/**
 * @file program.cpp
 * @brief Program layout implementation.
 */

#include "progspace/program.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace progspace {

Program::Program(const Config& config)
    : config_(config)
    , sections_()
    , cur_section_()
    , stats_()
{
    if (config_.imem_size == 0) {
        throw std::invalid_argument("Program: imem_size must be > 0");
    }
    if (config_.imem_size % INSN_BYTES != 0) {
        std::ostringstream oss;
        oss << "Program: imem_size 0x" << std::hex << config_.imem_size
            << " is not a multiple of " << std::dec << INSN_BYTES;
        throw std::invalid_argument(oss.str());
    }
}

size_t Program::check_section_start(uint32_t addr) const {
    if (addr % INSN_BYTES != 0) {
        std::ostringstream oss;
        oss << "Program: section address 0x" << std::hex << addr << " is misaligned";
        throw std::invalid_argument(oss.str());
    }
    if (addr > config_.imem_size) {
        std::ostringstream oss;
        oss << "Program: section address 0x" << std::hex << addr
            << " is above IMEM (size 0x" << config_.imem_size << ")";
        throw std::out_of_range(oss.str());
    }

    // A non-empty open section counts as if it were already committed,
    // since opening a new one closes it first.
    uint32_t next_above = config_.imem_size;
    std::optional<uint32_t> prev_base;
    uint32_t prev_end = 0;

    auto above = sections_.lower_bound(addr);
    if (above != sections_.end()) {
        next_above = above->first;
    }
    if (above != sections_.begin()) {
        auto prev = std::prev(above);
        prev_base = prev->first;
        prev_end = prev->second.end();
    }

    // An empty open section is dropped on close, so it blocks nothing
    if (cur_section_ && !cur_section_->second.insns().empty()) {
        const uint32_t cur_base = cur_section_->first;
        if (cur_base >= addr) {
            next_above = std::min(next_above, cur_base);
        } else if (!prev_base || *prev_base < cur_base) {
            prev_base = cur_base;
            prev_end = cur_base + INSN_BYTES *
                static_cast<uint32_t>(cur_section_->second.insns().size());
        }
    }

    if (addr >= next_above) {
        std::ostringstream oss;
        oss << "Program: no room for a section at 0x" << std::hex << addr
            << " (next section or top of IMEM at 0x" << next_above << ")";
        throw std::logic_error(oss.str());
    }
    if (prev_base && prev_end > addr) {
        std::ostringstream oss;
        oss << "Program: section address 0x" << std::hex << addr
            << " is inside the section at 0x" << *prev_base
            << " (which ends at 0x" << prev_end << ")";
        throw std::logic_error(oss.str());
    }

    return (next_above - addr) / INSN_BYTES;
}

void Program::open_section(uint32_t addr) {
    const size_t insns_left = check_section_start(addr);

    close_section();
    stats_.sections_opened++;

    // If the previous section ends exactly at addr, carry on from it
    // rather than starting a new one next to it.
    auto above = sections_.lower_bound(addr);
    if (above != sections_.begin()) {
        auto prev = std::prev(above);
        if (prev->second.end() == addr) {
            const uint32_t base = prev->first;
            std::vector<PlacedInsn> insns = std::move(prev->second.insns);
            sections_.erase(prev);
            cur_section_.emplace(base, OpenSection(insns_left, std::move(insns)));
            stats_.merges++;

            if (config_.trace) {
                std::cerr << "[progspace] reopen section 0x" << std::hex << base
                          << " at 0x" << addr << std::dec
                          << " (" << insns_left << " insns left)" << std::endl;
            }
            return;
        }
    }

    cur_section_.emplace(addr, OpenSection(insns_left, {}));

    if (config_.trace) {
        std::cerr << "[progspace] open section 0x" << std::hex << addr << std::dec
                  << " (" << insns_left << " insns left)" << std::endl;
    }
}

void Program::close_section() {
    if (!cur_section_) {
        return;
    }

    const uint32_t base = cur_section_->first;

    if (cur_section_->second.insns().empty()) {
        if (config_.trace) {
            std::cerr << "[progspace] drop empty section 0x" << std::hex << base
                      << std::dec << std::endl;
        }
        cur_section_.reset();
        return;
    }

    // insns_left tracking keeps the section clear of its neighbours; a
    // duplicate base would mean that bookkeeping has gone wrong.
    if (sections_.count(base)) {
        std::ostringstream oss;
        oss << "Program: a section is already committed at 0x" << std::hex << base;
        throw std::logic_error(oss.str());
    }

    std::vector<PlacedInsn> insns = cur_section_->second.take_insns();
    if (config_.trace) {
        std::cerr << "[progspace] close section 0x" << std::hex << base << std::dec
                  << " (" << insns.size() << " insns)" << std::endl;
    }
    sections_.emplace(base, Section(base, std::move(insns)));
    cur_section_.reset();
}

OpenSection* Program::cur_section() {
    return cur_section_ ? &cur_section_->second : nullptr;
}

const OpenSection* Program::cur_section() const {
    return cur_section_ ? &cur_section_->second : nullptr;
}

std::optional<uint32_t> Program::cur_section_base() const {
    if (!cur_section_) {
        return std::nullopt;
    }
    return cur_section_->first;
}

void Program::add_insns(uint32_t addr, const std::vector<PlacedInsn>& insns) {
    const size_t insns_left = check_section_start(addr);
    if (insns.size() > insns_left) {
        std::ostringstream oss;
        oss << "Program: " << insns.size() << " instructions at 0x" << std::hex << addr
            << std::dec << " would overrun the space there (" << insns_left << " left)";
        throw std::logic_error(oss.str());
    }

    open_section(addr);
    cur_section_->second.add_insns(insns);
    stats_.insns_added += insns.size();
}

void Program::append_insns(const std::vector<PlacedInsn>& insns) {
    if (!cur_section_) {
        throw std::logic_error("Program: no section is open to append to");
    }
    cur_section_->second.add_insns(insns);
    stats_.insns_added += insns.size();
}

uint32_t Program::get_insn_space_at(uint32_t addr) const {
    int64_t space = int64_t(config_.imem_size) - addr;
    if (space <= 0) {
        return 0;
    }

    for (const auto& range : occupied_ranges()) {
        const int64_t end = int64_t(range.base) + int64_t(INSN_BYTES) * range.insns;
        if (addr < end) {
            space = std::min<int64_t>(space, int64_t(range.base) - addr);
            if (space <= 0) {
                return 0;
            }
        }
    }

    return static_cast<uint32_t>(space / INSN_BYTES);
}

std::vector<OccupiedRange> Program::occupied_ranges() const {
    std::vector<OccupiedRange> ranges;
    ranges.reserve(sections_.size() + 1);

    for (const auto& entry : sections_) {
        ranges.push_back(OccupiedRange{entry.first,
                                       static_cast<uint32_t>(entry.second.insns.size())});
    }

    // Count the open section by what it holds, not by its capacity. An
    // empty one holds nothing and would be dropped on close.
    if (cur_section_ && !cur_section_->second.insns().empty()) {
        OccupiedRange cur{cur_section_->first,
                          static_cast<uint32_t>(cur_section_->second.insns().size())};
        auto pos = std::lower_bound(ranges.begin(), ranges.end(), cur,
                                    [](const OccupiedRange& a, const OccupiedRange& b) {
                                        return a.base < b.base;
                                    });
        ranges.insert(pos, cur);
    }

    return ranges;
}

std::optional<std::vector<uint32_t>> Program::pick_branch_targets(
    RandomSource& rng,
    uint32_t min_len,
    uint32_t count,
    std::optional<uint32_t> tgt_min,
    std::optional<uint32_t> tgt_max) {
    if (min_len == 0) {
        throw std::invalid_argument("Program: min_len must be > 0");
    }
    if (count == 0) {
        return std::vector<uint32_t>{};
    }

    std::vector<Gap> gaps = build_gaps(occupied_ranges(), config_.imem_size,
                                       min_len, tgt_min, tgt_max);
    auto targets = pick_targets(std::move(gaps), min_len, count, rng);

    if (!targets) {
        stats_.pick_failures++;
        if (config_.trace) {
            std::cerr << "[progspace] no room for " << count << " targets of "
                      << min_len << " insns" << std::endl;
        }
        return std::nullopt;
    }

    stats_.targets_picked += targets->size();
    if (config_.trace) {
        std::cerr << "[progspace] picked targets" << std::hex;
        for (uint32_t tgt : *targets) {
            std::cerr << " 0x" << tgt;
        }
        std::cerr << std::dec << std::endl;
    }
    return targets;
}

std::optional<uint32_t> Program::pick_branch_target(
    RandomSource& rng,
    uint32_t min_len,
    std::optional<uint32_t> tgt_min,
    std::optional<uint32_t> tgt_max) {
    auto targets = pick_branch_targets(rng, min_len, 1, tgt_min, tgt_max);
    if (!targets) {
        return std::nullopt;
    }
    return targets->front();
}

void Program::dump_asm(std::ostream& os) {
    // Close the current section so that everything is in sections_
    close_section();

    size_t idx = 0;
    for (const auto& entry : sections_) {
        const Section& section = entry.second;
        os << (idx ? "\n" : "")
           << "/* Section " << idx << " (" << section.insns.size() << " instructions) */\n";
        os << ".offset 0x" << std::hex << section.base << std::dec << "\n";
        for (const auto& insn : section.insns) {
            os << insn.to_asm() << "\n";
        }
        ++idx;
    }
}

const std::map<uint32_t, Section>& Program::finalize() {
    close_section();
    return sections_;
}

}  // namespace progspace
