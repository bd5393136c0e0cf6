/**
 * @file constants.hpp
 * @brief Global constants for program layout.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace progspace {

/// Size of one encoded instruction in bytes
constexpr uint32_t INSN_BYTES = 4;

/// Default IMEM size in bytes (1024 instructions)
constexpr uint32_t DEFAULT_IMEM_BYTES = 4096;

/// Exponent applied to a gap's slack when weighting gap selection
constexpr double GAP_WEIGHT_POW = 2.0;

/// Probability mass given to the two edge bands of a gap (split evenly)
constexpr double EDGE_BIAS = 0.5;

/// Width of the mnemonic column in assembly output
constexpr size_t MNEMONIC_COLUMN = 14;

}  // namespace progspace
