/**
 * @file placed_insn.hpp
 * @brief A single instruction placed in the generated program.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "progspace/insn_descriptor.hpp"

namespace progspace {

/**
 * @struct MemAccess
 * @brief Target of an LSU instruction.
 *
 * Stored explicitly so the generator never has to reconstruct it from
 * register values.
 */
struct MemAccess {
    std::string mem_type;  ///< Memory region kind (e.g. "dmem")
    uint32_t addr;         ///< Byte address accessed

    MemAccess(std::string type, uint32_t a) : mem_type(std::move(type)), addr(a) {}

    bool operator==(const MemAccess& other) const {
        return mem_type == other.mem_type && addr == other.addr;
    }
};

/**
 * @struct PortableInsn
 * @brief Descriptor-free snapshot of a placed instruction.
 *
 * Together with the instruction catalog this is enough to render the
 * instruction again in another process.
 */
struct PortableInsn {
    std::string mnemonic;
    std::vector<uint32_t> operands;

    bool operator==(const PortableInsn& other) const {
        return mnemonic == other.mnemonic && operands == other.operands;
    }
};

/**
 * @class PlacedInsn
 * @brief Immutable instruction with concrete operand values.
 *
 * Register operands hold the register index (x3 is 3). Immediates hold
 * their unsigned bit pattern, so an 8-bit immediate of -1 is 0xff.
 */
class PlacedInsn {
public:
    /**
     * @brief Construct a placed instruction.
     * @param insn Instruction descriptor (must not be null).
     * @param operands One value per descriptor operand, in order.
     * @param mem_access Access target; required iff the insn is an LSU insn.
     * @throws std::invalid_argument on a null descriptor, an operand count
     *         mismatch, or a mem_access presence mismatch.
     */
    PlacedInsn(std::shared_ptr<const InsnDescriptor> insn,
               std::vector<uint32_t> operands,
               std::optional<MemAccess> mem_access = std::nullopt);

    /**
     * @brief Rebuild an instruction from its portable form.
     * @throws std::invalid_argument if the mnemonic is not in the catalog
     *         or the operands don't fit the descriptor.
     */
    static PlacedInsn from_portable(const PortableInsn& portable,
                                    const InsnCatalog& catalog,
                                    std::optional<MemAccess> mem_access = std::nullopt);

    const InsnDescriptor& insn() const noexcept { return *insn_; }
    const std::shared_ptr<const InsnDescriptor>& insn_ptr() const noexcept { return insn_; }
    const std::vector<uint32_t>& operands() const noexcept { return operands_; }
    const std::optional<MemAccess>& mem_access() const noexcept { return mem_access_; }

    /// Snapshot as (mnemonic, operands)
    PortableInsn to_portable() const;

    /// Operand values keyed by the descriptor's operand names
    OperandVals operand_vals() const;

    /**
     * @brief Render one line of assembly (without trailing newline).
     *
     * The mnemonic is padded to MNEMONIC_COLUMN characters. With glued
     * operands the first rendered character joins the mnemonic instead.
     */
    std::string to_asm() const;

private:
    std::shared_ptr<const InsnDescriptor> insn_;
    std::vector<uint32_t> operands_;
    std::optional<MemAccess> mem_access_;
};

}  // namespace progspace
