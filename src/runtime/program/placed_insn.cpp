/**
 * @file placed_insn.cpp
 * @brief Placed instruction implementation.
 */

#include "progspace/placed_insn.hpp"
#include "progspace/constants.hpp"

#include <sstream>
#include <stdexcept>

namespace progspace {

PlacedInsn::PlacedInsn(std::shared_ptr<const InsnDescriptor> insn,
                       std::vector<uint32_t> operands,
                       std::optional<MemAccess> mem_access)
    : insn_(std::move(insn))
    , operands_(std::move(operands))
    , mem_access_(std::move(mem_access))
{
    if (!insn_) {
        throw std::invalid_argument("PlacedInsn: descriptor cannot be null");
    }
    if (operands_.size() != insn_->operand_count()) {
        std::ostringstream oss;
        oss << "PlacedInsn: " << insn_->mnemonic() << " takes "
            << insn_->operand_count() << " operands, got " << operands_.size();
        throw std::invalid_argument(oss.str());
    }
    if (mem_access_.has_value() != insn_->is_lsu()) {
        throw std::invalid_argument(
            "PlacedInsn: " + insn_->mnemonic() +
            (insn_->is_lsu() ? " is an LSU insn but has no memory access"
                             : " is not an LSU insn but has a memory access"));
    }
}

PlacedInsn PlacedInsn::from_portable(const PortableInsn& portable,
                                     const InsnCatalog& catalog,
                                     std::optional<MemAccess> mem_access) {
    return PlacedInsn(catalog.lookup(portable.mnemonic), portable.operands,
                      std::move(mem_access));
}

PortableInsn PlacedInsn::to_portable() const {
    return PortableInsn{insn_->mnemonic(), operands_};
}

OperandVals PlacedInsn::operand_vals() const {
    OperandVals vals;
    const auto& specs = insn_->operands();
    for (size_t i = 0; i < specs.size(); ++i) {
        vals[specs[i].name] = operands_[i];
    }
    return vals;
}

std::string PlacedInsn::to_asm() const {
    std::string rendered = insn_->render_vals(operand_vals());
    std::string mnem = insn_->mnemonic();

    if (insn_->glued_ops() && !rendered.empty()) {
        mnem += rendered[0];
        rendered.erase(0, 1);
    }

    if (mnem.size() < MNEMONIC_COLUMN) {
        mnem.append(MNEMONIC_COLUMN - mnem.size(), ' ');
    }
    return mnem + rendered;
}

}  // namespace progspace
