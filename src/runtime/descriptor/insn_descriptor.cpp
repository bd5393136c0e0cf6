/**
 * @file insn_descriptor.cpp
 * @brief Instruction descriptor and catalog implementation.
 */

#include "progspace/insn_descriptor.hpp"

#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace progspace {

InsnDescriptor::InsnDescriptor(std::string mnemonic,
                               std::vector<OperandSpec> operands,
                               std::string syntax,
                               bool glued_ops,
                               std::optional<LsuKind> lsu)
    : mnemonic_(std::move(mnemonic))
    , operands_(std::move(operands))
    , syntax_(std::move(syntax))
    , glued_ops_(glued_ops)
    , lsu_(lsu)
{
    if (mnemonic_.empty()) {
        throw std::invalid_argument("InsnDescriptor: mnemonic cannot be empty");
    }

    std::unordered_set<std::string> names;
    for (const auto& op : operands_) {
        if (!names.insert(op.name).second) {
            throw std::invalid_argument("InsnDescriptor: duplicate operand '" +
                                        op.name + "' in " + mnemonic_);
        }
    }

    // Split the template into literals and <name> references
    size_t pos = 0;
    while (pos < syntax_.size()) {
        size_t open = syntax_.find('<', pos);
        if (open == std::string::npos) {
            parts_.push_back({false, syntax_.substr(pos)});
            break;
        }
        size_t close = syntax_.find('>', open);
        if (close == std::string::npos) {
            throw std::invalid_argument("InsnDescriptor: unterminated operand in syntax of " +
                                        mnemonic_);
        }
        if (open > pos) {
            parts_.push_back({false, syntax_.substr(pos, open - pos)});
        }
        std::string name = syntax_.substr(open + 1, close - open - 1);
        if (!names.count(name)) {
            std::ostringstream oss;
            oss << "InsnDescriptor: syntax of " << mnemonic_
                << " references unknown operand '" << name << "'";
            throw std::invalid_argument(oss.str());
        }
        parts_.push_back({true, std::move(name)});
        pos = close + 1;
    }
}

const OperandSpec* InsnDescriptor::operand(const std::string& name) const {
    for (const auto& op : operands_) {
        if (op.name == name) {
            return &op;
        }
    }
    return nullptr;
}

std::string InsnDescriptor::render_vals(const OperandVals& vals) const {
    std::string out;
    for (const auto& part : parts_) {
        if (!part.is_operand) {
            out += part.text;
            continue;
        }

        auto it = vals.find(part.text);
        if (it == vals.end()) {
            throw std::invalid_argument("InsnDescriptor: no value for operand '" +
                                        part.text + "' of " + mnemonic_);
        }

        // Registers render as prefix + index, immediates as unsigned decimal
        const OperandSpec* spec = operand(part.text);
        if (spec->is_register()) {
            out += spec->reg_prefix;
        }
        out += std::to_string(it->second);
    }
    return out;
}

std::shared_ptr<const InsnDescriptor> InsnCatalog::add(InsnDescriptor desc) {
    if (by_mnemonic_.count(desc.mnemonic())) {
        throw std::invalid_argument("InsnCatalog: mnemonic '" + desc.mnemonic() +
                                    "' already registered");
    }
    auto shared = std::make_shared<const InsnDescriptor>(std::move(desc));
    by_mnemonic_.emplace(shared->mnemonic(), shared);
    return shared;
}

std::shared_ptr<const InsnDescriptor> InsnCatalog::lookup(const std::string& mnemonic) const {
    auto it = by_mnemonic_.find(mnemonic);
    if (it == by_mnemonic_.end()) {
        throw std::invalid_argument("InsnCatalog: unknown mnemonic '" + mnemonic + "'");
    }
    return it->second;
}

bool InsnCatalog::contains(const std::string& mnemonic) const {
    return by_mnemonic_.count(mnemonic) != 0;
}

}  // namespace progspace
