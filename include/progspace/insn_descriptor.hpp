/**
 * @file insn_descriptor.hpp
 * @brief Instruction descriptors and the catalog that owns them.
 *
 * A descriptor is the immutable definition of one instruction: its
 * mnemonic, its operands and how those operands are rendered. The
 * layout code never builds descriptors itself; the generator front end
 * loads them once and hands out shared references.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace progspace {

/// Operand values keyed by operand name
using OperandVals = std::map<std::string, uint32_t>;

/**
 * @brief Memory classification for load/store (LSU) instructions.
 */
enum class LsuKind {
    Load,   ///< Reads from a memory region
    Store   ///< Writes to a memory region
};

/**
 * @struct OperandSpec
 * @brief Name and rendering rule for one instruction operand.
 */
struct OperandSpec {
    std::string name;        ///< Operand name, as referenced by the syntax
    std::string reg_prefix;  ///< Register prefix ("x", "w"); empty for immediates

    OperandSpec(std::string n, std::string prefix = "")
        : name(std::move(n)), reg_prefix(std::move(prefix)) {}

    bool is_register() const noexcept { return !reg_prefix.empty(); }
};

/**
 * @class InsnDescriptor
 * @brief Immutable definition of one instruction.
 *
 * The syntax is a template in which operands appear as `<name>`, e.g.
 * `"<grd>, <offset>(<grs1>)"`. Everything else is copied verbatim.
 */
class InsnDescriptor {
public:
    /**
     * @brief Construct a descriptor.
     * @param mnemonic Instruction mnemonic.
     * @param operands Operands in encoding order.
     * @param syntax Operand syntax template.
     * @param glued_ops If true, the first rendered character is glued to
     *        the mnemonic.
     * @param lsu Load/store classification, if this is an LSU instruction.
     * @throws std::invalid_argument if the mnemonic is empty, an operand
     *         name repeats, or the syntax references an unknown operand.
     */
    InsnDescriptor(std::string mnemonic,
                   std::vector<OperandSpec> operands,
                   std::string syntax,
                   bool glued_ops = false,
                   std::optional<LsuKind> lsu = std::nullopt);

    const std::string& mnemonic() const noexcept { return mnemonic_; }
    const std::vector<OperandSpec>& operands() const noexcept { return operands_; }
    size_t operand_count() const noexcept { return operands_.size(); }
    const std::string& syntax() const noexcept { return syntax_; }
    bool glued_ops() const noexcept { return glued_ops_; }
    std::optional<LsuKind> lsu() const noexcept { return lsu_; }
    bool is_lsu() const noexcept { return lsu_.has_value(); }

    /**
     * @brief Look up an operand by name.
     * @return Pointer to the operand, or nullptr if there is none.
     */
    const OperandSpec* operand(const std::string& name) const;

    /**
     * @brief Render operand values through the syntax template.
     * @param vals Value for every operand, keyed by name.
     * @return The rendered operand string (may be empty).
     * @throws std::invalid_argument if a referenced operand has no value.
     */
    std::string render_vals(const OperandVals& vals) const;

private:
    // Syntax split into literal text and operand references
    struct SyntaxPart {
        bool is_operand;
        std::string text;  // Literal text, or operand name
    };

    std::string mnemonic_;
    std::vector<OperandSpec> operands_;
    std::string syntax_;
    bool glued_ops_;
    std::optional<LsuKind> lsu_;
    std::vector<SyntaxPart> parts_;
};

/**
 * @class InsnCatalog
 * @brief Maps mnemonics to shared descriptors.
 *
 * Used to resolve portable (mnemonic, operands) snapshots back into
 * renderable instructions.
 */
class InsnCatalog {
public:
    InsnCatalog() = default;

    /**
     * @brief Register a descriptor.
     * @return The shared descriptor.
     * @throws std::invalid_argument if the mnemonic is already registered.
     */
    std::shared_ptr<const InsnDescriptor> add(InsnDescriptor desc);

    /**
     * @brief Look up a descriptor by mnemonic.
     * @throws std::invalid_argument if the mnemonic is unknown.
     */
    std::shared_ptr<const InsnDescriptor> lookup(const std::string& mnemonic) const;

    bool contains(const std::string& mnemonic) const;
    size_t size() const noexcept { return by_mnemonic_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const InsnDescriptor>> by_mnemonic_;
};

}  // namespace progspace
