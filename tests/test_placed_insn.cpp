/**
 * @file test_placed_insn.cpp
 * @brief Unit tests for instruction descriptors and placed instructions.
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "progspace/constants.hpp"
#include "progspace/insn_descriptor.hpp"
#include "progspace/placed_insn.hpp"
#include "test_insns.hpp"

using namespace progspace;
using progspace_test::make_catalog;

class PlacedInsnTest : public ::testing::Test {
protected:
    InsnCatalog catalog = make_catalog();
};

// =============================================================================
// Descriptors
// =============================================================================

TEST(InsnDescriptorTest, RendersRegistersAndImmediates) {
    InsnDescriptor addi("addi",
                        {OperandSpec("grd", "x"), OperandSpec("grs1", "x"), OperandSpec("imm")},
                        "<grd>, <grs1>, <imm>");

    EXPECT_EQ(addi.operand_count(), 3u);
    EXPECT_FALSE(addi.is_lsu());
    EXPECT_EQ(addi.render_vals({{"grd", 3}, {"grs1", 0}, {"imm", 0xff}}), "x3, x0, 255");
}

TEST(InsnDescriptorTest, SyntaxMayReorderOperands) {
    InsnDescriptor sw("sw",
                      {OperandSpec("grs2", "x"), OperandSpec("offset"), OperandSpec("grs1", "x")},
                      "<grs2>, <offset>(<grs1>)", false, LsuKind::Store);

    EXPECT_TRUE(sw.is_lsu());
    EXPECT_EQ(sw.lsu(), LsuKind::Store);
    EXPECT_EQ(sw.render_vals({{"grs1", 2}, {"grs2", 9}, {"offset", 16}}), "x9, 16(x2)");
}

TEST(InsnDescriptorTest, RejectsBadDefinitions) {
    EXPECT_THROW(InsnDescriptor("", {}, ""), std::invalid_argument);
    EXPECT_THROW(InsnDescriptor("add", {OperandSpec("a"), OperandSpec("a")}, "<a>"),
                 std::invalid_argument);
    EXPECT_THROW(InsnDescriptor("add", {OperandSpec("a")}, "<a>, <b>"),
                 std::invalid_argument);
    EXPECT_THROW(InsnDescriptor("add", {OperandSpec("a")}, "<a"), std::invalid_argument);
}

TEST(InsnDescriptorTest, MissingValueThrows) {
    InsnDescriptor jal("jal", {OperandSpec("grd", "x"), OperandSpec("offset")},
                       "<grd>, <offset>");
    EXPECT_THROW(jal.render_vals({{"grd", 1}}), std::invalid_argument);
}

TEST(InsnCatalogTest, LookupAndDuplicates) {
    InsnCatalog catalog = make_catalog();

    EXPECT_TRUE(catalog.contains("lw"));
    EXPECT_FALSE(catalog.contains("mul"));
    EXPECT_EQ(catalog.lookup("lw")->mnemonic(), "lw");
    EXPECT_THROW(catalog.lookup("mul"), std::invalid_argument);

    const size_t before = catalog.size();
    EXPECT_THROW(catalog.add(InsnDescriptor("lw", {}, "")), std::invalid_argument);
    EXPECT_EQ(catalog.size(), before);
}

// =============================================================================
// Construction checks
// =============================================================================

TEST_F(PlacedInsnTest, OperandCountMustMatch) {
    auto addi = catalog.lookup("addi");
    EXPECT_THROW(PlacedInsn(addi, {1, 2}), std::invalid_argument);
    EXPECT_THROW(PlacedInsn(addi, {1, 2, 3, 4}), std::invalid_argument);
    EXPECT_NO_THROW(PlacedInsn(addi, {1, 2, 3}));
}

TEST_F(PlacedInsnTest, MemAccessIffLsu) {
    auto addi = catalog.lookup("addi");
    auto lw = catalog.lookup("lw");

    EXPECT_THROW(PlacedInsn(lw, {1, 0, 2}), std::invalid_argument);
    EXPECT_THROW(PlacedInsn(addi, {1, 2, 3}, MemAccess("dmem", 0)), std::invalid_argument);

    PlacedInsn load(lw, {1, 0, 2}, MemAccess("dmem", 0x40));
    ASSERT_TRUE(load.mem_access().has_value());
    EXPECT_EQ(load.mem_access()->mem_type, "dmem");
    EXPECT_EQ(load.mem_access()->addr, 0x40u);
}

TEST_F(PlacedInsnTest, NullDescriptorThrows) {
    EXPECT_THROW(PlacedInsn(nullptr, {}), std::invalid_argument);
}

// =============================================================================
// Assembly lines
// =============================================================================

TEST_F(PlacedInsnTest, MnemonicPaddedToColumn) {
    PlacedInsn insn(catalog.lookup("addi"), {1, 2, 3});
    EXPECT_EQ(insn.to_asm(), "addi          x1, x2, 3");
    EXPECT_EQ(insn.to_asm().find('x'), MNEMONIC_COLUMN);
}

TEST_F(PlacedInsnTest, NoOperands) {
    PlacedInsn insn(catalog.lookup("ecall"), {});
    EXPECT_EQ(insn.to_asm(), "ecall" + std::string(MNEMONIC_COLUMN - 5, ' '));
}

TEST_F(PlacedInsnTest, GluedOperandJoinsMnemonic) {
    PlacedInsn insn(catalog.lookup("bn.lid"), {3, 32, 1}, MemAccess("dmem", 32));
    EXPECT_EQ(insn.to_asm(), "bn.lid+       x3, 32(x1)");
}

TEST_F(PlacedInsnTest, LongMnemonicIsNotTruncated) {
    InsnDescriptor desc("bn.mulqacc.wo.z", {OperandSpec("wrd", "w")}, "<wrd>");
    PlacedInsn insn(std::make_shared<const InsnDescriptor>(desc), {7});
    EXPECT_EQ(insn.to_asm(), "bn.mulqacc.wo.zw7");
}

// =============================================================================
// Portable form
// =============================================================================

TEST_F(PlacedInsnTest, PortableFormHoldsMnemonicAndOperands) {
    PlacedInsn insn(catalog.lookup("sw"), {4, 0xffc, 2}, MemAccess("dmem", 0x100));
    PortableInsn portable = insn.to_portable();

    EXPECT_EQ(portable.mnemonic, "sw");
    EXPECT_EQ(portable.operands, (std::vector<uint32_t>{4, 0xffc, 2}));
}

TEST_F(PlacedInsnTest, PortableFormRendersTheSame) {
    const std::vector<PlacedInsn> insns = {
        PlacedInsn(catalog.lookup("addi"), {1, 2, 0xfff}),
        PlacedInsn(catalog.lookup("lw"), {5, 8, 6}, MemAccess("dmem", 0x108)),
        PlacedInsn(catalog.lookup("bn.lid"), {3, 32, 1}, MemAccess("dmem", 32)),
        PlacedInsn(catalog.lookup("ecall"), {}),
    };

    // A separately built catalog stands in for another process
    InsnCatalog other = make_catalog();
    for (const auto& insn : insns) {
        PlacedInsn rebuilt = PlacedInsn::from_portable(insn.to_portable(), other,
                                                       insn.mem_access());
        EXPECT_EQ(rebuilt.to_asm(), insn.to_asm());
        EXPECT_EQ(rebuilt.to_portable(), insn.to_portable());
    }
}

TEST_F(PlacedInsnTest, PortableFormWithUnknownMnemonicThrows) {
    PortableInsn portable{"mul", {1, 2, 3}};
    EXPECT_THROW(PlacedInsn::from_portable(portable, catalog), std::invalid_argument);
}
