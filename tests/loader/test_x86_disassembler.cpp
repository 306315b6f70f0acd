/**
 * @file test_x86_disassembler.cpp
 * @brief Decoding and classification of x86-64 call/jump forms
 */

#include "loader/x86_disassembler.hpp"

#include <memory>
#include <cstdint>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace panicscan::loader::test {

using callgraph::Instruction;
using callgraph::OperandKind;

class X86DisassemblerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto engine = X86Disassembler::create();
        ASSERT_TRUE(engine) << engine.error().message;
        m_engine = std::make_unique<X86Disassembler>(std::move(*engine));
    }

    std::vector<Instruction> decode(std::vector<std::uint8_t> bytes, callgraph::Address at = 0x1000)
    {
        return m_engine->disassemble(bytes, at);
    }

    std::unique_ptr<X86Disassembler> m_engine;
};

TEST_F(X86DisassemblerTest, RelativeCall)
{
    // call 0x2000
    const auto code = decode({0xE8, 0xFB, 0x0F, 0x00, 0x00});
    ASSERT_EQ(code.size(), 1U);
    EXPECT_EQ(code[0].mnemonic, "call");
    EXPECT_EQ(code[0].size, 5U);
    ASSERT_TRUE(code[0].branch_target);
    EXPECT_EQ(*code[0].branch_target, 0x2000U);
    EXPECT_TRUE(m_engine->classifier().is_call(code[0]));
    EXPECT_FALSE(m_engine->classifier().is_jump(code[0]));
}

TEST_F(X86DisassemblerTest, RipRelativeJump)
{
    // jmp qword ptr [rip + 0x3ffa]
    const auto code = decode({0xFF, 0x25, 0xFA, 0x3F, 0x00, 0x00});
    ASSERT_EQ(code.size(), 1U);
    EXPECT_EQ(code[0].mnemonic, "jmp");
    EXPECT_FALSE(code[0].branch_target);
    ASSERT_TRUE(code[0].rip_relative_target());
    EXPECT_EQ(*code[0].rip_relative_target(), 0x1006U + 0x3ffaU);
    EXPECT_TRUE(m_engine->classifier().is_jump(code[0]));
    EXPECT_FALSE(m_engine->classifier().is_call(code[0]));
}

TEST_F(X86DisassemblerTest, LeaAndLoad)
{
    // lea rax, [rip + 0x10]; mov rax, qword ptr [rdi + 0x18]
    const auto code = decode({0x48, 0x8D, 0x05, 0x10, 0x00, 0x00, 0x00, 0x48, 0x8B, 0x47, 0x18});
    ASSERT_EQ(code.size(), 2U);

    EXPECT_EQ(code[0].mnemonic, "lea");
    ASSERT_EQ(code[0].operands.size(), 2U);
    EXPECT_EQ(code[0].operands[0].kind, OperandKind::kRegister);
    EXPECT_EQ(code[0].operands[0].reg, "rax");
    EXPECT_EQ(*code[0].rip_relative_target(), 0x1007U + 0x10U);

    EXPECT_EQ(code[1].mnemonic, "mov");
    EXPECT_EQ(code[1].address, 0x1007U);
    const auto* mem = code[1].memory_operand();
    ASSERT_NE(mem, nullptr);
    EXPECT_EQ(mem->base, "rdi");
    EXPECT_TRUE(mem->index.empty());
    EXPECT_EQ(mem->displacement, 0x18);
}

TEST_F(X86DisassemblerTest, IndirectCalls)
{
    // call rax; call qword ptr [rax + 0x18]; ret
    const auto code = decode({0xFF, 0xD0, 0xFF, 0x50, 0x18, 0xC3});
    ASSERT_EQ(code.size(), 3U);

    EXPECT_TRUE(m_engine->classifier().is_call(code[0]));
    ASSERT_EQ(code[0].operands.size(), 1U);
    EXPECT_EQ(code[0].operands[0].reg, "rax");

    EXPECT_TRUE(m_engine->classifier().is_call(code[1]));
    ASSERT_NE(code[1].memory_operand(), nullptr);
    EXPECT_EQ(code[1].memory_operand()->base, "rax");
    EXPECT_EQ(code[1].memory_operand()->displacement, 0x18);

    EXPECT_EQ(code[2].mnemonic, "ret");
    EXPECT_FALSE(m_engine->classifier().is_call(code[2]));
    EXPECT_FALSE(m_engine->classifier().is_jump(code[2]));
}

TEST_F(X86DisassemblerTest, ConditionalJump)
{
    // jne -0x2 (to itself)
    const auto code = decode({0x75, 0xFE});
    ASSERT_EQ(code.size(), 1U);
    EXPECT_TRUE(m_engine->classifier().is_jump(code[0]));
    EXPECT_EQ(code[0].branch_target, 0x1000U);
}

TEST_F(X86DisassemblerTest, UndecodableBytesSkipped)
{
    // 0x06 is invalid in 64-bit mode
    const auto code = decode({0x06, 0xC3});
    ASSERT_EQ(code.size(), 1U);
    EXPECT_EQ(code[0].address, 0x1001U);
    EXPECT_EQ(code[0].mnemonic, "ret");
}

}  // namespace panicscan::loader::test
