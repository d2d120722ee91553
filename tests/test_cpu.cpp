#include <gtest/gtest.h>
#include "board.hpp"
#include "cpu.hpp"
#include "arm_encoding.hpp"

using namespace encode;

class CpuTest : public ::testing::Test {
protected:
    Board board;
    RegisterFile regs;
    CPU cpu{board.bus, regs};

    void load(const std::vector<Word>& program, Address addr = 0) {
        board.bus.load_block(addr, program);
        cpu.set_pc(addr);
    }
};

TEST_F(CpuTest, OneInstructionPerStep) {
    load({mov_imm(1, 4), add_imm(2, 1, 1), halt()});

    EXPECT_TRUE(cpu.step());
    EXPECT_EQ(regs.read(1), 4u);
    EXPECT_EQ(cpu.get_pc(), 4u);
    EXPECT_EQ(cpu.get_last_instruction().text, "MOV R1, #0x4");

    EXPECT_TRUE(cpu.step());
    EXPECT_EQ(regs.read(2), 5u);

    EXPECT_FALSE(cpu.step());
    EXPECT_TRUE(cpu.is_halted());
    EXPECT_EQ(cpu.get_cycle_count(), 3u);
    EXPECT_EQ(cpu.get_instruction_count(), 3u);
}

TEST_F(CpuTest, CountdownLoop) {
    load({
        mov_imm(0, 0),
        mov_imm(1, 10),
        dp_reg(AluOp::ADD, 0, 0, 1),
        sub_imm(1, 1, 1, true),
        b_to(0x10, 0x08, Cond::NE),
        halt(),
    });
    cpu.run();
    EXPECT_EQ(regs.read(0), 55u);
    EXPECT_TRUE(regs.get_flags().z);
}

TEST_F(CpuTest, BranchWithLink) {
    load({bl(2), mov_imm(2, 7), halt(), NOP_ENCODING, mov_imm(1, 3),
          dp_reg(AluOp::MOV, REG_PC, 0, REG_LR)});
    cpu.run();
    EXPECT_TRUE(cpu.is_halted());
    EXPECT_EQ(regs.read(REG_LR), 4u);
    EXPECT_EQ(regs.read(1), 3u);
    EXPECT_EQ(regs.read(2), 7u);
}

TEST_F(CpuTest, FailedConditionSkipsEffects) {
    load({mov_imm(1, 1, 0, Cond::EQ), mov_imm(2, 1, 0, Cond::NE), halt()});
    cpu.run();
    EXPECT_EQ(regs.read(1), 0u);
    EXPECT_EQ(regs.read(2), 1u);
}

TEST_F(CpuTest, ProgramRamEntryPoint) {
    load({dp_imm(AluOp::ADD, 0, REG_PC, 0), halt()}, MemoryBus::PROGRAM_RAM_BASE);
    cpu.run();
    EXPECT_EQ(regs.read(0), MemoryBus::PROGRAM_RAM_BASE + 8);
    EXPECT_EQ(cpu.get_pc(), MemoryBus::PROGRAM_RAM_BASE + 4);
}

TEST_F(CpuTest, Breakpoints) {
    load({NOP_ENCODING, NOP_ENCODING, halt()});
    cpu.add_breakpoint(0x4);
    EXPECT_EQ(cpu.get_breakpoints().size(), 1u);

    EXPECT_EQ(cpu.run(), 1u);
    EXPECT_EQ(cpu.get_pc(), 0x4u);

    cpu.clear_breakpoints();
    cpu.run();
    EXPECT_TRUE(cpu.is_halted());
}

TEST_F(CpuTest, ResetRestartsAtResetVector) {
    load({mov_imm(1, 1), halt()});
    cpu.run();
    cpu.reset();
    EXPECT_FALSE(cpu.is_halted());
    EXPECT_EQ(cpu.get_pc(), RESET_VECTOR);
    EXPECT_EQ(cpu.get_cycle_count(), 0u);
    EXPECT_EQ(regs.read(1), 0u);
}
