#include <gtest/gtest.h>
#include "board.hpp"
#include "cpu.hpp"
#include "pipeline.hpp"
#include "arm_encoding.hpp"

using namespace encode;

class PipelineTest : public ::testing::Test {
protected:
    Board board;
    RegisterFile regs;
    Pipeline pipe{board.bus, regs};

    void load(const std::vector<Word>& program, Address addr = 0) {
        board.bus.load_block(addr, program);
        pipe.set_pc(addr);
    }

    void step(int n) {
        for (int i = 0; i < n; i++) pipe.step();
    }
};

// =============================================================================
// Basic flow
// =============================================================================

TEST_F(PipelineTest, ResetState) {
    EXPECT_EQ(pipe.get_pc(), RESET_VECTOR);
    EXPECT_FALSE(pipe.get_if_id().valid);
    EXPECT_FALSE(pipe.get_id_ex().valid);
    EXPECT_FALSE(pipe.get_ex_mem().valid);
    EXPECT_FALSE(pipe.get_mem_wb().valid);
    EXPECT_EQ(pipe.get_cycle_count(), 0u);
}

TEST_F(PipelineTest, InstructionMovesOneStagePerCycle) {
    load({mov_imm(1, 7), NOP_ENCODING, NOP_ENCODING, NOP_ENCODING, halt()});

    pipe.step();
    EXPECT_TRUE(pipe.get_if_id().valid);
    EXPECT_EQ(pipe.get_if_id().pc, 0u);
    EXPECT_EQ(pipe.get_pc(), 4u);

    pipe.step();
    EXPECT_EQ(pipe.get_id_ex().ins.text, "MOV R1, #0x7");

    pipe.step();
    EXPECT_EQ(pipe.get_ex_mem().alu_result, 7u);

    pipe.step();
    EXPECT_EQ(pipe.get_mem_wb().result(), 7u);
    EXPECT_EQ(regs.read(1), 0u);

    // Committed at the end of the writeback cycle
    pipe.step();
    EXPECT_EQ(regs.read(1), 7u);
    EXPECT_EQ(pipe.get_instruction_count(), 1u);
}

TEST_F(PipelineTest, EmptyMemoryRunsHarmlessly) {
    // 0x00000000 is ANDEQ R0, R0, R0 and Z starts clear
    uint64_t executed = pipe.run(100);
    EXPECT_EQ(executed, 100u);
    EXPECT_FALSE(pipe.is_halted());
    for (int i = 0; i < REG_PC; i++) {
        EXPECT_EQ(regs.read(i), 0u);
    }
    EXPECT_EQ(pipe.get_flags(), Flags());
}

// =============================================================================
// Forwarding
// =============================================================================

TEST_F(PipelineTest, ForwardingBackToBack) {
    load({add_imm(1, 0, 5), add_imm(2, 1, 10), add_imm(3, 2, 15), halt()});

    step(7);
    EXPECT_EQ(regs.read(1), 5u);
    EXPECT_EQ(regs.read(2), 15u);
    EXPECT_EQ(regs.read(3), 30u);
    EXPECT_EQ(pipe.get_stall_count(), 0u);
    EXPECT_GE(pipe.get_forward_count(), 2u);

    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(pipe.get_cycle_count(), 8u);
    EXPECT_EQ(pipe.get_instruction_count(), 4u);
}

TEST_F(PipelineTest, WithoutForwardingStallsButComputesSameResult) {
    pipe.set_forwarding(false);
    load({add_imm(1, 0, 5), add_imm(2, 1, 10), add_imm(3, 2, 15), halt()});

    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(regs.read(1), 5u);
    EXPECT_EQ(regs.read(2), 15u);
    EXPECT_EQ(regs.read(3), 30u);
    EXPECT_EQ(pipe.get_stall_count(), 4u);
    EXPECT_EQ(pipe.get_forward_count(), 0u);
}

TEST_F(PipelineTest, ForwardingFromTwoAhead) {
    load({mov_imm(1, 3), NOP_ENCODING, add_imm(2, 1, 1), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(2), 4u);
    EXPECT_EQ(pipe.get_stall_count(), 0u);
}

TEST_F(PipelineTest, WritebackReachesDecodeSameCycle) {
    load({mov_imm(1, 3), NOP_ENCODING, NOP_ENCODING, add_imm(2, 1, 1), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(2), 4u);
}

TEST_F(PipelineTest, R0IsForwarded) {
    load({mov_imm(0, 9), add_imm(1, 0, 1), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(0), 9u);
    EXPECT_EQ(regs.read(1), 10u);
}

TEST_F(PipelineTest, StoreDataIsForwarded) {
    load({
        mov_imm(1, 1, 8),       // R1 = 0x10000
        mov_imm(2, 0x5A),
        str(2, 1),
        ldr(3, 1),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(board.bus.peek(0x10000), 0x5Au);
    EXPECT_EQ(regs.read(3), 0x5Au);
}

// =============================================================================
// Load-use
// =============================================================================

TEST_F(PipelineTest, LoadUseInsertsOneStall) {
    load({mov_imm(1, 1, 12), ldr(2, 1), add_imm(3, 2, 5), halt()});
    board.bus.load_block(0x100, {100});

    step(8);
    EXPECT_EQ(regs.read(2), 100u);
    EXPECT_EQ(regs.read(3), 105u);
    EXPECT_EQ(pipe.get_stall_count(), 1u);
}

TEST_F(PipelineTest, StallHoldsFetchAndDecode) {
    load({mov_imm(1, 1, 12), ldr(2, 1), add_imm(3, 2, 5), halt()});

    step(4);
    EXPECT_TRUE(pipe.is_stalled());
    EXPECT_EQ(pipe.get_last_decision().if_id, StageAction::HOLD);
    EXPECT_FALSE(pipe.get_id_ex().valid);
    EXPECT_EQ(pipe.get_if_id().pc, 8u);
    EXPECT_EQ(pipe.get_pc(), 0xCu);
    EXPECT_TRUE(pipe.get_ex_mem().ins.mem_read);
}

TEST_F(PipelineTest, NoHazardDetectionReadsStaleValue) {
    pipe.set_hazard_detection(false);
    load({mov_imm(1, 1, 12), ldr(2, 1), add_imm(3, 2, 5), halt()});
    board.bus.load_block(0x100, {100});

    pipe.run();
    EXPECT_EQ(regs.read(2), 100u);
    EXPECT_EQ(regs.read(3), 5u);
    EXPECT_EQ(pipe.get_stall_count(), 0u);
}

// =============================================================================
// Branches
// =============================================================================

TEST_F(PipelineTest, TakenBranchFlushesTwoSlots) {
    load({b(-1), mov_imm(7, 1), halt()});

    step(3);
    const HazardDecision& d = pipe.get_last_decision();
    EXPECT_TRUE(d.flush);
    EXPECT_EQ(d.if_id, StageAction::BUBBLE);
    EXPECT_EQ(d.id_ex, StageAction::BUBBLE);
    EXPECT_EQ(d.ex_mem, StageAction::ADVANCE);
    EXPECT_EQ(d.mem_wb, StageAction::ADVANCE);
    EXPECT_FALSE(pipe.get_if_id().valid);
    EXPECT_FALSE(pipe.get_id_ex().valid);
    EXPECT_TRUE(pipe.get_ex_mem().branch_taken);
    EXPECT_EQ(pipe.get_pc(), 4u);
    EXPECT_EQ(pipe.get_flush_count(), 2u);
}

TEST_F(PipelineTest, EachTakenBranchCostsTwoCycles) {
    const int n = 3;

    auto cycles_until_r7 = [this](const std::vector<Word>& program) {
        board.bus.reset();
        pipe.reset();
        load(program);
        uint64_t cycles = 0;
        while (regs.read(7) != 1 && cycles < 200) {
            pipe.step();
            cycles++;
        }
        return cycles;
    };

    std::vector<Word> branches(n, b(-1));
    branches.push_back(mov_imm(7, 1));
    branches.push_back(halt());

    std::vector<Word> nops(n, NOP_ENCODING);
    nops.push_back(mov_imm(7, 1));
    nops.push_back(halt());

    uint64_t with_branches = cycles_until_r7(branches);
    uint64_t with_nops = cycles_until_r7(nops);
    EXPECT_EQ(with_nops, static_cast<uint64_t>(n + 5));
    EXPECT_EQ(with_branches, with_nops + 2 * n);
}

TEST_F(PipelineTest, SquashedInstructionsHaveNoEffect) {
    load({b(1), mov_imm(1, 1), mov_imm(2, 2), mov_imm(3, 3), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(1), 0u);
    EXPECT_EQ(regs.read(2), 0u);
    EXPECT_EQ(regs.read(3), 3u);
}

TEST_F(PipelineTest, BranchAndLinkReturn) {
    load({
        bl(2),                                      // 0x00: BL 0x10
        mov_imm(2, 7),                              // 0x04
        halt(),                                     // 0x08
        NOP_ENCODING,                               // 0x0C
        mov_imm(1, 3),                              // 0x10
        dp_reg(AluOp::MOV, REG_PC, 0, REG_LR),      // 0x14: MOV PC, LR
    });
    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(regs.read(REG_LR), 4u);
    EXPECT_EQ(regs.read(1), 3u);
    EXPECT_EQ(regs.read(2), 7u);
}

TEST_F(PipelineTest, ConditionalBranchUsesFlagsOfPrecedingCompare) {
    load({
        mov_imm(1, 5),
        cmp_imm(1, 5),
        b(0, Cond::EQ),         // 0x08: skip 0x0C
        mov_imm(2, 1),
        mov_imm(3, 1),
        cmp_imm(1, 6),
        b(0, Cond::EQ),         // 0x18: not taken
        mov_imm(4, 1),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(regs.read(2), 0u);
    EXPECT_EQ(regs.read(3), 1u);
    EXPECT_EQ(regs.read(4), 1u);
    EXPECT_TRUE(pipe.get_flags().n);
    EXPECT_FALSE(pipe.get_flags().z);
}

TEST_F(PipelineTest, CountdownLoop) {
    load({
        mov_imm(0, 0),
        mov_imm(1, 10),
        dp_reg(AluOp::ADD, 0, 0, 1),        // 0x08: loop
        sub_imm(1, 1, 1, true),
        b_to(0x10, 0x08, Cond::NE),
        halt(),
    });
    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(regs.read(0), 55u);
    EXPECT_EQ(regs.read(1), 0u);
    EXPECT_TRUE(pipe.get_flags().z);
    EXPECT_TRUE(pipe.get_flags().c);
}

// =============================================================================
// Operands and datapath
// =============================================================================

TEST_F(PipelineTest, R15ReadsAsPcPlusEight) {
    load({NOP_ENCODING, dp_imm(AluOp::ADD, 0, REG_PC, 0), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(0), 12u);
}

TEST_F(PipelineTest, LogicalFlagsTakeShifterCarry) {
    load({
        mov_imm(1, 3),
        dp_reg(AluOp::MOV, 2, 0, 1, ShiftType::LSR, 1, true),  // MOVS R2, R1, LSR #1
        halt(),
    });
    pipe.run();
    EXPECT_EQ(regs.read(2), 1u);
    EXPECT_TRUE(pipe.get_flags().c);
    EXPECT_FALSE(pipe.get_flags().z);
    EXPECT_FALSE(pipe.get_flags().v);
}

TEST_F(PipelineTest, RegisterShift) {
    load({
        mov_imm(1, 1),
        mov_imm(2, 4),
        dp_reg_shift(AluOp::MOV, 3, 0, 1, ShiftType::LSL, 2),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(regs.read(3), 16u);
}

TEST_F(PipelineTest, MultiplyAndAccumulate) {
    load({mov_imm(1, 6), mov_imm(2, 7), mul(3, 1, 2), mla(4, 1, 2, 3), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(3), 42u);
    EXPECT_EQ(regs.read(4), 84u);
}

TEST_F(PipelineTest, ByteTransfers) {
    load({
        mov_imm(1, 1, 8),       // R1 = 0x10000
        mov_imm(2, 0xAB),
        strb(2, 1, 1),
        ldr(3, 1),
        ldrb(4, 1, 1),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(regs.read(3), 0xAB00u);
    EXPECT_EQ(regs.read(4), 0xABu);
}

TEST_F(PipelineTest, RomStoresAreDiscarded) {
    load({mov_imm(1, 0x80), mov_imm(2, 0x55), str(2, 1), ldr(3, 1), halt()});
    pipe.run();
    EXPECT_EQ(regs.read(3), 0u);
}

TEST_F(PipelineTest, UndefinedInstructionIsANop) {
    load({0xE8900006, 0xEF000000, mov_imm(1, 1), halt()});
    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(regs.read(1), 1u);
    EXPECT_EQ(regs.read(2), 0u);
}

// =============================================================================
// Peripherals
// =============================================================================

TEST_F(PipelineTest, FirmwareWritesToUart) {
    load({
        mov_imm(1, 0xFF, 4),                    // R1 = 0xFF000000
        dp_imm(AluOp::ORR, 1, 1, 0xFF, 8),      // R1 = 0xFFFF0000
        mov_imm(2, 'H'),
        str(2, 1),
        mov_imm(2, 'i'),
        strb(2, 1),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(board.uart.output(), "Hi");
}

TEST_F(PipelineTest, FirmwareReadsUartAndDrivesGpio) {
    board.uart.inject("A");
    board.gpio.set_inputs(0x3);
    load({
        mov_imm(1, 0xFF, 4),
        dp_imm(AluOp::ORR, 1, 1, 0xFF, 8),      // R1 = UART base
        ldr(2, 1, UART::REG_STATUS),
        ldr(3, 1),                              // pop received byte
        dp_imm(AluOp::ORR, 4, 1, 1, 12),        // R4 = GPIO base
        ldr(5, 4, GPIO::REG_IN),
        mov_imm(6, 0xFF),
        str(6, 4, GPIO::REG_DIR),
        str(3, 4, GPIO::REG_OUT),
        halt(),
    });
    pipe.run();
    EXPECT_EQ(regs.read(2), UART::STATUS_TX_READY | UART::STATUS_RX_FULL);
    EXPECT_EQ(regs.read(3), static_cast<Word>('A'));
    EXPECT_EQ(regs.read(5), 0x3u);
    EXPECT_EQ(board.gpio.pins(), static_cast<Word>('A'));
}

// =============================================================================
// Run control
// =============================================================================

TEST_F(PipelineTest, BreakpointStopsRun) {
    load({NOP_ENCODING, NOP_ENCODING, NOP_ENCODING, halt()});
    pipe.add_breakpoint(0x8);
    EXPECT_TRUE(pipe.has_breakpoint(0x8));

    EXPECT_EQ(pipe.run(), 2u);
    EXPECT_EQ(pipe.get_pc(), 0x8u);
    EXPECT_FALSE(pipe.is_halted());

    pipe.remove_breakpoint(0x8);
    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
}

TEST_F(PipelineTest, CycleLimit) {
    load({b(-2)});
    pipe.clear_breakpoints();
    EXPECT_EQ(pipe.run(3), 3u);
    EXPECT_FALSE(pipe.is_halted());
}

TEST_F(PipelineTest, HaltedPipelineDoesNotAdvance) {
    load({halt()});
    pipe.run();
    ASSERT_TRUE(pipe.is_halted());
    uint64_t cycles = pipe.get_cycle_count();
    EXPECT_FALSE(pipe.cycle());
    EXPECT_EQ(pipe.run(), 0u);
    EXPECT_EQ(pipe.get_cycle_count(), cycles);
}

TEST_F(PipelineTest, ResetClearsState) {
    load({mov_imm(1, 1), cmp_imm(1, 2), mov_imm(14, 9), ldr(2, 1), add_imm(3, 2, 1), halt()});
    step(6);
    ASSERT_TRUE(pipe.get_flags().n);
    ASSERT_TRUE(pipe.get_ex_mem().valid);
    pipe.run();
    ASSERT_GT(pipe.get_stall_count(), 0u);

    pipe.reset();

    EXPECT_FALSE(pipe.is_halted());
    EXPECT_FALSE(pipe.is_stalled());
    EXPECT_EQ(pipe.get_cycle_count(), 0u);
    EXPECT_EQ(pipe.get_instruction_count(), 0u);
    EXPECT_EQ(pipe.get_stall_count(), 0u);
    EXPECT_EQ(pipe.get_flush_count(), 0u);
    EXPECT_EQ(pipe.get_forward_count(), 0u);
    EXPECT_EQ(pipe.get_pc(), RESET_VECTOR);
    EXPECT_EQ(pipe.get_flags().to_bits(), Flags().to_bits());
    for (int i = 0; i < REG_PC; i++) {
        EXPECT_EQ(regs.read(i), 0u) << reg_name(i);
    }
    EXPECT_FALSE(pipe.get_if_id().valid);
    EXPECT_FALSE(pipe.get_id_ex().valid);
    EXPECT_FALSE(pipe.get_ex_mem().valid);
    EXPECT_FALSE(pipe.get_mem_wb().valid);
}

TEST_F(PipelineTest, SetPcDropsOldPathInstructions) {
    load({mov_imm(1, 1), mov_imm(2, 2), mov_imm(3, 3), halt()});
    load({mov_imm(4, 4), halt()}, 0x100);
    pipe.set_pc(0);

    // MOV R1 is in decode, MOV R2 in fetch
    step(2);
    ASSERT_TRUE(pipe.get_if_id().valid);
    ASSERT_TRUE(pipe.get_id_ex().valid);

    pipe.set_pc(0x100);
    EXPECT_FALSE(pipe.get_if_id().valid);
    EXPECT_FALSE(pipe.get_id_ex().valid);

    pipe.run();
    EXPECT_TRUE(pipe.is_halted());
    EXPECT_EQ(regs.read(1), 0u);
    EXPECT_EQ(regs.read(2), 0u);
    EXPECT_EQ(regs.read(3), 0u);
    EXPECT_EQ(regs.read(4), 4u);
}

TEST_F(PipelineTest, SnapshotMatchesState) {
    load({mov_imm(1, 2), halt()});
    step(5);
    PipelineSnapshot s = pipe.snapshot();
    EXPECT_EQ(s.cycle, 5u);
    EXPECT_EQ(s.pc, pipe.get_pc());
    EXPECT_EQ(s.regs[1], 2u);
    EXPECT_EQ(s.ex_mem.valid, pipe.get_ex_mem().valid);
}

// =============================================================================
// Agreement with the single-cycle model
// =============================================================================

static void expect_same_state(const std::vector<Word>& program, const PipelineConfig& config) {
    Board pb;
    RegisterFile pregs;
    Pipeline pipe(pb.bus, pregs);
    pipe.set_config(config);
    pb.bus.load_block(0, program);
    pipe.run();

    Board cb;
    RegisterFile cregs;
    CPU cpu(cb.bus, cregs);
    cb.bus.load_block(0, program);
    cpu.run();

    ASSERT_TRUE(pipe.is_halted());
    ASSERT_TRUE(cpu.is_halted());
    EXPECT_EQ(pipe.get_instruction_count(), cpu.get_instruction_count());
    for (int i = 0; i < REG_PC; i++) {
        EXPECT_EQ(pregs.read(i), cregs.read(i)) << reg_name(i);
    }
    EXPECT_EQ(pregs.get_flags(), cregs.get_flags());
    EXPECT_EQ(pb.bus.peek(0x10000), cb.bus.peek(0x10000));
}

TEST(PipelineAgreementTest, MatchesSingleCycleCpu) {
    std::vector<Word> program = {
        mov_imm(1, 1, 8),                       // R1 = 0x10000
        mov_imm(2, 10),
        mov_imm(3, 0),
        dp_reg(AluOp::ADD, 3, 3, 2),            // 0x0C: loop
        str(3, 1),
        ldr(4, 1),
        dp_reg(AluOp::ADD, 5, 4, 4, ShiftType::LSL, 1),
        sub_imm(2, 2, 1, true),
        b_to(0x20, 0x0C, Cond::GT),
        mul(6, 5, 3),
        dp_imm(AluOp::RSB, 7, 6, 0, 0, true),
        halt(),
    };

    PipelineConfig config;
    expect_same_state(program, config);

    config.forwarding = false;
    expect_same_state(program, config);
}
