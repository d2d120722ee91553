/**
 * cpu.cpp
 *
 * Reference core: one instruction retires per call to step().
 */

#include "cpu.hpp"
#include <algorithm>

CPU::CPU(MemoryBus& bus, RegisterFile& regs)
    : bus(bus), regs(regs), pc(RESET_VECTOR),
      cycles(0), instructions(0), halted(false) {}

void CPU::reset() {
    pc = RESET_VECTOR;
    cycles = 0;
    instructions = 0;
    halted = false;
    last_ins = Instruction();
    regs.reset();
}

// =============================================================================
// Fetch
// =============================================================================

Word CPU::fetch() {
    return bus.fetch(pc);
}

// =============================================================================
// Decode
// =============================================================================

Instruction CPU::decode(Word raw) {
    // Gate against the flags left by the previous instruction
    return Decoder::decode(raw, regs.get_flags(), pc);
}

Operands CPU::read_operands(const Instruction& ins) const {
    auto read = [this](int reg) -> Word {
        return reg == REG_PC ? pc + 8 : regs.read(reg);
    };

    Operands ops;
    ops.rn = read(ins.rn);
    ops.rm = read(ins.rm);
    ops.rs = read(ins.rs);
    ops.rd = read(ins.rd);
    return ops;
}

// =============================================================================
// Writeback
// =============================================================================

void CPU::writeback(const Instruction& ins, Word result) {
    // R15 is owned by the PC logic
    if (ins.reg_write && ins.rd != REG_PC) {
        regs.write(ins.rd, result);
    }
}

// =============================================================================
// Step (execute one instruction)
// =============================================================================

bool CPU::step() {
    if (halted) return false;

    Instruction ins = decode(fetch());
    last_ins = ins;

    Operands ops = read_operands(ins);
    ExecResult r = ExecuteUnit::execute(ins, ops, regs.get_flags());

    Word mem_data = ExecuteUnit::memory_access(bus, ins, r.result, r.store_val);

    writeback(ins, ins.mem_to_reg ? mem_data : r.result);
    if (ins.set_flags) {
        regs.set_flags(r.flags);
    }

    pc = r.branch_taken ? r.branch_target : pc + 4;
    cycles++;
    instructions++;

    if (ins.is_self_branch()) {
        halted = true;
        return false;
    }

    return !has_breakpoint(pc);
}

// =============================================================================
// Run
// =============================================================================

uint64_t CPU::run(uint64_t max_cycles) {
    uint64_t executed = 0;
    while (executed < max_cycles && !halted) {
        executed++;
        if (!step()) break;
    }
    return executed;
}

// =============================================================================
// Accessors
// =============================================================================

Address CPU::get_pc() const { return pc; }
void CPU::set_pc(Address addr) { pc = addr & ~3u; }
uint64_t CPU::get_cycle_count() const { return cycles; }
uint64_t CPU::get_instruction_count() const { return instructions; }
bool CPU::is_halted() const { return halted; }
const Instruction& CPU::get_last_instruction() const { return last_ins; }

// =============================================================================
// Breakpoints
// =============================================================================

void CPU::add_breakpoint(Address addr) {
    if (!has_breakpoint(addr)) breakpoints.push_back(addr);
}

void CPU::remove_breakpoint(Address addr) {
    auto it = std::find(breakpoints.begin(), breakpoints.end(), addr);
    if (it != breakpoints.end()) breakpoints.erase(it);
}

void CPU::clear_breakpoints() { breakpoints.clear(); }

bool CPU::has_breakpoint(Address addr) const {
    return std::find(breakpoints.begin(), breakpoints.end(), addr) != breakpoints.end();
}

const std::vector<Address>& CPU::get_breakpoints() const {
    return breakpoints;
}
