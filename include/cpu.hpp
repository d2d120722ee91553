/**
 * cpu.hpp
 *
 * Reference ARM7 core without a pipeline.
 * Each step retires one instruction against the same decoder, datapath
 * and bus as the pipeline, so both models must agree on final state.
 */

#ifndef CPU_HPP
#define CPU_HPP

#include "common.hpp"
#include "memory_bus.hpp"
#include "register_file.hpp"
#include "decoder.hpp"
#include "execute_unit.hpp"

class CPU {
public:
    static constexpr uint64_t DEFAULT_MAX_CYCLES = 1000000;

    CPU(MemoryBus& bus, RegisterFile& regs);
    void reset();

    // Execute one instruction, returns false if halted or at a breakpoint
    bool step();

    // Run until halt, breakpoint or cycle limit; returns cycles executed
    uint64_t run(uint64_t max_cycles = DEFAULT_MAX_CYCLES);

    // State access
    Address get_pc() const;
    void set_pc(Address addr);
    uint64_t get_cycle_count() const;
    uint64_t get_instruction_count() const;
    bool is_halted() const;

    // Most recently retired instruction
    const Instruction& get_last_instruction() const;

    // Breakpoints
    void add_breakpoint(Address addr);
    void remove_breakpoint(Address addr);
    void clear_breakpoints();
    bool has_breakpoint(Address addr) const;
    const std::vector<Address>& get_breakpoints() const;

private:
    MemoryBus& bus;
    RegisterFile& regs;
    Address pc;
    uint64_t cycles;
    uint64_t instructions;
    bool halted;
    Instruction last_ins;
    std::vector<Address> breakpoints;

    // Datapath phases, run back to back inside step()
    Word fetch();
    Instruction decode(Word raw);
    Operands read_operands(const Instruction& ins) const;
    void writeback(const Instruction& ins, Word result);
};

#endif // CPU_HPP
