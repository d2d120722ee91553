/**
 * execute_unit.hpp
 *
 * Execute and memory-access logic shared by the pipelined and the
 * single-cycle CPU. Runs the shifter and ALU for one instruction,
 * computes the new flags and resolves branches.
 */

#ifndef EXECUTE_UNIT_HPP
#define EXECUTE_UNIT_HPP

#include "common.hpp"
#include "memory_bus.hpp"

// Source register values for one instruction
struct Operands {
    Word rn = 0;
    Word rm = 0;
    Word rs = 0;
    Word rd = 0;
};

struct ExecResult {
    Word result = 0;            // ALU result, address, or return address
    Word store_val = 0;         // Data for STR / STRB
    Flags flags;                // Flags after this instruction
    bool branch_taken = false;
    Address branch_target = 0;
};

class ExecuteUnit {
public:
    // Instruction must already be gated by its condition
    static ExecResult execute(const Instruction& ins, const Operands& ops, const Flags& flags);

    // Perform the data access; returns loaded data (0 for stores)
    static Word memory_access(MemoryBus& bus, const Instruction& ins, Address addr, Word store_val);

    // Branch destination of a B / BL fetched at pc
    static Address branch_target(const Instruction& ins);
};

#endif // EXECUTE_UNIT_HPP
