/**
 * execute_unit.cpp
 *
 * Implementation of the execute stage datapath.
 */

#include "execute_unit.hpp"
#include "alu.hpp"
#include "shifter.hpp"

Address ExecuteUnit::branch_target(const Instruction& ins) {
    // Offsets are relative to the instruction address + 8
    return ins.pc + 8 + static_cast<Word>(ins.offset);
}

ExecResult ExecuteUnit::execute(const Instruction& ins, const Operands& ops, const Flags& flags) {
    ExecResult r;
    r.flags = flags;

    switch (ins.cls) {
        // =================================================================
        // Data processing
        // =================================================================
        case InsClass::DATA_PROCESSING: {
            ShiftResult op2;
            if (ins.alu_src) {
                op2 = BarrelShifter::rotate_immediate(ins.imm, ins.rotate, flags.c);
            } else if (ins.shift_by_reg) {
                op2 = BarrelShifter::shift_by_register(ops.rm, ins.shift_type, ops.rs, flags.c);
            } else {
                op2 = BarrelShifter::shift(ops.rm, ins.shift_type, ins.shift_amount, flags.c);
            }

            AluResult alu = ALU::execute(ins.alu_op, ops.rn, op2.value, flags.c);
            r.result = alu.result;

            if (ins.set_flags) {
                r.flags.n = alu.negative();
                r.flags.z = alu.zero();
                if (ALU::is_logical(ins.alu_op)) {
                    // Carry from the shifter, V unaffected
                    r.flags.c = op2.carry;
                } else {
                    r.flags.c = alu.carry;
                    r.flags.v = alu.overflow;
                }
            }

            // Writing R15 redirects fetch
            if (ins.reg_write && ins.rd == REG_PC) {
                r.branch_taken = true;
                r.branch_target = alu.result & ~3u;
            }
            break;
        }

        // =================================================================
        // Multiply
        // =================================================================
        case InsClass::MULTIPLY:
            r.result = ALU::multiply(ops.rm, ops.rs, ins.accumulate ? ops.rn : 0);
            if (ins.set_flags) {
                r.flags.n = (r.result >> 31) != 0;
                r.flags.z = r.result == 0;
            }
            break;

        // =================================================================
        // Load / store address
        // =================================================================
        case InsClass::LOAD_STORE: {
            Word offset = ins.alu_src
                ? ins.imm
                : BarrelShifter::shift(ops.rm, ins.shift_type, ins.shift_amount, flags.c).value;

            if (ins.pre_index) {
                r.result = ALU::execute(ins.alu_op, ops.rn, offset, flags.c).result;
            } else {
                // Post-indexed: access at the unmodified base
                r.result = ops.rn;
            }
            r.store_val = ops.rd;
            break;
        }

        // =================================================================
        // Branch
        // =================================================================
        case InsClass::BRANCH:
            if (ins.branch) {
                r.branch_taken = true;
                r.branch_target = branch_target(ins);
            }
            // Return address for BL
            r.result = ins.pc + 4;
            break;

        default:
            break;
    }

    return r;
}

Word ExecuteUnit::memory_access(MemoryBus& bus, const Instruction& ins, Address addr, Word store_val) {
    if (ins.mem_read) {
        return ins.byte ? bus.read_byte(addr) : bus.read(addr);
    }

    if (ins.mem_write) {
        if (ins.byte) {
            bus.write_byte(addr, static_cast<Byte>(store_val & 0xFF));
        } else {
            bus.write(addr, store_val);
        }
    }

    return 0;
}
