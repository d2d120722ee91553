/**
 * decoder.cpp
 *
 * Implementation of instruction decoding.
 */

#include "decoder.hpp"
#include "alu.hpp"
#include "shifter.hpp"

// =============================================================================
// Bit Extraction
// =============================================================================

Word Decoder::bits(Word val, int hi, int lo) {
    return (val >> lo) & ((1U << (hi - lo + 1)) - 1);
}

bool Decoder::bit(Word val, int n) {
    return ((val >> n) & 1U) != 0;
}

// =============================================================================
// Condition Evaluation
// =============================================================================

bool Decoder::condition_passed(Cond cond, const Flags& f) {
    switch (cond) {
        case Cond::EQ: return f.z;
        case Cond::NE: return !f.z;
        case Cond::CS: return f.c;
        case Cond::CC: return !f.c;
        case Cond::MI: return f.n;
        case Cond::PL: return !f.n;
        case Cond::VS: return f.v;
        case Cond::VC: return !f.v;
        case Cond::HI: return f.c && !f.z;
        case Cond::LS: return !f.c || f.z;
        case Cond::GE: return f.n == f.v;
        case Cond::LT: return f.n != f.v;
        case Cond::GT: return !f.z && (f.n == f.v);
        case Cond::LE: return f.z || (f.n != f.v);
        case Cond::AL: return true;
        case Cond::NV: return false;
        default:       return false;
    }
}

void Decoder::apply_condition(Instruction& ins, const Flags& flags) {
    ins.cond_pass = condition_passed(ins.cond, flags);
    if (ins.cond_pass) return;

    // Still occupies its pipeline slot, but has no effect
    ins.set_flags = false;
    ins.reg_write = false;
    ins.mem_read = false;
    ins.mem_write = false;
    ins.mem_to_reg = false;
    ins.branch = false;
    ins.link = false;
}

// =============================================================================
// Operand 2 (register form)
// =============================================================================

void Decoder::decode_register_operand(Word raw, Instruction& ins) {
    ins.rm = static_cast<int>(bits(raw, 3, 0));
    ins.uses_rm = true;
    ins.shift_type = static_cast<ShiftType>(bits(raw, 6, 5));

    if (bit(raw, 4)) {
        // Shift amount in bottom byte of Rs
        ins.shift_by_reg = true;
        ins.rs = static_cast<int>(bits(raw, 11, 8));
        ins.uses_rs = true;
    } else {
        ins.shift_amount = static_cast<int>(bits(raw, 11, 7));
    }
}

// =============================================================================
// Data Processing
// =============================================================================

void Decoder::decode_data_processing(Word raw, Instruction& ins) {
    ins.cls = InsClass::DATA_PROCESSING;
    ins.alu_op = static_cast<AluOp>(bits(raw, 24, 21));
    ins.rn = static_cast<int>(bits(raw, 19, 16));
    ins.rd = static_cast<int>(bits(raw, 15, 12));

    bool test = ALU::is_test(ins.alu_op);
    bool move = ins.alu_op == AluOp::MOV || ins.alu_op == AluOp::MVN;

    // Test operations always update flags and never write Rd
    ins.set_flags = bit(raw, 20) || test;
    ins.reg_write = !test;
    ins.uses_rn = !move;

    if (bit(raw, 25)) {
        ins.alu_src = true;
        ins.imm = bits(raw, 7, 0);
        ins.rotate = static_cast<int>(bits(raw, 11, 8)) * 2;
    } else {
        decode_register_operand(raw, ins);
    }
}

// =============================================================================
// Multiply (MUL / MLA)
// =============================================================================

void Decoder::decode_multiply(Word raw, Instruction& ins) {
    ins.cls = InsClass::MULTIPLY;
    ins.accumulate = bit(raw, 21);
    ins.set_flags = bit(raw, 20);
    ins.rd = static_cast<int>(bits(raw, 19, 16));
    ins.rn = static_cast<int>(bits(raw, 15, 12));
    ins.rs = static_cast<int>(bits(raw, 11, 8));
    ins.rm = static_cast<int>(bits(raw, 3, 0));

    ins.uses_rn = ins.accumulate;
    ins.uses_rm = true;
    ins.uses_rs = true;
    ins.reg_write = true;
}

// =============================================================================
// Single Data Transfer (LDR / STR / LDRB / STRB)
// =============================================================================

void Decoder::decode_load_store(Word raw, Instruction& ins) {
    ins.cls = InsClass::LOAD_STORE;
    ins.pre_index = bit(raw, 24);
    ins.add_offset = bit(raw, 23);
    ins.byte = bit(raw, 22);
    ins.rn = static_cast<int>(bits(raw, 19, 16));
    ins.rd = static_cast<int>(bits(raw, 15, 12));
    ins.uses_rn = true;
    ins.alu_op = ins.add_offset ? AluOp::ADD : AluOp::SUB;

    if (bit(raw, 25)) {
        // Register offset, shifted by an immediate
        ins.rm = static_cast<int>(bits(raw, 3, 0));
        ins.uses_rm = true;
        ins.shift_type = static_cast<ShiftType>(bits(raw, 6, 5));
        ins.shift_amount = static_cast<int>(bits(raw, 11, 7));
    } else {
        ins.alu_src = true;
        ins.imm = bits(raw, 11, 0);
    }

    if (bit(raw, 20)) {
        ins.mem_read = true;
        ins.mem_to_reg = true;
        ins.reg_write = true;
    } else {
        ins.mem_write = true;
        ins.uses_rd = true;
    }
}

// =============================================================================
// Branch (B / BL)
// =============================================================================

void Decoder::decode_branch(Word raw, Instruction& ins) {
    ins.cls = InsClass::BRANCH;
    ins.branch = true;
    ins.offset = sign_extend(bits(raw, 23, 0), 24) * 4;

    if (bit(raw, 24)) {
        ins.link = true;
        ins.reg_write = true;
        ins.rd = REG_LR;
    }
}

// =============================================================================
// Disassembly
// =============================================================================

std::string Decoder::operand2_text(const Instruction& ins) {
    std::ostringstream oss;

    if (ins.alu_src) {
        oss << "#" << to_hex(rotate_right(ins.imm, ins.rotate), 1);
        return oss.str();
    }

    oss << reg_name(ins.rm);
    if (ins.shift_by_reg) {
        oss << ", " << BarrelShifter::type_name(ins.shift_type) << " " << reg_name(ins.rs);
    } else if (ins.shift_type == ShiftType::ROR && ins.shift_amount == 0) {
        oss << ", RRX";
    } else if (ins.shift_amount != 0) {
        oss << ", " << BarrelShifter::type_name(ins.shift_type) << " #" << ins.shift_amount;
    } else if (ins.shift_type != ShiftType::LSL) {
        // LSR #0 and ASR #0 mean a shift by 32
        oss << ", " << BarrelShifter::type_name(ins.shift_type) << " #32";
    }
    return oss.str();
}

std::string Decoder::disassemble(const Instruction& ins) {
    std::ostringstream oss;
    std::string cond = cond_name(ins.cond);

    switch (ins.cls) {
        case InsClass::DATA_PROCESSING: {
            bool test = ALU::is_test(ins.alu_op);
            bool move = ins.alu_op == AluOp::MOV || ins.alu_op == AluOp::MVN;

            oss << ALU::op_name(ins.alu_op) << cond;
            if (ins.set_flags && !test) oss << "S";
            oss << " ";
            if (!test) oss << reg_name(ins.rd) << ", ";
            if (!move) oss << reg_name(ins.rn) << ", ";
            oss << operand2_text(ins);
            break;
        }

        case InsClass::MULTIPLY:
            oss << (ins.accumulate ? "MLA" : "MUL") << cond << (ins.set_flags ? "S" : "")
                << " " << reg_name(ins.rd) << ", " << reg_name(ins.rm) << ", " << reg_name(ins.rs);
            if (ins.accumulate) oss << ", " << reg_name(ins.rn);
            break;

        case InsClass::LOAD_STORE: {
            oss << (ins.mem_read ? "LDR" : "STR") << cond << (ins.byte ? "B" : "")
                << " " << reg_name(ins.rd) << ", [" << reg_name(ins.rn);

            std::string offset;
            if (ins.alu_src) {
                if (ins.imm != 0) {
                    offset = std::string("#") + (ins.add_offset ? "" : "-") + to_hex(ins.imm, 1);
                }
            } else {
                Instruction shifted = ins;
                shifted.alu_src = false;
                offset = (ins.add_offset ? "" : "-") + operand2_text(shifted);
            }

            if (ins.pre_index) {
                if (!offset.empty()) oss << ", " << offset;
                oss << "]";
            } else {
                oss << "]";
                if (!offset.empty()) oss << ", " << offset;
            }
            break;
        }

        case InsClass::BRANCH:
            oss << "B" << (ins.link ? "L" : "") << cond << " "
                << to_hex(ins.pc + 8 + static_cast<Word>(ins.offset));
            break;

        case InsClass::COPROCESSOR:
            if (bits(ins.raw, 27, 24) == 0xF) {
                oss << "SWI" << cond << " " << to_hex(bits(ins.raw, 23, 0), 1);
            } else {
                oss << "COPROC " << to_hex(ins.raw);
            }
            break;

        default:
            oss << "UNDEFINED " << to_hex(ins.raw);
            break;
    }

    return oss.str();
}

// =============================================================================
// Main Decode Function
// =============================================================================

Instruction Decoder::decode(Word raw, Address pc) {
    Instruction ins;
    ins.raw = raw;
    ins.pc = pc;
    ins.cond = static_cast<Cond>(bits(raw, 31, 28));

    switch (bits(raw, 27, 26)) {
        // =================================================================
        // Data processing, multiply
        // =================================================================
        case TYPE_DATA:
            if (bits(raw, 27, 22) == 0 && bits(raw, 7, 4) == 0b1001) {
                decode_multiply(raw, ins);
            } else if (!bit(raw, 25) && bit(raw, 4) && bit(raw, 7)) {
                // Halfword transfers and swaps are not implemented
                ins.cls = InsClass::UNDEFINED;
            } else {
                decode_data_processing(raw, ins);
            }
            break;

        // =================================================================
        // Loads / stores
        // =================================================================
        case TYPE_MEMORY:
            if (bit(raw, 25) && bit(raw, 4)) {
                ins.cls = InsClass::UNDEFINED;
            } else {
                decode_load_store(raw, ins);
            }
            break;

        // =================================================================
        // Branches (block transfers are not implemented)
        // =================================================================
        case TYPE_BRANCH:
            if (bit(raw, 25)) {
                decode_branch(raw, ins);
            } else {
                ins.cls = InsClass::UNDEFINED;
            }
            break;

        // =================================================================
        // Coprocessor / SWI
        // =================================================================
        case TYPE_COPROC:
        default:
            ins.cls = InsClass::COPROCESSOR;
            break;
    }

    ins.text = disassemble(ins);
    return ins;
}

Instruction Decoder::decode(Word raw, const Flags& flags, Address pc) {
    Instruction ins = decode(raw, pc);
    apply_condition(ins, flags);
    return ins;
}
