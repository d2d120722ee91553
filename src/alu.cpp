/**
 * alu.cpp
 *
 * Implementation of ALU operations.
 */

#include "alu.hpp"

AluResult ALU::add_with_carry(Word a, Word b, bool carry_in) {
    uint64_t sum = static_cast<uint64_t>(a) + static_cast<uint64_t>(b) + (carry_in ? 1u : 0u);

    AluResult r;
    r.result = static_cast<Word>(sum & 0xFFFFFFFF);
    r.carry = (sum >> 32) != 0;
    // Operands agree in sign but the result does not
    r.overflow = ((~(a ^ b) & (a ^ r.result)) >> 31) != 0;
    return r;
}

AluResult ALU::execute(AluOp op, Word a, Word b, bool carry_in) {
    AluResult r;

    switch (op) {
        // Logical
        case AluOp::AND:
        case AluOp::TST:
            r.result = a & b;
            break;
        case AluOp::EOR:
        case AluOp::TEQ:
            r.result = a ^ b;
            break;
        case AluOp::ORR:
            r.result = a | b;
            break;
        case AluOp::MOV:
            r.result = b;
            break;
        case AluOp::BIC:
            r.result = a & ~b;
            break;
        case AluOp::MVN:
            r.result = ~b;
            break;

        // Arithmetic: subtraction is a + ~b + 1, so carry means "no borrow"
        case AluOp::SUB:
        case AluOp::CMP:
            return add_with_carry(a, ~b, true);
        case AluOp::RSB:
            return add_with_carry(b, ~a, true);
        case AluOp::ADD:
        case AluOp::CMN:
            return add_with_carry(a, b, false);
        case AluOp::ADC:
            return add_with_carry(a, b, carry_in);
        case AluOp::SBC:
            return add_with_carry(a, ~b, carry_in);
        case AluOp::RSC:
            return add_with_carry(b, ~a, carry_in);

        default:
            break;
    }

    return r;
}

Word ALU::multiply(Word a, Word b, Word acc) {
    uint64_t product = static_cast<uint64_t>(a) * static_cast<uint64_t>(b);
    return static_cast<Word>((product + acc) & 0xFFFFFFFF);
}

bool ALU::is_test(AluOp op) {
    return op == AluOp::TST || op == AluOp::TEQ ||
           op == AluOp::CMP || op == AluOp::CMN;
}

bool ALU::is_logical(AluOp op) {
    switch (op) {
        case AluOp::AND: case AluOp::EOR: case AluOp::TST: case AluOp::TEQ:
        case AluOp::ORR: case AluOp::MOV: case AluOp::BIC: case AluOp::MVN:
            return true;
        default:
            return false;
    }
}

std::string ALU::op_name(AluOp op) {
    switch (op) {
        case AluOp::AND: return "AND";
        case AluOp::EOR: return "EOR";
        case AluOp::SUB: return "SUB";
        case AluOp::RSB: return "RSB";
        case AluOp::ADD: return "ADD";
        case AluOp::ADC: return "ADC";
        case AluOp::SBC: return "SBC";
        case AluOp::RSC: return "RSC";
        case AluOp::TST: return "TST";
        case AluOp::TEQ: return "TEQ";
        case AluOp::CMP: return "CMP";
        case AluOp::CMN: return "CMN";
        case AluOp::ORR: return "ORR";
        case AluOp::MOV: return "MOV";
        case AluOp::BIC: return "BIC";
        case AluOp::MVN: return "MVN";
        default:         return "UNKNOWN";
    }
}
