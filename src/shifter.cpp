/**
 * shifter.cpp
 *
 * Implementation of the barrel shifter.
 */

#include "shifter.hpp"

namespace {

bool bit(Word value, int n) {
    return ((value >> n) & 1u) != 0;
}

} // namespace

ShiftResult BarrelShifter::shift(Word value, ShiftType type, int amount, bool carry_in) {
    amount &= 31;
    ShiftResult r;

    switch (type) {
        case ShiftType::LSL:
            if (amount == 0) {
                r.value = value;
                r.carry = carry_in;
            } else {
                r.value = value << amount;
                r.carry = bit(value, 32 - amount);
            }
            break;

        case ShiftType::LSR:
            // LSR #0 encodes LSR #32
            if (amount == 0) {
                r.value = 0;
                r.carry = bit(value, 31);
            } else {
                r.value = value >> amount;
                r.carry = bit(value, amount - 1);
            }
            break;

        case ShiftType::ASR:
            // ASR #0 encodes ASR #32
            if (amount == 0) {
                r.value = bit(value, 31) ? 0xFFFFFFFF : 0;
                r.carry = bit(value, 31);
            } else {
                r.value = static_cast<Word>(static_cast<SignedWord>(value) >> amount);
                r.carry = bit(value, amount - 1);
            }
            break;

        case ShiftType::ROR:
            // ROR #0 encodes RRX
            if (amount == 0) {
                r.value = (carry_in ? 0x80000000u : 0u) | (value >> 1);
                r.carry = bit(value, 0);
            } else {
                r.value = rotate_right(value, amount);
                r.carry = bit(value, amount - 1);
            }
            break;
    }

    return r;
}

ShiftResult BarrelShifter::shift_by_register(Word value, ShiftType type, Word amount, bool carry_in) {
    amount &= 0xFF;

    if (amount == 0) {
        return ShiftResult{value, carry_in};
    }

    switch (type) {
        case ShiftType::LSL:
            if (amount < 32) return shift(value, type, static_cast<int>(amount), carry_in);
            if (amount == 32) return ShiftResult{0, bit(value, 0)};
            return ShiftResult{0, false};

        case ShiftType::LSR:
            if (amount < 32) return shift(value, type, static_cast<int>(amount), carry_in);
            if (amount == 32) return ShiftResult{0, bit(value, 31)};
            return ShiftResult{0, false};

        case ShiftType::ASR:
            if (amount < 32) return shift(value, type, static_cast<int>(amount), carry_in);
            return ShiftResult{bit(value, 31) ? 0xFFFFFFFFu : 0u, bit(value, 31)};

        case ShiftType::ROR: {
            int r = static_cast<int>(amount & 31);
            if (r == 0) return ShiftResult{value, bit(value, 31)};
            return shift(value, type, r, carry_in);
        }
    }

    return ShiftResult{value, carry_in};
}

ShiftResult BarrelShifter::rotate_immediate(Word imm8, int rotate, bool carry_in) {
    imm8 &= 0xFF;
    if (rotate == 0) {
        return ShiftResult{imm8, carry_in};
    }
    Word value = rotate_right(imm8, rotate);
    return ShiftResult{value, bit(value, 31)};
}

std::string BarrelShifter::type_name(ShiftType type) {
    switch (type) {
        case ShiftType::LSL: return "LSL";
        case ShiftType::LSR: return "LSR";
        case ShiftType::ASR: return "ASR";
        case ShiftType::ROR: return "ROR";
        default:             return "???";
    }
}
