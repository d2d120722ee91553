/**
 * shifter.hpp
 *
 * Barrel shifter for the second operand.
 * Reproduces the ARM zero-amount encodings: LSR #0 and ASR #0 mean a
 * shift by 32, ROR #0 means RRX.
 */

#ifndef SHIFTER_HPP
#define SHIFTER_HPP

#include "common.hpp"

struct ShiftResult {
    Word value = 0;
    bool carry = false;
};

class BarrelShifter {
public:
    // Shift by an immediate amount (0-31)
    static ShiftResult shift(Word value, ShiftType type, int amount, bool carry_in);

    // Shift by the bottom byte of a register
    static ShiftResult shift_by_register(Word value, ShiftType type, Word amount, bool carry_in);

    // 8-bit immediate rotated right by an even amount
    static ShiftResult rotate_immediate(Word imm8, int rotate, bool carry_in);

    static std::string type_name(ShiftType type);
};

#endif // SHIFTER_HPP
