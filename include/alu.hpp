/**
 * alu.hpp
 *
 * Arithmetic Logic Unit.
 * Performs the sixteen ARM data-processing operations with carry and
 * overflow, plus the multiply extension.
 */

#ifndef ALU_HPP
#define ALU_HPP

#include "common.hpp"

struct AluResult {
    Word result = 0;
    bool carry = false;
    bool overflow = false;

    bool zero() const { return result == 0; }
    bool negative() const { return (result >> 31) != 0; }
};

class ALU {
public:
    // Execute an ALU operation
    static AluResult execute(AluOp op, Word a, Word b, bool carry_in);

    // MUL / MLA (low 32 bits of a * b + acc)
    static Word multiply(Word a, Word b, Word acc);

    // TST, TEQ, CMP, CMN (result discarded)
    static bool is_test(AluOp op);

    // Operations whose carry flag comes from the shifter
    static bool is_logical(AluOp op);

    // Get description of operation (for debugging)
    static std::string op_name(AluOp op);

private:
    // a + b + carry_in with carry out of bit 31
    static AluResult add_with_carry(Word a, Word b, bool carry_in);
};

#endif // ALU_HPP
