/**
 * decoder.hpp
 *
 * Instruction decoder.
 * Takes a 32-bit instruction word and extracts all fields,
 * determines instruction class, and generates control signals.
 * Unsupported encodings decode to a descriptor with every control
 * signal cleared.
 */

#ifndef DECODER_HPP
#define DECODER_HPP

#include "common.hpp"

class Decoder {
public:
    // Decode a 32-bit instruction, control signals not yet gated by the condition
    static Instruction decode(Word raw, Address pc = 0);

    // Decode and gate side effects by the condition against the given flags
    static Instruction decode(Word raw, const Flags& flags, Address pc = 0);

    // Evaluate a condition code against NZCV
    static bool condition_passed(Cond cond, const Flags& flags);

    // Clear every side effect of an instruction whose condition fails
    static void apply_condition(Instruction& ins, const Flags& flags);

private:
    // Class selectors
    static constexpr Word TYPE_DATA   = 0b00;
    static constexpr Word TYPE_MEMORY = 0b01;
    static constexpr Word TYPE_BRANCH = 0b10;
    static constexpr Word TYPE_COPROC = 0b11;

    // Bit extraction helpers
    static Word bits(Word val, int hi, int lo);
    static bool bit(Word val, int n);

    // Per-class decoding
    static void decode_data_processing(Word raw, Instruction& ins);
    static void decode_multiply(Word raw, Instruction& ins);
    static void decode_load_store(Word raw, Instruction& ins);
    static void decode_branch(Word raw, Instruction& ins);
    static void decode_register_operand(Word raw, Instruction& ins);

    // Disassembly generation
    static std::string disassemble(const Instruction& ins);
    static std::string operand2_text(const Instruction& ins);
};

#endif // DECODER_HPP
