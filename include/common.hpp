/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used throughout the emulator.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = uint32_t;          // 32-bit unsigned (main data type for ARM7)
using SignedWord = int32_t;     // 32-bit signed
using Address = uint32_t;       // Memory address
using Byte = uint8_t;           // 8-bit

constexpr int NUM_REGISTERS = 16;
constexpr int REG_SP = 13;
constexpr int REG_LR = 14;
constexpr int REG_PC = 15;

constexpr Address RESET_VECTOR = 0x00000000;
constexpr Word NOP_ENCODING = 0xE1A00000;   // MOV R0, R0

// =============================================================================
// Condition Codes (bits 31-28)
// =============================================================================

enum class Cond {
    EQ, NE,     // Z set / clear
    CS, CC,     // C set / clear (HS / LO)
    MI, PL,     // N set / clear
    VS, VC,     // V set / clear
    HI, LS,     // Unsigned higher / lower or same
    GE, LT,     // Signed
    GT, LE,     // Signed
    AL,         // Always
    NV          // Never
};

// =============================================================================
// Instruction Class (bits 27-26, refined)
// =============================================================================

enum class InsClass {
    DATA_PROCESSING,
    MULTIPLY,
    LOAD_STORE,
    BRANCH,
    COPROCESSOR,    // Includes SWI, decoded as no-op
    UNDEFINED       // Unsupported encoding, decoded as no-op
};

// =============================================================================
// ALU Operations (encoding order of bits 24-21)
// =============================================================================

enum class AluOp {
    AND, EOR, SUB, RSB,
    ADD, ADC, SBC, RSC,
    TST, TEQ, CMP, CMN,     // Flags only
    ORR, MOV, BIC, MVN
};

// =============================================================================
// Barrel Shifter Types (bits 6-5)
// =============================================================================

enum class ShiftType {
    LSL, LSR, ASR, ROR
};

// =============================================================================
// Condition Flags (N, Z, C, V)
// =============================================================================

struct Flags {
    bool n = false;
    bool z = false;
    bool c = false;
    bool v = false;

    // Packed as NZCV in bits 3-0
    Word to_bits() const {
        return (n ? 8u : 0u) | (z ? 4u : 0u) | (c ? 2u : 0u) | (v ? 1u : 0u);
    }

    static Flags from_bits(Word bits) {
        Flags f;
        f.n = (bits & 8u) != 0;
        f.z = (bits & 4u) != 0;
        f.c = (bits & 2u) != 0;
        f.v = (bits & 1u) != 0;
        return f;
    }

    bool operator==(const Flags& other) const { return to_bits() == other.to_bits(); }
    bool operator!=(const Flags& other) const { return !(*this == other); }
};

// =============================================================================
// Decoded Instruction
// =============================================================================

struct Instruction {
    Word raw = NOP_ENCODING;    // Raw 32-bit encoding (default: NOP)
    Address pc = 0;             // PC where fetched
    Cond cond = Cond::AL;
    InsClass cls = InsClass::DATA_PROCESSING;
    AluOp alu_op = AluOp::MOV;

    int rd = 0;                 // Destination (store data for STR)
    int rn = 0;                 // First operand / base / accumulator
    int rm = 0;                 // Second operand register
    int rs = 0;                 // Shift amount / multiplier register

    // Which source registers the instruction actually reads
    bool uses_rn = false;
    bool uses_rm = false;
    bool uses_rs = false;
    bool uses_rd = false;

    Word imm = 0;               // Rotated immediate or load/store offset
    int rotate = 0;             // Immediate rotate amount (already doubled)
    SignedWord offset = 0;      // Branch offset in bytes
    ShiftType shift_type = ShiftType::LSL;
    int shift_amount = 0;
    bool shift_by_reg = false;

    // Control signals
    bool cond_pass = true;      // Condition evaluated against flags
    bool set_flags = false;     // Update NZCV?
    bool reg_write = false;     // Write to register file?
    bool mem_read = false;      // Read from memory?
    bool mem_write = false;     // Write to memory?
    bool mem_to_reg = false;    // Memory result to register?
    bool alu_src = false;       // Use immediate as operand 2?
    bool branch = false;        // Branch instruction?
    bool link = false;          // Branch with link?
    bool byte = false;          // Byte transfer (LDRB/STRB)?
    bool add_offset = true;     // U bit
    bool pre_index = true;      // P bit
    bool accumulate = false;    // MLA

    std::string text;           // Disassembly string

    bool is_nop() const { return raw == NOP_ENCODING; }

    // Unconditional "B ." idle loop used by firmware to signal completion
    bool is_self_branch() const {
        return cls == InsClass::BRANCH && branch && offset == -8;
    }
};

// =============================================================================
// Pipeline Registers
// =============================================================================

struct IF_ID {
    Word instruction = NOP_ENCODING;
    Address pc = 0;
    Address next_pc = 4;
    bool valid = false;

    void flush() { instruction = NOP_ENCODING; pc = 0; next_pc = 4; valid = false; }
};

struct ID_EX {
    Instruction ins;
    Word rn_val = 0;
    Word rm_val = 0;
    Word rs_val = 0;
    Word rd_val = 0;
    Address pc = 0;
    Address next_pc = 4;
    bool valid = false;

    void flush() {
        ins = Instruction();
        rn_val = 0; rm_val = 0; rs_val = 0; rd_val = 0;
        pc = 0; next_pc = 4; valid = false;
    }
};

struct EX_MEM {
    Instruction ins;
    Word alu_result = 0;
    Word store_val = 0;
    Address branch_target = 0;
    bool branch_taken = false;
    bool valid = false;

    void flush() { ins = Instruction(); alu_result = 0; store_val = 0; branch_target = 0; branch_taken = false; valid = false; }
};

struct MEM_WB {
    Instruction ins;
    Word alu_result = 0;
    Word mem_data = 0;
    bool valid = false;

    void flush() { ins = Instruction(); alu_result = 0; mem_data = 0; valid = false; }

    Word result() const { return ins.mem_to_reg ? mem_data : alu_result; }
};

// =============================================================================
// Forwarding / Stage Control
// =============================================================================

enum class Forward {
    NONE,       // Use register value latched in decode
    EX_MEM,     // Forward from EX/MEM (instruction now in MEM)
    MEM_WB      // Forward from MEM/WB (instruction now in WB)
};

enum class StageAction {
    ADVANCE,    // Latch the newly computed value
    HOLD,       // Keep the current contents
    BUBBLE      // Latch a bubble
};

// =============================================================================
// Utility Functions
// =============================================================================

// Sign extend from a given bit width to 32 bits
inline SignedWord sign_extend(Word value, int bits) {
    Word sign_bit = 1U << (bits - 1);
    if (value & sign_bit) {
        Word mask = ~((1U << bits) - 1);
        return static_cast<SignedWord>(value | mask);
    }
    return static_cast<SignedWord>(value);
}

// Rotate right, amount taken mod 32
inline Word rotate_right(Word value, int amount) {
    amount &= 31;
    if (amount == 0) return value;
    return (value >> amount) | (value << (32 - amount));
}

// Format as hex string
inline std::string to_hex(Word value, int width = 8) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

// Register name (R0-R12, SP, LR, PC)
inline std::string reg_name(int reg) {
    switch (reg) {
        case REG_SP: return "SP";
        case REG_LR: return "LR";
        case REG_PC: return "PC";
        default: return "R" + std::to_string(reg);
    }
}

// Condition suffix ("" for AL)
inline std::string cond_name(Cond cond) {
    switch (cond) {
        case Cond::EQ: return "EQ";
        case Cond::NE: return "NE";
        case Cond::CS: return "CS";
        case Cond::CC: return "CC";
        case Cond::MI: return "MI";
        case Cond::PL: return "PL";
        case Cond::VS: return "VS";
        case Cond::VC: return "VC";
        case Cond::HI: return "HI";
        case Cond::LS: return "LS";
        case Cond::GE: return "GE";
        case Cond::LT: return "LT";
        case Cond::GT: return "GT";
        case Cond::LE: return "LE";
        case Cond::AL: return "";
        case Cond::NV: return "NV";
        default: return "??";
    }
}

inline std::string flags_string(const Flags& f) {
    std::string s;
    s += f.n ? 'N' : '-';
    s += f.z ? 'Z' : '-';
    s += f.c ? 'C' : '-';
    s += f.v ? 'V' : '-';
    return s;
}

#endif // COMMON_HPP
