/**
 * register_file.cpp
 *
 * Implementation of the 16 general-purpose registers and flags.
 */

#include "register_file.hpp"

RegisterFile::RegisterFile() {
    reset();
}

void RegisterFile::reset() {
    regs.fill(0);
    flags = Flags();
    pending_write.reset();
    pending_flags.reset();
}

void RegisterFile::check_index(int reg) {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        throw std::out_of_range("Invalid register: " + std::to_string(reg));
    }
}

Word RegisterFile::read(int reg) const {
    check_index(reg);
    return regs[reg];
}

Word RegisterFile::read_forwarded(int reg) const {
    check_index(reg);
    if (pending_write && pending_write->first == reg) {
        return pending_write->second;
    }
    return regs[reg];
}

void RegisterFile::write(int reg, Word value) {
    check_index(reg);
    regs[reg] = value;
}

void RegisterFile::stage_write(int reg, Word value) {
    check_index(reg);
    pending_write = std::make_pair(reg, value);
}

void RegisterFile::stage_flags(const Flags& f) {
    pending_flags = f;
}

void RegisterFile::commit() {
    if (pending_write) {
        regs[pending_write->first] = pending_write->second;
        pending_write.reset();
    }
    if (pending_flags) {
        flags = *pending_flags;
        pending_flags.reset();
    }
}

const Flags& RegisterFile::get_flags() const {
    return flags;
}

void RegisterFile::set_flags(const Flags& f) {
    flags = f;
}

void RegisterFile::dump() const {
    std::cout << "Registers:\n";
    for (int row = 0; row < 4; row++) {
        std::cout << "  ";
        for (int col = 0; col < 4; col++) {
            int reg = row * 4 + col;
            std::cout << std::setw(3) << std::left << reg_name(reg)
                      << "= " << to_hex(regs[reg]);
            if (col < 3) std::cout << "  ";
        }
        std::cout << "\n";
    }
    std::cout << std::right;
    dump_flags();
}

void RegisterFile::dump_reg(int reg) const {
    if (reg < 0 || reg >= NUM_REGISTERS) {
        std::cout << "Invalid register: " << reg << "\n";
        return;
    }
    std::cout << reg_name(reg)
              << " = " << to_hex(regs[reg])
              << " (" << static_cast<SignedWord>(regs[reg]) << ")\n";
}

void RegisterFile::dump_flags() const {
    std::cout << "  Flags: " << flags_string(flags) << "\n";
}

const std::array<Word, NUM_REGISTERS>& RegisterFile::get_all() const {
    return regs;
}
