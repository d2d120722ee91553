/**
 * register_file.hpp
 *
 * 16 general-purpose registers (R0-R15) plus the NZCV flags.
 * R0 is an ordinary register. The pipeline keeps the PC itself, so R15
 * here is only storage.
 *
 * Writes from the writeback stage are staged and become visible at the
 * next clock edge (commit). read_forwarded() exposes a staged value in
 * the same cycle for the decode-stage write-through.
 */

#ifndef REGISTER_FILE_HPP
#define REGISTER_FILE_HPP

#include "common.hpp"

class RegisterFile {
public:
    RegisterFile();
    void reset();

    // Read committed register value
    Word read(int reg) const;

    // Read, seeing a write staged this cycle
    Word read_forwarded(int reg) const;

    // Write register value immediately (loader / debugger)
    void write(int reg, Word value);

    // Clocked write port
    void stage_write(int reg, Word value);
    void stage_flags(const Flags& flags);
    void commit();

    // Flags
    const Flags& get_flags() const;
    void set_flags(const Flags& flags);

    // Display
    void dump() const;
    void dump_reg(int reg) const;
    void dump_flags() const;

    // Direct access for debugging
    const std::array<Word, NUM_REGISTERS>& get_all() const;

private:
    std::array<Word, NUM_REGISTERS> regs;
    Flags flags;

    // Pending writes for the current cycle
    std::optional<std::pair<int, Word>> pending_write;
    std::optional<Flags> pending_flags;

    static void check_index(int reg);
};

#endif // REGISTER_FILE_HPP
