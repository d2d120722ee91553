/**
 * memory.hpp
 *
 * Memory devices for the ARM7 emulator.
 * Device is the interface the memory bus dispatches to; offsets are
 * relative to the base address a device is mapped at.
 * Memory is byte-addressable, little-endian, sparse storage used for
 * the boot ROM and the program / data RAMs.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"

class Device {
public:
    virtual ~Device() = default;

    // Word access (offset is word aligned by the bus)
    virtual Word read_word(Address offset) = 0;
    virtual void write_word(Address offset, Word value) = 0;

    // Read without side effects (debugger, disassembly)
    virtual Word peek_word(Address offset) const = 0;

    // Byte access, defaults are built on the word accessors
    virtual Byte read_byte(Address offset);
    virtual void write_byte(Address offset, Byte value);

    // Program loader path, ignores write protection
    virtual void load_word(Address offset, Word value);
    virtual void load_byte(Address offset, Byte value);

    virtual void reset() {}
    virtual std::string name() const = 0;
};

class Memory : public Device {
public:
    Memory(std::string name, Address size, bool writable = true);

    // Clear contents and counters
    void reset() override;

    // Byte access
    Byte read_byte(Address addr) override;
    void write_byte(Address addr, Byte value) override;

    // Word access (32-bit)
    Word read_word(Address addr) override;
    void write_word(Address addr, Word value) override;
    Word peek_word(Address addr) const override;

    // Loader access (bypasses write protection)
    void load_word(Address addr, Word value) override;
    void load_byte(Address addr, Byte value) override;

    // Bulk load of a raw image
    void write_bytes(Address addr, const std::vector<Byte>& bytes);

    std::string name() const override;
    Address size() const;
    bool is_writable() const;

    // Stats
    size_t bytes_used() const;
    uint64_t get_read_count() const;
    uint64_t get_write_count() const;

private:
    std::string label;
    Address capacity;
    bool writable;
    std::map<Address, Byte> mem;
    uint64_t read_count;
    uint64_t write_count;

    Byte peek_byte(Address addr) const;
    void store_byte(Address addr, Byte value);
};

#endif // MEMORY_HPP
