/**
 * memory_bus.hpp
 *
 * Address-decoded dispatch from the CPU to memories and peripherals.
 * Accesses outside every mapped region read as zero and writes are
 * discarded. Mapping overlapping regions is a configuration error.
 */

#ifndef MEMORY_BUS_HPP
#define MEMORY_BUS_HPP

#include "common.hpp"
#include "memory.hpp"

class MemoryBus {
public:
    // Default system memory map
    static constexpr Address BOOT_ROM_BASE    = 0x00000000;
    static constexpr Address BOOT_ROM_SIZE    = 0x00001000;
    static constexpr Address PROGRAM_RAM_BASE = 0x00001000;
    static constexpr Address PROGRAM_RAM_SIZE = 0x0000F000;
    static constexpr Address DATA_RAM_BASE    = 0x00010000;
    static constexpr Address DATA_RAM_SIZE    = 0x00010000;
    static constexpr Address UART_BASE        = 0xFFFF0000;
    static constexpr Address UART_SIZE        = 0x00000100;
    static constexpr Address GPIO_BASE        = 0xFFFF0100;
    static constexpr Address GPIO_SIZE        = 0x00000100;

    struct Region {
        Address base = 0;
        Address size = 0;
        Device* device = nullptr;

        Address last() const { return base + (size - 1); }
        bool contains(Address addr) const { return addr >= base && addr <= last(); }
    };

    MemoryBus();

    // Attach a device (not owned); throws std::invalid_argument on overlap
    void map(Address base, Address size, Device& device);

    // Instruction fetch
    Word fetch(Address addr);

    // Data access
    Word read(Address addr);
    void write(Address addr, Word value);
    Byte read_byte(Address addr);
    void write_byte(Address addr, Byte value);

    // Side-effect free read
    Word peek(Address addr) const;

    // Program loader (ignores ROM write protection)
    void load_block(Address addr, const std::vector<Word>& words);
    void load_bytes(Address addr, const std::vector<Byte>& bytes);

    // Reset every attached device and the counters
    void reset();

    // Display
    void dump(Address start, size_t bytes = 64) const;
    void print_map() const;

    // Lookup
    const std::vector<Region>& get_regions() const;
    const Region* find_region(Address addr) const;

    // Stats
    uint64_t get_fetch_count() const;
    uint64_t get_read_count() const;
    uint64_t get_write_count() const;
    uint64_t get_unmapped_count() const;

private:
    std::vector<Region> regions;
    uint64_t fetch_count;
    uint64_t read_count;
    uint64_t write_count;
    uint64_t unmapped_count;

    Region* find(Address addr);
};

#endif // MEMORY_BUS_HPP
