/**
 * memory.cpp
 *
 * Implementation of the memory devices.
 * Uses sparse storage (std::map) so empty regions cost nothing.
 * Little-endian byte order.
 */

#include "memory.hpp"
#include <utility>

// =============================================================================
// Device defaults
// =============================================================================

Byte Device::read_byte(Address offset) {
    Word word = read_word(offset & ~3u);
    return static_cast<Byte>((word >> ((offset & 3u) * 8)) & 0xFF);
}

void Device::write_byte(Address offset, Byte value) {
    Address aligned = offset & ~3u;
    int shift = static_cast<int>((offset & 3u) * 8);
    Word word = peek_word(aligned);
    word = (word & ~(0xFFu << shift)) | (static_cast<Word>(value) << shift);
    write_word(aligned, word);
}

void Device::load_word(Address offset, Word value) {
    write_word(offset, value);
}

void Device::load_byte(Address offset, Byte value) {
    write_byte(offset, value);
}

// =============================================================================
// Memory
// =============================================================================

Memory::Memory(std::string name, Address size, bool writable)
    : label(std::move(name)), capacity(size), writable(writable),
      read_count(0), write_count(0) {}

void Memory::reset() {
    mem.clear();
    read_count = 0;
    write_count = 0;
}

Byte Memory::peek_byte(Address addr) const {
    auto it = mem.find(addr);
    return (it != mem.end()) ? it->second : 0;
}

void Memory::store_byte(Address addr, Byte value) {
    if (addr >= capacity) return;
    mem[addr] = value;
}

// =============================================================================
// Byte Access
// =============================================================================

Byte Memory::read_byte(Address addr) {
    read_count++;
    return peek_byte(addr);
}

void Memory::write_byte(Address addr, Byte value) {
    write_count++;
    // Stores to ROM are discarded
    if (!writable) return;
    store_byte(addr, value);
}

// =============================================================================
// Word Access (32-bit, little-endian)
// =============================================================================

Word Memory::read_word(Address addr) {
    read_count++;
    return peek_word(addr);
}

void Memory::write_word(Address addr, Word value) {
    write_count++;
    if (!writable) return;
    store_byte(addr, value & 0xFF);
    store_byte(addr + 1, (value >> 8) & 0xFF);
    store_byte(addr + 2, (value >> 16) & 0xFF);
    store_byte(addr + 3, (value >> 24) & 0xFF);
}

Word Memory::peek_word(Address addr) const {
    Byte b0 = peek_byte(addr);
    Byte b1 = peek_byte(addr + 1);
    Byte b2 = peek_byte(addr + 2);
    Byte b3 = peek_byte(addr + 3);
    return static_cast<Word>(b0) |
           (static_cast<Word>(b1) << 8) |
           (static_cast<Word>(b2) << 16) |
           (static_cast<Word>(b3) << 24);
}

// =============================================================================
// Loader Access
// =============================================================================

void Memory::load_word(Address addr, Word value) {
    store_byte(addr, value & 0xFF);
    store_byte(addr + 1, (value >> 8) & 0xFF);
    store_byte(addr + 2, (value >> 16) & 0xFF);
    store_byte(addr + 3, (value >> 24) & 0xFF);
}

void Memory::load_byte(Address addr, Byte value) {
    store_byte(addr, value);
}

// =============================================================================
// Bulk Operations
// =============================================================================

void Memory::write_bytes(Address addr, const std::vector<Byte>& bytes) {
    for (Byte b : bytes) {
        load_byte(addr++, b);
    }
}

// =============================================================================
// Info / Stats
// =============================================================================

std::string Memory::name() const {
    return label;
}

Address Memory::size() const {
    return capacity;
}

bool Memory::is_writable() const {
    return writable;
}

size_t Memory::bytes_used() const {
    return mem.size();
}

uint64_t Memory::get_read_count() const {
    return read_count;
}

uint64_t Memory::get_write_count() const {
    return write_count;
}
