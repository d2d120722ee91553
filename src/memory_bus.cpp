/**
 * memory_bus.cpp
 *
 * Implementation of the address decoder.
 */

#include "memory_bus.hpp"
#include <algorithm>

MemoryBus::MemoryBus()
    : fetch_count(0), read_count(0), write_count(0), unmapped_count(0) {}

// =============================================================================
// Mapping
// =============================================================================

void MemoryBus::map(Address base, Address size, Device& device) {
    if (size == 0) {
        throw std::invalid_argument("Empty region for " + device.name() + " at " + to_hex(base));
    }
    if (base + (size - 1) < base) {
        throw std::invalid_argument("Region for " + device.name() + " at " + to_hex(base) +
                                    " wraps past the end of the address space");
    }

    Region region;
    region.base = base;
    region.size = size;
    region.device = &device;

    for (const Region& r : regions) {
        if (region.base <= r.last() && r.base <= region.last()) {
            throw std::invalid_argument("Region " + device.name() + " [" + to_hex(region.base) +
                                        " - " + to_hex(region.last()) + "] overlaps " +
                                        r.device->name() + " [" + to_hex(r.base) + " - " +
                                        to_hex(r.last()) + "]");
        }
    }

    regions.push_back(region);
    std::sort(regions.begin(), regions.end(),
              [](const Region& a, const Region& b) { return a.base < b.base; });
}

MemoryBus::Region* MemoryBus::find(Address addr) {
    for (Region& r : regions) {
        if (r.contains(addr)) return &r;
    }
    return nullptr;
}

const MemoryBus::Region* MemoryBus::find_region(Address addr) const {
    for (const Region& r : regions) {
        if (r.contains(addr)) return &r;
    }
    return nullptr;
}

// =============================================================================
// Access
// =============================================================================

Word MemoryBus::fetch(Address addr) {
    fetch_count++;
    addr &= ~3u;
    Region* r = find(addr);
    if (!r) {
        unmapped_count++;
        return 0;
    }
    return r->device->read_word(addr - r->base);
}

Word MemoryBus::read(Address addr) {
    read_count++;
    addr &= ~3u;
    Region* r = find(addr);
    if (!r) {
        unmapped_count++;
        return 0;
    }
    return r->device->read_word(addr - r->base);
}

void MemoryBus::write(Address addr, Word value) {
    write_count++;
    addr &= ~3u;
    Region* r = find(addr);
    if (!r) {
        unmapped_count++;
        return;
    }
    r->device->write_word(addr - r->base, value);
}

Byte MemoryBus::read_byte(Address addr) {
    read_count++;
    Region* r = find(addr);
    if (!r) {
        unmapped_count++;
        return 0;
    }
    return r->device->read_byte(addr - r->base);
}

void MemoryBus::write_byte(Address addr, Byte value) {
    write_count++;
    Region* r = find(addr);
    if (!r) {
        unmapped_count++;
        return;
    }
    r->device->write_byte(addr - r->base, value);
}

Word MemoryBus::peek(Address addr) const {
    addr &= ~3u;
    const Region* r = find_region(addr);
    if (!r) return 0;
    return r->device->peek_word(addr - r->base);
}

// =============================================================================
// Loader
// =============================================================================

void MemoryBus::load_block(Address addr, const std::vector<Word>& words) {
    for (Word w : words) {
        Region* r = find(addr);
        if (r) r->device->load_word(addr - r->base, w);
        addr += 4;
    }
}

void MemoryBus::load_bytes(Address addr, const std::vector<Byte>& bytes) {
    for (Byte b : bytes) {
        Region* r = find(addr);
        if (r) r->device->load_byte(addr - r->base, b);
        addr++;
    }
}

void MemoryBus::reset() {
    for (Region& r : regions) {
        r.device->reset();
    }
    fetch_count = 0;
    read_count = 0;
    write_count = 0;
    unmapped_count = 0;
}

// =============================================================================
// Display
// =============================================================================

void MemoryBus::dump(Address start, size_t bytes) const {
    std::cout << "Memory [" << to_hex(start) << " - " << to_hex(start + bytes - 1) << "]:\n";

    for (size_t i = 0; i < bytes; i += 16) {
        Address addr = start + static_cast<Address>(i);
        std::cout << to_hex(addr) << ": ";

        // Hex bytes
        for (size_t j = 0; j < 16 && (i + j) < bytes; j++) {
            Address a = addr + static_cast<Address>(j);
            if (find_region(a)) {
                Byte b = static_cast<Byte>((peek(a) >> ((a & 3u) * 8)) & 0xFF);
                std::cout << std::hex << std::setfill('0') << std::setw(2)
                          << static_cast<int>(b) << " ";
            } else {
                std::cout << ".. ";
            }
            if (j == 7) std::cout << " ";
        }

        // ASCII
        std::cout << " |";
        for (size_t j = 0; j < 16 && (i + j) < bytes; j++) {
            Address a = addr + static_cast<Address>(j);
            char c = static_cast<char>((peek(a) >> ((a & 3u) * 8)) & 0xFF);
            std::cout << ((c >= 32 && c < 127) ? c : '.');
        }
        std::cout << "|\n";
    }
    std::cout << std::dec << std::setfill(' ');
}

void MemoryBus::print_map() const {
    std::cout << "Memory map:\n";
    for (const Region& r : regions) {
        std::cout << "  " << to_hex(r.base) << " - " << to_hex(r.last())
                  << "  " << r.device->name() << "\n";
    }
}

// =============================================================================
// Accessors
// =============================================================================

const std::vector<MemoryBus::Region>& MemoryBus::get_regions() const { return regions; }
uint64_t MemoryBus::get_fetch_count() const { return fetch_count; }
uint64_t MemoryBus::get_read_count() const { return read_count; }
uint64_t MemoryBus::get_write_count() const { return write_count; }
uint64_t MemoryBus::get_unmapped_count() const { return unmapped_count; }
