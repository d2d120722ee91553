/**
 * board.cpp
 *
 * Default memory map wiring.
 */

#include "board.hpp"

Board::Board()
    : boot_rom("boot_rom", MemoryBus::BOOT_ROM_SIZE, false),
      program_ram("program_ram", MemoryBus::PROGRAM_RAM_SIZE),
      data_ram("data_ram", MemoryBus::DATA_RAM_SIZE) {
    bus.map(MemoryBus::BOOT_ROM_BASE, MemoryBus::BOOT_ROM_SIZE, boot_rom);
    bus.map(MemoryBus::PROGRAM_RAM_BASE, MemoryBus::PROGRAM_RAM_SIZE, program_ram);
    bus.map(MemoryBus::DATA_RAM_BASE, MemoryBus::DATA_RAM_SIZE, data_ram);
    bus.map(MemoryBus::UART_BASE, MemoryBus::UART_SIZE, uart);
    bus.map(MemoryBus::GPIO_BASE, MemoryBus::GPIO_SIZE, gpio);
}
