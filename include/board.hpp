/**
 * board.hpp
 *
 * The default system: boot ROM, program RAM, data RAM, UART and GPIO
 * attached to one memory bus at the standard addresses.
 */

#ifndef BOARD_HPP
#define BOARD_HPP

#include "common.hpp"
#include "memory.hpp"
#include "memory_bus.hpp"
#include "peripherals.hpp"

class Board {
public:
    Board();

    // Non-copyable: the bus holds pointers to the devices below
    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    Memory boot_rom;
    Memory program_ram;
    Memory data_ram;
    UART uart;
    GPIO gpio;
    MemoryBus bus;
};

#endif // BOARD_HPP
