/**
 * peripherals.hpp
 *
 * Register-level models of the memory-mapped UART and GPIO blocks.
 * Only the register interface is modelled; baud generation and bit
 * serialization have no effect on the CPU and are not simulated.
 */

#ifndef PERIPHERALS_HPP
#define PERIPHERALS_HPP

#include "common.hpp"
#include "memory.hpp"
#include <deque>

// =============================================================================
// UART
// =============================================================================

class UART : public Device {
public:
    // Register offsets
    static constexpr Address REG_DATA   = 0x00;
    static constexpr Address REG_STATUS = 0x04;
    static constexpr Address REG_CTRL   = 0x08;
    static constexpr Address REG_BAUD   = 0x0C;

    // Status bits
    static constexpr Word STATUS_TX_READY = 0x01;
    static constexpr Word STATUS_RX_FULL  = 0x02;

    UART();

    Word read_word(Address offset) override;
    void write_word(Address offset, Word value) override;
    Word peek_word(Address offset) const override;

    // DATA is one byte wide; only its lowest lane transmits or receives
    Byte read_byte(Address offset) override;
    void write_byte(Address offset, Byte value) override;

    void reset() override;
    std::string name() const override;

    // Host side
    void inject(const std::string& input);
    const std::string& output() const;
    void clear_output();
    void set_echo(std::ostream* stream);

    Word get_control() const;
    Word get_baud() const;

private:
    std::deque<Byte> rx;
    std::string tx;
    Word control;
    Word baud;
    std::ostream* echo;
};

// =============================================================================
// GPIO
// =============================================================================

class GPIO : public Device {
public:
    // Register offsets
    static constexpr Address REG_OUT = 0x00;
    static constexpr Address REG_IN  = 0x04;
    static constexpr Address REG_DIR = 0x08;

    GPIO();

    Word read_word(Address offset) override;
    void write_word(Address offset, Word value) override;
    Word peek_word(Address offset) const override;
    void reset() override;
    std::string name() const override;

    // Host side
    void set_inputs(Word value);
    Word get_output() const;
    Word get_direction() const;

    // Driven pin levels (output register masked by direction)
    Word pins() const;

private:
    Word out;
    Word in;
    Word dir;
};

#endif // PERIPHERALS_HPP
