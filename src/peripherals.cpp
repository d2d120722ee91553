/**
 * peripherals.cpp
 *
 * Implementation of the UART and GPIO register models.
 */

#include "peripherals.hpp"

// =============================================================================
// UART
// =============================================================================

UART::UART() : control(0), baud(0), echo(nullptr) {}

Word UART::read_word(Address offset) {
    if (offset == REG_DATA) {
        if (rx.empty()) return 0;
        Byte b = rx.front();
        rx.pop_front();
        return b;
    }
    return peek_word(offset);
}

Word UART::peek_word(Address offset) const {
    switch (offset) {
        case REG_DATA:   return rx.empty() ? 0 : rx.front();
        case REG_STATUS: return STATUS_TX_READY | (rx.empty() ? 0 : STATUS_RX_FULL);
        case REG_CTRL:   return control;
        case REG_BAUD:   return baud;
        default:         return 0;
    }
}

void UART::write_word(Address offset, Word value) {
    switch (offset) {
        case REG_DATA: {
            char c = static_cast<char>(value & 0xFF);
            tx += c;
            if (echo) {
                (*echo) << c;
                echo->flush();
            }
            break;
        }
        case REG_CTRL:
            control = value;
            break;
        case REG_BAUD:
            baud = value;
            break;
        default:
            // STATUS is read-only
            break;
    }
}

Byte UART::read_byte(Address offset) {
    if ((offset & ~3u) == REG_DATA) {
        return offset == REG_DATA ? static_cast<Byte>(read_word(REG_DATA)) : 0;
    }
    return Device::read_byte(offset);
}

void UART::write_byte(Address offset, Byte value) {
    if ((offset & ~3u) == REG_DATA) {
        if (offset == REG_DATA) write_word(REG_DATA, value);
        return;
    }
    Device::write_byte(offset, value);
}

void UART::reset() {
    rx.clear();
    tx.clear();
    control = 0;
    baud = 0;
}

std::string UART::name() const {
    return "uart";
}

void UART::inject(const std::string& input) {
    for (char c : input) {
        rx.push_back(static_cast<Byte>(c));
    }
}

const std::string& UART::output() const {
    return tx;
}

void UART::clear_output() {
    tx.clear();
}

void UART::set_echo(std::ostream* stream) {
    echo = stream;
}

Word UART::get_control() const {
    return control;
}

Word UART::get_baud() const {
    return baud;
}

// =============================================================================
// GPIO
// =============================================================================

GPIO::GPIO() : out(0), in(0), dir(0) {}

Word GPIO::read_word(Address offset) {
    return peek_word(offset);
}

Word GPIO::peek_word(Address offset) const {
    switch (offset) {
        case REG_OUT: return out;
        case REG_IN:  return in;
        case REG_DIR: return dir;
        default:      return 0;
    }
}

void GPIO::write_word(Address offset, Word value) {
    // The bus is the only writer of OUT and DIR; IN belongs to the host
    switch (offset) {
        case REG_OUT: out = value; break;
        case REG_DIR: dir = value; break;
        default: break;
    }
}

void GPIO::reset() {
    out = 0;
    in = 0;
    dir = 0;
}

std::string GPIO::name() const {
    return "gpio";
}

void GPIO::set_inputs(Word value) {
    in = value;
}

Word GPIO::get_output() const {
    return out;
}

Word GPIO::get_direction() const {
    return dir;
}

Word GPIO::pins() const {
    return out & dir;
}
