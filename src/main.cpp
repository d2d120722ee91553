/**
 * main.cpp
 *
 * Entry point for the ARM7 pipeline emulator.
 * Usage: arm7emu [image.bin [load-address]]
 */

#include "emulator.hpp"

int main(int argc, char* argv[]) {
    Emulator emu;

    // If an image is provided as argument, load it
    if (argc > 1) {
        Address addr = RESET_VECTOR;
        if (argc > 2) {
            try {
                addr = static_cast<Address>(std::stoul(argv[2], nullptr, 0));
            } catch (const std::exception&) {
                std::cerr << "Invalid load address: " << argv[2] << "\n";
                return 1;
            }
        }
        if (!emu.load(argv[1], addr)) {
            return 1;
        }
    }

    // Run the interactive command loop
    emu.run();

    return 0;
}
