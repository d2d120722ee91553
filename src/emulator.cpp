/**
 * emulator.cpp
 *
 * Top-level emulator implementation.
 */

#include "emulator.hpp"
#include "decoder.hpp"
#include "hazard_unit.hpp"
#include <algorithm>
#include <sstream>
#include <cctype>
#include <iterator>

Emulator::Emulator()
    : cpu(board.bus, regs), pipeline(board.bus, regs), image_addr(RESET_VECTOR),
      mode(Mode::PIPELINE), running(true), program_loaded(false) {
    // Firmware output appears inline with the shell
    board.uart.set_echo(&std::cout);
}

// =============================================================================
// Program Loading
// =============================================================================

bool Emulator::load(const std::string& filename, Address addr) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        std::cout << "Cannot open file: " << filename << "\n";
        return false;
    }

    std::vector<Byte> bytes((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    if (file.bad()) {
        std::cout << "Error reading file: " << filename << "\n";
        return false;
    }
    if (bytes.empty()) {
        std::cout << "Empty image: " << filename << "\n";
        return false;
    }

    image = std::move(bytes);
    image_addr = addr & ~3u;
    restore_image();

    program_loaded = true;
    std::cout << "Loaded " << image.size() << " bytes at " << to_hex(image_addr) << "\n";
    return true;
}

void Emulator::load_image(const std::vector<Word>& words, Address addr) {
    image.clear();
    for (Word w : words) {
        image.push_back(static_cast<Byte>(w & 0xFF));
        image.push_back(static_cast<Byte>((w >> 8) & 0xFF));
        image.push_back(static_cast<Byte>((w >> 16) & 0xFF));
        image.push_back(static_cast<Byte>((w >> 24) & 0xFF));
    }
    image_addr = addr & ~3u;
    restore_image();
    program_loaded = true;
}

void Emulator::restore_image() {
    board.bus.reset();
    cpu.reset();
    pipeline.reset();
    regs.reset();

    board.bus.load_bytes(image_addr, image);

    // Execution starts at the image when it is not at the reset vector
    cpu.set_pc(image_addr);
    pipeline.set_pc(image_addr);
}

// =============================================================================
// Command Loop
// =============================================================================

void Emulator::run() {
    print_welcome();

    std::string input;
    while (running) {
        print_prompt();
        if (!std::getline(std::cin, input)) break;
        if (!execute_command(input)) break;
    }

    std::cout << "Goodbye!\n";
}

bool Emulator::execute_command(const std::string& input) {
    auto tokens = tokenize(input);
    if (tokens.empty()) return true;

    std::string cmd = tokens[0];
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    // Optional numeric argument at index i
    auto number_arg = [&tokens](size_t i, Word fallback) -> std::optional<Word> {
        if (tokens.size() <= i) return fallback;
        auto value = parse_number(tokens[i]);
        if (!value) std::cout << "Invalid number: " << tokens[i] << "\n";
        return value;
    };

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
        return false;
    }
    else if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    }
    else if (cmd == "load" || cmd == "l") {
        if (tokens.size() < 2) {
            std::cout << "Usage: load <file> [address]\n";
        } else if (auto addr = number_arg(2, RESET_VECTOR)) {
            load(tokens[1], *addr);
        }
    }
    else if (cmd == "run" || cmd == "r") {
        if (auto max = number_arg(1, 0)) {
            cmd_run(*max == 0 ? Pipeline::DEFAULT_MAX_CYCLES : *max);
        }
    }
    else if (cmd == "step" || cmd == "s") {
        if (auto count = number_arg(1, 1)) {
            cmd_step(*count);
        }
    }
    else if (cmd == "reset") {
        cmd_reset();
    }
    else if (cmd == "regs" || cmd == "registers") {
        cmd_regs();
    }
    else if (cmd == "reg") {
        if (tokens.size() < 2) {
            std::cout << "Usage: reg <register> [value]\n";
        } else if (tokens.size() == 2) {
            cmd_reg(tokens[1]);
        } else if (auto value = number_arg(2, 0)) {
            cmd_set_reg(tokens[1], *value);
        }
    }
    else if (cmd == "flags") {
        cmd_flags();
    }
    else if (cmd == "mem" || cmd == "memory" || cmd == "m") {
        if (tokens.size() < 2) {
            std::cout << "Usage: mem <address> [count]\n";
        } else if (auto addr = number_arg(1, 0)) {
            if (auto count = number_arg(2, 64)) {
                cmd_mem(*addr, *count);
            }
        }
    }
    else if (cmd == "pc") {
        if (tokens.size() > 1) {
            if (auto addr = number_arg(1, 0)) cmd_set_pc(*addr);
        } else {
            cmd_pc();
        }
    }
    else if (cmd == "mode") {
        if (tokens.size() < 2) {
            std::cout << "Current mode: " << (mode == Mode::SINGLE_CYCLE ? "single" : "pipeline") << "\n";
        } else {
            cmd_mode(tokens[1]);
        }
    }
    else if (cmd == "hazards") {
        if (tokens.size() < 2) {
            std::cout << "Hazard detection: " << (pipeline.get_hazard_detection() ? "on" : "off") << "\n";
            HazardUnit::print_status(pipeline.get_if_id(), pipeline.get_id_ex(),
                                     pipeline.get_ex_mem(), pipeline.get_mem_wb(),
                                     pipeline.get_config());
        } else {
            cmd_hazards(tokens[1]);
        }
    }
    else if (cmd == "forward" || cmd == "forwarding") {
        if (tokens.size() < 2) {
            std::cout << "Forwarding: " << (pipeline.get_forwarding() ? "on" : "off") << "\n";
        } else {
            cmd_forward(tokens[1]);
        }
    }
    else if (cmd == "trace") {
        if (tokens.size() < 2) {
            std::cout << "Trace: " << (pipeline.get_trace_enabled() ? "on" : "off") << "\n";
        } else {
            cmd_trace(tokens[1]);
        }
    }
    else if (cmd == "diagram") {
        if (auto cols = number_arg(1, 32)) {
            pipeline.print_diagram(*cols);
        }
    }
    else if (cmd == "break" || cmd == "b") {
        if (tokens.size() < 2) {
            cmd_breakpoints();
        } else if (auto addr = number_arg(1, 0)) {
            cmd_break(*addr);
        }
    }
    else if (cmd == "clear") {
        cmd_clear();
    }
    else if (cmd == "disasm" || cmd == "d") {
        if (auto addr = number_arg(1, current_pc())) {
            if (auto count = number_arg(2, 10)) {
                cmd_disasm(*addr, *count);
            }
        }
    }
    else if (cmd == "pipeline" || cmd == "pipe" || cmd == "p") {
        cmd_pipeline();
    }
    else if (cmd == "uart") {
        cmd_uart(tokens);
    }
    else if (cmd == "gpio") {
        cmd_gpio(tokens);
    }
    else if (cmd == "map") {
        board.bus.print_map();
    }
    else if (cmd == "stats") {
        cmd_stats();
    }
    else {
        std::cout << "Unknown command: " << cmd << ". Type 'help' for commands.\n";
    }

    return true;
}

// =============================================================================
// Command Implementations
// =============================================================================

void Emulator::cmd_help() {
    std::cout << "Commands:\n"
              << "  load <file> [addr] Load binary image (default address 0)\n"
              << "  run [max]          Run until halt, breakpoint or max cycles\n"
              << "  step [n]           Execute n cycles (default 1)\n"
              << "  reset              Reset and reload the image\n"
              << "  regs               Show all registers\n"
              << "  reg <name> [val]   Show or set a single register\n"
              << "  flags              Show NZCV flags\n"
              << "  mem <addr> [n]     Show n bytes of memory\n"
              << "  pc [addr]          Show or set PC\n"
              << "  mode <s|p>         Set single-cycle or pipeline mode\n"
              << "  hazards [on|off]   Show hazard status or toggle detection\n"
              << "  forward <on|off>   Toggle forwarding\n"
              << "  trace <on|off>     Toggle pipeline diagram recording\n"
              << "  diagram [cols]     Show the pipeline diagram\n"
              << "  break [addr]       Set or list breakpoints\n"
              << "  clear              Clear all breakpoints\n"
              << "  disasm [addr] [n]  Disassemble instructions\n"
              << "  pipeline           Show pipeline state\n"
              << "  uart [send <text>] Show UART state or inject input\n"
              << "  gpio [in <value>]  Show GPIO state or drive inputs\n"
              << "  map                Show the memory map\n"
              << "  stats              Show statistics\n"
              << "  quit               Exit emulator\n";
}

void Emulator::cmd_run(uint64_t max_cycles) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    uint64_t executed = (mode == Mode::SINGLE_CYCLE) ? cpu.run(max_cycles) : pipeline.run(max_cycles);

    if (is_halted()) {
        std::cout << "Halted at PC=" << to_hex(current_pc()) << " after " << executed << " cycles\n";
    } else if (executed >= max_cycles) {
        std::cout << "Cycle limit reached (" << executed << ")\n";
    } else {
        std::cout << "Breakpoint hit at " << to_hex(current_pc()) << "\n";
    }
    print_instruction(current_pc());
}

void Emulator::cmd_step(uint64_t count) {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    for (uint64_t i = 0; i < count; i++) {
        bool cont;
        if (mode == Mode::SINGLE_CYCLE) {
            cont = cpu.step();
            print_instruction(cpu.get_last_instruction().pc);
        } else {
            cont = pipeline.cycle();
            pipeline.print_state();
        }

        if (!cont) {
            std::cout << (is_halted() ? "Program halted\n" : "Breakpoint hit\n");
            break;
        }
    }
}

void Emulator::cmd_reset() {
    if (!program_loaded) {
        std::cout << "No program loaded\n";
        return;
    }

    restore_image();
    std::cout << "Reset complete\n";
}

void Emulator::cmd_regs() {
    regs.dump();
}

void Emulator::cmd_reg(const std::string& name) {
    int reg = parse_register(name);
    if (reg < 0) {
        std::cout << "Unknown register: " << name << "\n";
        return;
    }
    regs.dump_reg(reg);
}

void Emulator::cmd_set_reg(const std::string& name, Word value) {
    int reg = parse_register(name);
    if (reg < 0) {
        std::cout << "Unknown register: " << name << "\n";
        return;
    }
    if (reg == REG_PC) {
        cmd_set_pc(value);
        return;
    }
    regs.write(reg, value);
    regs.dump_reg(reg);
}

void Emulator::cmd_flags() {
    regs.dump_flags();
}

void Emulator::cmd_mem(Address addr, size_t count) {
    board.bus.dump(addr, count);
}

void Emulator::cmd_pc() {
    Address pc = current_pc();
    std::cout << "PC = " << to_hex(pc) << "\n";
    print_instruction(pc);
}

void Emulator::cmd_set_pc(Address addr) {
    if (mode == Mode::SINGLE_CYCLE) {
        cpu.set_pc(addr);
    } else {
        pipeline.set_pc(addr);
    }
    std::cout << "PC set to " << to_hex(addr & ~3u) << "\n";
}

void Emulator::cmd_mode(const std::string& mode_str) {
    std::string m = mode_str;
    std::transform(m.begin(), m.end(), m.begin(), ::tolower);

    if (m == "single" || m == "s") {
        mode = Mode::SINGLE_CYCLE;
        std::cout << "Mode: single-cycle\n";
    } else if (m == "pipeline" || m == "pipe" || m == "p") {
        mode = Mode::PIPELINE;
        std::cout << "Mode: pipeline\n";
    } else {
        std::cout << "Unknown mode. Use 'single' or 'pipeline'\n";
    }
}

void Emulator::cmd_hazards(const std::string& state) {
    auto on = parse_switch(state);
    if (!on) {
        std::cout << "Use 'on' or 'off'\n";
        return;
    }
    pipeline.set_hazard_detection(*on);
    std::cout << "Hazard detection: " << (*on ? "on" : "off") << "\n";
}

void Emulator::cmd_forward(const std::string& state) {
    auto on = parse_switch(state);
    if (!on) {
        std::cout << "Use 'on' or 'off'\n";
        return;
    }
    pipeline.set_forwarding(*on);
    std::cout << "Forwarding: " << (*on ? "on" : "off") << "\n";
}

void Emulator::cmd_trace(const std::string& state) {
    auto on = parse_switch(state);
    if (!on) {
        std::cout << "Use 'on' or 'off'\n";
        return;
    }
    pipeline.set_trace(*on);
    std::cout << "Trace: " << (*on ? "on" : "off") << "\n";
}

void Emulator::cmd_break(Address addr) {
    addr &= ~3u;
    cpu.add_breakpoint(addr);
    pipeline.add_breakpoint(addr);
    std::cout << "Breakpoint set at " << to_hex(addr) << "\n";
}

void Emulator::cmd_breakpoints() {
    const auto& list = pipeline.get_breakpoints();
    if (list.empty()) {
        std::cout << "No breakpoints (use 'break <addr>' to add)\n";
        return;
    }
    std::cout << "Breakpoints:\n";
    for (Address addr : list) {
        std::cout << "  " << to_hex(addr) << "\n";
    }
}

void Emulator::cmd_clear() {
    cpu.clear_breakpoints();
    pipeline.clear_breakpoints();
    std::cout << "All breakpoints cleared\n";
}

void Emulator::cmd_disasm(Address addr, size_t count) {
    addr &= ~3u;
    std::cout << "Disassembly:\n";
    for (size_t i = 0; i < count; i++) {
        Address pc = addr + static_cast<Address>(i * 4);
        Word raw = board.bus.peek(pc);
        Instruction ins = Decoder::decode(raw, pc);

        std::cout << "  " << to_hex(pc) << ": " << to_hex(raw) << "  " << ins.text
                  << (pc == current_pc() ? "   <- pc" : "") << "\n";
    }
}

void Emulator::cmd_pipeline() {
    if (mode != Mode::PIPELINE) {
        std::cout << "Pipeline view only available in pipeline mode\n";
        return;
    }
    pipeline.print_state();
}

void Emulator::cmd_uart(const std::vector<std::string>& args) {
    UART& uart = board.uart;

    if (args.size() >= 3 && args[1] == "send") {
        // Rejoin the rest of the line; input ends with a newline
        std::string text = args[2];
        for (size_t i = 3; i < args.size(); i++) text += " " + args[i];
        uart.inject(text + "\n");
        std::cout << "Queued " << text.size() + 1 << " bytes\n";
        return;
    }
    if (args.size() >= 2 && args[1] == "clear") {
        uart.clear_output();
        return;
    }

    std::cout << "UART @ " << to_hex(MemoryBus::UART_BASE) << ":\n"
              << "  STATUS = " << to_hex(uart.peek_word(UART::REG_STATUS)) << "\n"
              << "  CTRL   = " << to_hex(uart.get_control()) << "\n"
              << "  BAUD   = " << uart.get_baud() << "\n"
              << "  TX log: \"" << uart.output() << "\"\n";
}

void Emulator::cmd_gpio(const std::vector<std::string>& args) {
    GPIO& gpio = board.gpio;

    if (args.size() >= 3 && args[1] == "in") {
        auto value = parse_number(args[2]);
        if (!value) {
            std::cout << "Invalid number: " << args[2] << "\n";
            return;
        }
        gpio.set_inputs(*value);
    }

    std::cout << "GPIO @ " << to_hex(MemoryBus::GPIO_BASE) << ":\n"
              << "  OUT  = " << to_hex(gpio.get_output()) << "\n"
              << "  IN   = " << to_hex(gpio.peek_word(GPIO::REG_IN)) << "\n"
              << "  DIR  = " << to_hex(gpio.get_direction()) << "\n"
              << "  PINS = " << to_hex(gpio.pins()) << "\n";
}

void Emulator::cmd_stats() {
    std::cout << "Statistics:\n";

    if (mode == Mode::SINGLE_CYCLE) {
        std::cout << "  Mode: single-cycle\n";
        std::cout << "  Cycles: " << cpu.get_cycle_count() << "\n";
        std::cout << "  Instructions: " << cpu.get_instruction_count() << "\n";
        std::cout << "  CPI: 1.0\n";
    } else {
        std::cout << "  Mode: pipeline\n";
        std::cout << "  Cycles: " << pipeline.get_cycle_count() << "\n";
        std::cout << "  Instructions: " << pipeline.get_instruction_count() << "\n";

        uint64_t ins = pipeline.get_instruction_count();
        if (ins > 0) {
            double cpi = static_cast<double>(pipeline.get_cycle_count()) / ins;
            std::cout << "  CPI: " << std::fixed << std::setprecision(2) << cpi << "\n";
            std::cout.unsetf(std::ios::floatfield);
        }

        std::cout << "  Stalls: " << pipeline.get_stall_count() << "\n";
        std::cout << "  Flushes: " << pipeline.get_flush_count() << "\n";
        std::cout << "  Forwards: " << pipeline.get_forward_count() << "\n";
        std::cout << "  Hazard detection: " << (pipeline.get_hazard_detection() ? "on" : "off") << "\n";
        std::cout << "  Forwarding: " << (pipeline.get_forwarding() ? "on" : "off") << "\n";
    }

    std::cout << "  Bus fetches: " << board.bus.get_fetch_count() << "\n";
    std::cout << "  Bus reads: " << board.bus.get_read_count() << "\n";
    std::cout << "  Bus writes: " << board.bus.get_write_count() << "\n";
    std::cout << "  Unmapped accesses: " << board.bus.get_unmapped_count() << "\n";
}

// =============================================================================
// Accessors
// =============================================================================

Board& Emulator::get_board() { return board; }
RegisterFile& Emulator::get_registers() { return regs; }
CPU& Emulator::get_cpu() { return cpu; }
Pipeline& Emulator::get_pipeline() { return pipeline; }
Emulator::Mode Emulator::get_mode() const { return mode; }

// =============================================================================
// Helpers
// =============================================================================

void Emulator::print_welcome() {
    std::cout << "\n";
    std::cout << "ARM7 Pipeline Emulator (5-stage)\n";
    std::cout << "Type 'help' for commands\n";
    std::cout << "\n";
}

void Emulator::print_prompt() {
    std::string mode_str = (mode == Mode::SINGLE_CYCLE) ? "single" : "pipe";
    std::cout << "[" << mode_str << " " << to_hex(current_pc()) << "] > ";
}

void Emulator::print_instruction(Address pc) {
    Instruction ins = Decoder::decode(board.bus.peek(pc), pc);
    std::cout << to_hex(pc) << ": " << ins.text << "\n";
}

Address Emulator::current_pc() const {
    return (mode == Mode::SINGLE_CYCLE) ? cpu.get_pc() : pipeline.get_pc();
}

bool Emulator::is_halted() const {
    return (mode == Mode::SINGLE_CYCLE) ? cpu.is_halted() : pipeline.is_halted();
}

std::optional<Word> Emulator::parse_number(const std::string& str) {
    // Hex with 0x prefix, otherwise decimal
    int base = 10;
    std::string digits = str;
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        base = 16;
        digits = str.substr(2);
    }
    if (digits.empty() || digits[0] == '-' || digits[0] == '+') return std::nullopt;

    try {
        size_t used = 0;
        unsigned long value = std::stoul(digits, &used, base);
        if (used != digits.size() || value > std::numeric_limits<Word>::max()) {
            return std::nullopt;
        }
        return static_cast<Word>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> Emulator::parse_switch(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);

    if (s == "on" || s == "1" || s == "true") return true;
    if (s == "off" || s == "0" || s == "false") return false;
    return std::nullopt;
}

int Emulator::parse_register(const std::string& name) {
    std::string r = name;
    std::transform(r.begin(), r.end(), r.begin(), ::tolower);

    if (r == "sp") return REG_SP;
    if (r == "lr") return REG_LR;
    if (r == "pc") return REG_PC;

    if (r.size() < 2 || r.size() > 3 || r[0] != 'r') return -1;
    if (!std::all_of(r.begin() + 1, r.end(), ::isdigit)) return -1;

    int reg = std::stoi(r.substr(1));
    return (reg < NUM_REGISTERS) ? reg : -1;
}

std::vector<std::string> Emulator::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}
