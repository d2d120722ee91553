/**
 * emulator.hpp
 *
 * Top-level emulator controller.
 * Ties together the board, both CPU models and handles user commands.
 */

#ifndef EMULATOR_HPP
#define EMULATOR_HPP

#include "common.hpp"
#include "board.hpp"
#include "register_file.hpp"
#include "cpu.hpp"
#include "pipeline.hpp"

class Emulator {
public:
    enum class Mode {
        SINGLE_CYCLE,
        PIPELINE
    };

    Emulator();

    // Load a raw little-endian binary image
    bool load(const std::string& filename, Address addr = RESET_VECTOR);

    // Load an image already in memory
    void load_image(const std::vector<Word>& words, Address addr = RESET_VECTOR);

    // Run the command loop
    void run();

    // Execute a single command, returns false to quit
    bool execute_command(const std::string& input);

    // Component access
    Board& get_board();
    RegisterFile& get_registers();
    CPU& get_cpu();
    Pipeline& get_pipeline();
    Mode get_mode() const;

private:
    Board board;
    RegisterFile regs;
    CPU cpu;
    Pipeline pipeline;

    // Loaded image, restored on reset
    std::vector<Byte> image;
    Address image_addr;

    Mode mode;
    bool running;
    bool program_loaded;

    // Command handlers
    void cmd_help();
    void cmd_run(uint64_t max_cycles);
    void cmd_step(uint64_t count);
    void cmd_reset();
    void cmd_regs();
    void cmd_reg(const std::string& name);
    void cmd_set_reg(const std::string& name, Word value);
    void cmd_flags();
    void cmd_mem(Address addr, size_t count);
    void cmd_pc();
    void cmd_set_pc(Address addr);
    void cmd_mode(const std::string& mode_str);
    void cmd_hazards(const std::string& state);
    void cmd_forward(const std::string& state);
    void cmd_trace(const std::string& state);
    void cmd_break(Address addr);
    void cmd_breakpoints();
    void cmd_clear();
    void cmd_disasm(Address addr, size_t count);
    void cmd_pipeline();
    void cmd_uart(const std::vector<std::string>& args);
    void cmd_gpio(const std::vector<std::string>& args);
    void cmd_stats();

    // Helpers
    void restore_image();
    void print_welcome();
    void print_prompt();
    void print_instruction(Address pc);
    Address current_pc() const;
    bool is_halted() const;
    static std::optional<Word> parse_number(const std::string& str);
    static std::optional<bool> parse_switch(const std::string& str);
    static int parse_register(const std::string& name);
    std::vector<std::string> tokenize(const std::string& input);
};

#endif // EMULATOR_HPP
