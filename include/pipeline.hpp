/**
 * pipeline.hpp
 *
 * 5-stage pipelined CPU implementation.
 * Stages: IF -> ID -> EX -> MEM -> WB
 *
 * Every stage computes its output from the registers latched at the
 * start of the cycle; all new values are committed together at the end
 * of step(). Branches resolve in EX and squash the two younger
 * instructions.
 */

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "common.hpp"
#include "memory_bus.hpp"
#include "register_file.hpp"
#include "decoder.hpp"
#include "execute_unit.hpp"
#include "hazard_unit.hpp"
#include "trace.hpp"

// Full architectural + pipeline state after a cycle
struct PipelineSnapshot {
    uint64_t cycle = 0;
    Address pc = 0;
    Flags flags;
    std::array<Word, NUM_REGISTERS> regs{};
    IF_ID if_id;
    ID_EX id_ex;
    EX_MEM ex_mem;
    MEM_WB mem_wb;
};

class Pipeline {
public:
    static constexpr uint64_t DEFAULT_MAX_CYCLES = 1000000;

    Pipeline(MemoryBus& bus, RegisterFile& regs);
    void reset();

    // One rising clock edge
    void step();

    // Step once; false when halted or at a breakpoint
    bool cycle();

    // Run until halt, breakpoint or cycle limit; returns cycles executed
    uint64_t run(uint64_t max_cycles = DEFAULT_MAX_CYCLES);

    // Control toggles
    void set_config(const PipelineConfig& cfg);
    const PipelineConfig& get_config() const;
    void set_hazard_detection(bool enabled);
    void set_forwarding(bool enabled);
    void set_trace(bool enabled);
    bool get_hazard_detection() const;
    bool get_forwarding() const;
    bool get_trace_enabled() const;

    // State access
    Address get_pc() const;
    void set_pc(Address addr);     // squashes IF/ID and ID/EX
    const Flags& get_flags() const;
    uint64_t get_cycle_count() const;
    uint64_t get_instruction_count() const;
    bool is_halted() const;
    bool is_stalled() const;

    // Pipeline register access (for display)
    const IF_ID& get_if_id() const;
    const ID_EX& get_id_ex() const;
    const EX_MEM& get_ex_mem() const;
    const MEM_WB& get_mem_wb() const;
    const HazardDecision& get_last_decision() const;
    PipelineSnapshot snapshot() const;

    // Display pipeline state
    void print_state() const;
    void print_diagram(size_t max_columns = 32) const;
    const PipelineTrace& get_trace() const;

    // Breakpoints
    void add_breakpoint(Address addr);
    void remove_breakpoint(Address addr);
    void clear_breakpoints();
    bool has_breakpoint(Address addr) const;
    const std::vector<Address>& get_breakpoints() const;

    // Statistics
    uint64_t get_stall_count() const;
    uint64_t get_flush_count() const;
    uint64_t get_forward_count() const;

private:
    MemoryBus& bus;
    RegisterFile& regs;

    // Pipeline registers
    IF_ID if_id;
    ID_EX id_ex;
    EX_MEM ex_mem;
    MEM_WB mem_wb;

    // PC of the next fetch
    Address pc;

    // Control
    PipelineConfig config;
    bool halted;
    bool stalled;
    HazardDecision last_decision;

    // Statistics
    uint64_t cycles;
    uint64_t instructions;
    uint64_t stalls;
    uint64_t flushes;
    uint64_t forwards;

    std::vector<Address> breakpoints;
    PipelineTrace trace;

    // Stage implementations (read latched state, return the next latch)
    void stage_wb();
    MEM_WB stage_mem(const EX_MEM& in);
    EX_MEM stage_ex(const ID_EX& in, const HazardDecision& d);
    ID_EX stage_id(const IF_ID& in);
    IF_ID stage_if(Address fetch_pc);

    // Operand helpers
    Word read_operand(int reg, Address ins_pc) const;
    Word get_forwarded_value(Forward fwd, Word reg_val) const;

    void record_trace(const MEM_WB& retired, const HazardDecision& d);
};

#endif // PIPELINE_HPP
