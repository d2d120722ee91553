/**
 * pipeline.cpp
 *
 * 5-stage pipelined CPU implementation.
 */

#include "pipeline.hpp"
#include <algorithm>

Pipeline::Pipeline(MemoryBus& bus, RegisterFile& regs)
    : bus(bus), regs(regs), pc(RESET_VECTOR), halted(false), stalled(false),
      cycles(0), instructions(0), stalls(0), flushes(0), forwards(0) {}

void Pipeline::reset() {
    pc = RESET_VECTOR;
    halted = false;
    stalled = false;
    last_decision = HazardDecision();
    cycles = 0;
    instructions = 0;
    stalls = 0;
    flushes = 0;
    forwards = 0;

    if_id.flush();
    id_ex.flush();
    ex_mem.flush();
    mem_wb.flush();

    trace.clear();
    regs.reset();
}

// Latch update for one pipeline register at the clock edge
template <typename Latch>
static void apply_action(Latch& reg, const Latch& next, StageAction action) {
    switch (action) {
        case StageAction::ADVANCE: reg = next; break;
        case StageAction::BUBBLE:  reg.flush(); break;
        case StageAction::HOLD:    break;
    }
}

// =============================================================================
// Operand Helpers
// =============================================================================

Word Pipeline::read_operand(int reg, Address ins_pc) const {
    // R15 reads as the instruction address + 8
    if (reg == REG_PC) return ins_pc + 8;
    return regs.read_forwarded(reg);
}

Word Pipeline::get_forwarded_value(Forward fwd, Word reg_val) const {
    switch (fwd) {
        case Forward::EX_MEM:
            return ex_mem.alu_result;
        case Forward::MEM_WB:
            return mem_wb.result();
        default:
            return reg_val;
    }
}

// =============================================================================
// IF Stage
// =============================================================================

IF_ID Pipeline::stage_if(Address fetch_pc) {
    IF_ID out;
    out.instruction = bus.fetch(fetch_pc);
    out.pc = fetch_pc;
    out.next_pc = fetch_pc + 4;
    out.valid = true;
    return out;
}

// =============================================================================
// ID Stage
// =============================================================================

ID_EX Pipeline::stage_id(const IF_ID& in) {
    ID_EX out;
    if (!in.valid) return out;

    Instruction ins = Decoder::decode(in.instruction, in.pc);

    out.ins = ins;
    out.rn_val = read_operand(ins.rn, in.pc);
    out.rm_val = read_operand(ins.rm, in.pc);
    out.rs_val = read_operand(ins.rs, in.pc);
    out.rd_val = read_operand(ins.rd, in.pc);
    out.pc = in.pc;
    out.next_pc = in.next_pc;
    out.valid = true;
    return out;
}

// =============================================================================
// EX Stage
// =============================================================================

EX_MEM Pipeline::stage_ex(const ID_EX& in, const HazardDecision& d) {
    EX_MEM out;
    if (!in.valid) return out;

    const Flags& flags = regs.get_flags();

    // Condition resolves here, against flags from every older instruction
    Instruction ins = in.ins;
    Decoder::apply_condition(ins, flags);

    Operands ops;
    ops.rn = get_forwarded_value(d.forward_a, in.rn_val);
    ops.rm = get_forwarded_value(d.forward_b, in.rm_val);
    ops.rs = get_forwarded_value(d.forward_s, in.rs_val);
    ops.rd = get_forwarded_value(d.forward_d, in.rd_val);

    for (Forward f : {d.forward_a, d.forward_b, d.forward_s, d.forward_d}) {
        if (f != Forward::NONE) forwards++;
    }

    ExecResult r = ExecuteUnit::execute(ins, ops, flags);
    if (ins.set_flags) {
        regs.stage_flags(r.flags);
    }

    out.ins = ins;
    out.alu_result = r.result;
    out.store_val = r.store_val;
    out.branch_target = r.branch_target;
    out.branch_taken = r.branch_taken;
    out.valid = true;
    return out;
}

// =============================================================================
// MEM Stage
// =============================================================================

MEM_WB Pipeline::stage_mem(const EX_MEM& in) {
    MEM_WB out;
    if (!in.valid) return out;

    out.ins = in.ins;
    out.alu_result = in.alu_result;
    out.mem_data = ExecuteUnit::memory_access(bus, in.ins, in.alu_result, in.store_val);
    out.valid = true;
    return out;
}

// =============================================================================
// WB Stage
// =============================================================================

void Pipeline::stage_wb() {
    if (!mem_wb.valid) return;

    const Instruction& ins = mem_wb.ins;
    instructions++;

    if (ins.reg_write) {
        regs.stage_write(ins.rd, mem_wb.result());
    }

    // Firmware signals completion by looping on "B ."
    if (ins.is_self_branch()) {
        halted = true;
    }
}

// =============================================================================
// Cycle
// =============================================================================

void Pipeline::step() {
    // Forwarding and stall decisions from the latched registers
    HazardDecision d = HazardUnit::evaluate(if_id, id_ex, ex_mem, mem_wb, config);

    MEM_WB retired = mem_wb;

    // Later stages first; nothing below writes a pipeline register
    stage_wb();
    MEM_WB next_mem_wb = stage_mem(ex_mem);
    EX_MEM next_ex_mem = stage_ex(id_ex, d);

    HazardUnit::compose(d, next_ex_mem.valid && next_ex_mem.branch_taken);

    ID_EX next_id_ex = stage_id(if_id);

    // Wrong-path fetches still reach the bus before being squashed
    IF_ID next_if_id;
    if (d.if_id != StageAction::HOLD) {
        next_if_id = stage_if(pc);
    }

    Address next_pc = pc;
    if (d.flush) {
        next_pc = next_ex_mem.branch_target;
    } else if (d.pc == StageAction::ADVANCE) {
        next_pc = pc + 4;
    }

    // Clock edge: commit everything at once
    regs.commit();
    apply_action(mem_wb, next_mem_wb, d.mem_wb);
    apply_action(ex_mem, next_ex_mem, d.ex_mem);
    apply_action(id_ex, next_id_ex, d.id_ex);
    apply_action(if_id, next_if_id, d.if_id);
    pc = next_pc;

    cycles++;
    stalled = d.if_id == StageAction::HOLD;
    if (stalled) stalls++;
    if (d.flush) flushes += 2;
    last_decision = d;

    if (config.trace) {
        record_trace(retired, d);
    }
}

bool Pipeline::cycle() {
    if (halted) return false;

    step();

    if (halted) return false;

    // Check breakpoint
    if (has_breakpoint(pc)) {
        return false;
    }

    return true;
}

// =============================================================================
// Run
// =============================================================================

uint64_t Pipeline::run(uint64_t max_cycles) {
    uint64_t executed = 0;
    while (executed < max_cycles) {
        if (halted) break;
        executed++;
        if (!cycle()) break;
    }
    return executed;
}

// =============================================================================
// Trace
// =============================================================================

void Pipeline::record_trace(const MEM_WB& retired, const HazardDecision& d) {
    auto text_at = [this](Address addr) {
        return Decoder::decode(bus.peek(addr), addr).text;
    };

    if (if_id.valid) {
        trace.record(cycles, if_id.pc, text_at(if_id.pc),
                     d.if_id == StageAction::HOLD ? "st" : "IF");
    }
    if (id_ex.valid) trace.record(cycles, id_ex.pc, id_ex.ins.text, "ID");
    if (ex_mem.valid) trace.record(cycles, ex_mem.ins.pc, ex_mem.ins.text, "EX");
    if (mem_wb.valid) trace.record(cycles, mem_wb.ins.pc, mem_wb.ins.text, "MEM");
    if (retired.valid) trace.record(cycles, retired.ins.pc, retired.ins.text, "WB");
}

// =============================================================================
// Control
// =============================================================================

void Pipeline::set_config(const PipelineConfig& cfg) { config = cfg; }
const PipelineConfig& Pipeline::get_config() const { return config; }
void Pipeline::set_hazard_detection(bool enabled) { config.hazard_detection = enabled; }
void Pipeline::set_forwarding(bool enabled) { config.forwarding = enabled; }
void Pipeline::set_trace(bool enabled) { config.trace = enabled; }
bool Pipeline::get_hazard_detection() const { return config.hazard_detection; }
bool Pipeline::get_forwarding() const { return config.forwarding; }
bool Pipeline::get_trace_enabled() const { return config.trace; }

// =============================================================================
// State Access
// =============================================================================

Address Pipeline::get_pc() const { return pc; }

// Redirecting fetch squashes the two instructions already fetched on the old path
void Pipeline::set_pc(Address addr) {
    pc = addr & ~3u;
    if_id.flush();
    id_ex.flush();
}

const Flags& Pipeline::get_flags() const { return regs.get_flags(); }
uint64_t Pipeline::get_cycle_count() const { return cycles; }
uint64_t Pipeline::get_instruction_count() const { return instructions; }
bool Pipeline::is_halted() const { return halted; }
bool Pipeline::is_stalled() const { return stalled; }

const IF_ID& Pipeline::get_if_id() const { return if_id; }
const ID_EX& Pipeline::get_id_ex() const { return id_ex; }
const EX_MEM& Pipeline::get_ex_mem() const { return ex_mem; }
const MEM_WB& Pipeline::get_mem_wb() const { return mem_wb; }
const HazardDecision& Pipeline::get_last_decision() const { return last_decision; }
const PipelineTrace& Pipeline::get_trace() const { return trace; }

PipelineSnapshot Pipeline::snapshot() const {
    PipelineSnapshot s;
    s.cycle = cycles;
    s.pc = pc;
    s.flags = regs.get_flags();
    s.regs = regs.get_all();
    s.if_id = if_id;
    s.id_ex = id_ex;
    s.ex_mem = ex_mem;
    s.mem_wb = mem_wb;
    return s;
}

// =============================================================================
// Display
// =============================================================================

void Pipeline::print_state() const {
    std::cout << "Cycle " << cycles << ":  PC=" << to_hex(pc)
              << "  Flags=" << flags_string(regs.get_flags())
              << (stalled ? "  [stall]" : "")
              << (last_decision.flush ? "  [flush]" : "") << "\n";

    auto print_stage = [](const char* name, bool valid, Address addr, const std::string& text) {
        std::cout << "  " << name << ": ";
        if (valid) {
            std::cout << "[" << to_hex(addr) << "] " << text << "\n";
        } else {
            std::cout << "(bubble)\n";
        }
    };

    print_stage("IF ", if_id.valid, if_id.pc,
                if_id.valid ? Decoder::decode(if_id.instruction, if_id.pc).text : "");
    print_stage("ID ", id_ex.valid, id_ex.pc, id_ex.ins.text);
    print_stage("EX ", ex_mem.valid, ex_mem.ins.pc, ex_mem.ins.text);
    print_stage("MEM", mem_wb.valid, mem_wb.ins.pc, mem_wb.ins.text);

    std::cout << "  WB : ";
    if (mem_wb.valid && mem_wb.ins.reg_write) {
        std::cout << reg_name(mem_wb.ins.rd) << " <- " << to_hex(mem_wb.result()) << "\n";
    } else {
        std::cout << "(none)\n";
    }
}

void Pipeline::print_diagram(size_t max_columns) const {
    if (!config.trace && trace.empty()) {
        std::cout << "Tracing is off (use 'trace on')\n";
        return;
    }
    trace.print(std::cout, max_columns);
}

// =============================================================================
// Breakpoints
// =============================================================================

void Pipeline::add_breakpoint(Address addr) {
    if (!has_breakpoint(addr)) breakpoints.push_back(addr);
}

void Pipeline::remove_breakpoint(Address addr) {
    breakpoints.erase(std::remove(breakpoints.begin(), breakpoints.end(), addr), breakpoints.end());
}

void Pipeline::clear_breakpoints() { breakpoints.clear(); }

bool Pipeline::has_breakpoint(Address addr) const {
    return std::find(breakpoints.begin(), breakpoints.end(), addr) != breakpoints.end();
}

const std::vector<Address>& Pipeline::get_breakpoints() const { return breakpoints; }

// =============================================================================
// Statistics
// =============================================================================

uint64_t Pipeline::get_stall_count() const { return stalls; }
uint64_t Pipeline::get_flush_count() const { return flushes; }
uint64_t Pipeline::get_forward_count() const { return forwards; }
