/**
 * hazard_unit.cpp
 *
 * Hazard detection and forwarding control implementation.
 */

#include "hazard_unit.hpp"
#include "decoder.hpp"

// =============================================================================
// Source Registers
// =============================================================================

bool HazardUnit::reads_register(const Instruction& ins, int reg) {
    // R15 reads come from the fetch address, never from a producer
    if (reg == REG_PC) return false;

    return (ins.uses_rn && ins.rn == reg) ||
           (ins.uses_rm && ins.rm == reg) ||
           (ins.uses_rs && ins.rs == reg) ||
           (ins.uses_rd && ins.rd == reg);
}

// =============================================================================
// Load-Use Hazard Detection
// =============================================================================

bool HazardUnit::detect_load_use(const ID_EX& id_ex, const Instruction& next_ins) {
    // Load-use hazard occurs when:
    // 1. Instruction in ID/EX is a load (condition not yet known)
    // 2. Next instruction reads the load destination
    if (!id_ex.valid) return false;
    if (!id_ex.ins.mem_read) return false;

    return reads_register(next_ins, id_ex.ins.rd);
}

// =============================================================================
// RAW Hazard Detection
// =============================================================================

bool HazardUnit::detect_raw(const Instruction& next_ins, const ID_EX& id_ex, const EX_MEM& ex_mem) {
    if (id_ex.valid && id_ex.ins.reg_write && reads_register(next_ins, id_ex.ins.rd)) {
        return true;
    }

    if (ex_mem.valid && ex_mem.ins.reg_write && reads_register(next_ins, ex_mem.ins.rd)) {
        return true;
    }

    // MEM/WB producers reach decode through the register file write-through
    return false;
}

// =============================================================================
// Forwarding Logic
// =============================================================================

Forward HazardUnit::get_forward(int reg, const EX_MEM& ex_mem, const MEM_WB& mem_wb) {
    if (reg == REG_PC) return Forward::NONE;

    // Priority: EX/MEM > MEM/WB (more recent instruction takes precedence).
    // A load in EX/MEM has no data yet.
    if (ex_mem.valid && ex_mem.ins.reg_write && !ex_mem.ins.mem_read && ex_mem.ins.rd == reg) {
        return Forward::EX_MEM;
    }

    if (mem_wb.valid && mem_wb.ins.reg_write && mem_wb.ins.rd == reg) {
        return Forward::MEM_WB;
    }

    return Forward::NONE;
}

// =============================================================================
// Stall Signal
// =============================================================================

bool HazardUnit::should_stall(const IF_ID& if_id, const ID_EX& id_ex, const EX_MEM& ex_mem,
                              const PipelineConfig& config) {
    if (!config.hazard_detection) return false;
    if (!if_id.valid) return false;

    Instruction next_ins = Decoder::decode(if_id.instruction, if_id.pc);

    if (config.forwarding) {
        return detect_load_use(id_ex, next_ins);
    }
    return detect_raw(next_ins, id_ex, ex_mem);
}

// =============================================================================
// Per-Cycle Decision
// =============================================================================

HazardDecision HazardUnit::evaluate(const IF_ID& if_id, const ID_EX& id_ex,
                                    const EX_MEM& ex_mem, const MEM_WB& mem_wb,
                                    const PipelineConfig& config) {
    HazardDecision d;
    d.stall = should_stall(if_id, id_ex, ex_mem, config);

    if (config.forwarding && id_ex.valid) {
        const Instruction& ins = id_ex.ins;
        if (ins.uses_rn) d.forward_a = get_forward(ins.rn, ex_mem, mem_wb);
        if (ins.uses_rm) d.forward_b = get_forward(ins.rm, ex_mem, mem_wb);
        if (ins.uses_rs) d.forward_s = get_forward(ins.rs, ex_mem, mem_wb);
        if (ins.uses_rd) d.forward_d = get_forward(ins.rd, ex_mem, mem_wb);
    }

    compose(d, false);
    return d;
}

void HazardUnit::compose(HazardDecision& d, bool branch_taken) {
    d.flush = branch_taken;

    d.pc = StageAction::ADVANCE;
    d.if_id = StageAction::ADVANCE;
    d.id_ex = StageAction::ADVANCE;
    d.ex_mem = StageAction::ADVANCE;
    d.mem_wb = StageAction::ADVANCE;

    if (d.flush) {
        // Squash the two younger instructions; PC is redirected
        d.if_id = StageAction::BUBBLE;
        d.id_ex = StageAction::BUBBLE;
    } else if (d.stall) {
        // Hold fetch and decode, bubble into execute
        d.pc = StageAction::HOLD;
        d.if_id = StageAction::HOLD;
        d.id_ex = StageAction::BUBBLE;
    }
}

// =============================================================================
// Debug Output
// =============================================================================

std::string HazardUnit::forward_name(Forward fwd) {
    switch (fwd) {
        case Forward::EX_MEM: return "EX/MEM";
        case Forward::MEM_WB: return "MEM/WB";
        default:              return "none";
    }
}

void HazardUnit::print_status(const IF_ID& if_id, const ID_EX& id_ex,
                              const EX_MEM& ex_mem, const MEM_WB& mem_wb,
                              const PipelineConfig& config) {
    std::cout << "Hazard Unit Status:\n";

    HazardDecision d = evaluate(if_id, id_ex, ex_mem, mem_wb, config);

    if (d.stall) {
        Instruction next_ins = Decoder::decode(if_id.instruction, if_id.pc);
        std::cout << "  " << (config.forwarding ? "LOAD-USE" : "RAW") << " HAZARD: stall required\n";
        std::cout << "    Producer: " << id_ex.ins.text << "\n";
        std::cout << "    Next: " << next_ins.text << "\n";
    }

    if (id_ex.valid) {
        const Instruction& ins = id_ex.ins;
        auto show = [](const char* label, int reg, Forward fwd) {
            if (fwd == Forward::NONE) return;
            std::cout << "  FORWARD " << label << " (" << reg_name(reg) << ") from "
                      << forward_name(fwd) << "\n";
        };
        show("Rn", ins.rn, d.forward_a);
        show("Rm", ins.rm, d.forward_b);
        show("Rs", ins.rs, d.forward_s);
        show("Rd", ins.rd, d.forward_d);
    }

    if (!d.stall && (d.forward_a == Forward::NONE && d.forward_b == Forward::NONE &&
                     d.forward_s == Forward::NONE && d.forward_d == Forward::NONE)) {
        std::cout << "  (no data hazards)\n";
    }
}
