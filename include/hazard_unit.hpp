/**
 * hazard_unit.hpp
 *
 * Hazard detection and forwarding control unit.
 * Detects data hazards and control hazards.
 * Determines forwarding paths, stall signals and the per-stage
 * advance / hold / bubble action for one cycle.
 */

#ifndef HAZARD_UNIT_HPP
#define HAZARD_UNIT_HPP

#include "common.hpp"

struct PipelineConfig {
    bool forwarding = true;         // Bypass EX/MEM and MEM/WB results into EX
    bool hazard_detection = true;   // Insert stalls for unresolvable hazards
    bool trace = false;             // Record the pipeline diagram
};

struct HazardDecision {
    bool stall = false;
    bool flush = false;

    Forward forward_a = Forward::NONE;     // Rn
    Forward forward_b = Forward::NONE;     // Rm
    Forward forward_s = Forward::NONE;     // Rs
    Forward forward_d = Forward::NONE;     // Rd (store data)

    StageAction pc = StageAction::ADVANCE;
    StageAction if_id = StageAction::ADVANCE;
    StageAction id_ex = StageAction::ADVANCE;
    StageAction ex_mem = StageAction::ADVANCE;
    StageAction mem_wb = StageAction::ADVANCE;
};

class HazardUnit {
public:
    // Does the instruction read this register as a source?
    static bool reads_register(const Instruction& ins, int reg);

    // Detect load-use hazard (requires stall)
    static bool detect_load_use(const ID_EX& id_ex, const Instruction& next_ins);

    // Detect RAW hazard on an in-flight producer (stall when not forwarding)
    static bool detect_raw(const Instruction& next_ins, const ID_EX& id_ex, const EX_MEM& ex_mem);

    // Determine forwarding source for one source register
    static Forward get_forward(int reg, const EX_MEM& ex_mem, const MEM_WB& mem_wb);

    // Get stall signal
    static bool should_stall(const IF_ID& if_id, const ID_EX& id_ex, const EX_MEM& ex_mem,
                             const PipelineConfig& config);

    // Forwarding and stall decisions from the latched pipeline registers
    static HazardDecision evaluate(const IF_ID& if_id, const ID_EX& id_ex,
                                   const EX_MEM& ex_mem, const MEM_WB& mem_wb,
                                   const PipelineConfig& config);

    // Fold in the branch resolved this cycle and compute stage actions
    static void compose(HazardDecision& decision, bool branch_taken);

    // Print hazard status (for debugging)
    static void print_status(const IF_ID& if_id, const ID_EX& id_ex,
                             const EX_MEM& ex_mem, const MEM_WB& mem_wb,
                             const PipelineConfig& config);

    static std::string forward_name(Forward fwd);
};

#endif // HAZARD_UNIT_HPP
