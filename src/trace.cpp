/**
 * trace.cpp
 *
 * Pipeline diagram recorder implementation.
 */

#include "trace.hpp"

PipelineTrace::PipelineTrace(size_t history)
    : history(history > 0 ? history : 1), first(0), last(0) {}

void PipelineTrace::clear() {
    rows.clear();
    first = 0;
    last = 0;
}

void PipelineTrace::record(uint64_t cycle, Address pc, const std::string& text, const std::string& stage) {
    if (rows.empty() || cycle < first) first = cycle;
    bool advanced = rows.empty() || cycle > last;
    if (advanced) last = cycle;

    Row& row = rows[pc];
    row.text = text;
    row.stages[cycle].push_back(stage);

    if (advanced) prune();
}

void PipelineTrace::prune() {
    if (last - first + 1 <= history) return;

    uint64_t cutoff = last - history + 1;
    for (auto it = rows.begin(); it != rows.end();) {
        auto& stages = it->second.stages;
        stages.erase(stages.begin(), stages.lower_bound(cutoff));
        if (stages.empty()) {
            it = rows.erase(it);
        } else {
            ++it;
        }
    }
    first = cutoff;
}

std::string PipelineTrace::join(const std::vector<std::string>& labels) {
    std::string out;
    for (const std::string& label : labels) {
        if (!out.empty()) out += "/";
        out += label;
    }
    return out;
}

std::string PipelineTrace::stage_at(Address pc, uint64_t cycle) const {
    auto row = rows.find(pc);
    if (row == rows.end()) return "-";
    auto cell = row->second.stages.find(cycle);
    return (cell != row->second.stages.end()) ? join(cell->second) : "-";
}

bool PipelineTrace::empty() const {
    return rows.empty();
}

uint64_t PipelineTrace::first_cycle() const {
    return first;
}

uint64_t PipelineTrace::last_cycle() const {
    return last;
}

void PipelineTrace::print(std::ostream& os, size_t max_columns) const {
    if (rows.empty()) {
        os << "Pipeline diagram: (no cycles recorded)\n";
        return;
    }

    uint64_t start = first;
    if (max_columns > 0 && last - first + 1 > max_columns) {
        start = last - max_columns + 1;
    }

    os << "Pipeline Diagram (cycles " << start << "-" << last << "):\n";
    os << std::left << std::setw(12) << "Address" << std::setw(28) << "Instruction";
    for (uint64_t c = start; c <= last; c++) {
        os << ";" << std::setw(6) << std::right << c;
    }
    os << "\n";

    for (const auto& [pc, row] : rows) {
        // Skip rows with nothing in the window
        auto in_window = row.stages.lower_bound(start);
        if (in_window == row.stages.end()) continue;

        os << std::left << std::setw(12) << to_hex(pc)
           << std::setw(28) << row.text.substr(0, 27);
        for (uint64_t c = start; c <= last; c++) {
            auto cell = row.stages.find(c);
            os << ";" << std::setw(6) << std::left
               << (cell != row.stages.end() ? join(cell->second) : "-");
        }
        os << "\n";
    }
    os << std::right;
}
