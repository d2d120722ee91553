/**
 * trace.hpp
 *
 * Pipeline diagram recorder.
 * One row per instruction address, one column per cycle; each cell
 * names the stage the instruction completed in that cycle. Loops shorter
 * than the pipeline put several copies of one address in flight, so a
 * cell can hold more than one label ("IF/WB").
 * Only the most recent cycles are kept.
 */

#ifndef TRACE_HPP
#define TRACE_HPP

#include "common.hpp"

class PipelineTrace {
public:
    static constexpr size_t DEFAULT_HISTORY = 256;

    explicit PipelineTrace(size_t history = DEFAULT_HISTORY);
    void clear();

    // Mark the stage an instruction occupied in a cycle
    void record(uint64_t cycle, Address pc, const std::string& text, const std::string& stage);

    // Stage labels at (pc, cycle) joined with '/', "-" if none
    std::string stage_at(Address pc, uint64_t cycle) const;

    bool empty() const;
    uint64_t first_cycle() const;
    uint64_t last_cycle() const;

    // Print the diagram, at most max_columns cycles ending at the last one
    void print(std::ostream& os = std::cout, size_t max_columns = 32) const;

private:
    struct Row {
        std::string text;
        std::map<uint64_t, std::vector<std::string>> stages;
    };

    std::map<Address, Row> rows;
    size_t history;
    uint64_t first;
    uint64_t last;

    // Drop cells older than the history window
    void prune();

    static std::string join(const std::vector<std::string>& labels);
};

#endif // TRACE_HPP
