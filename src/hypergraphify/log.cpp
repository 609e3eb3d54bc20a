/*
 *  date:   5 October 2026
 * */

#include "hypergraphify/log.h"

#include <algorithm>

namespace hypergraphify {

std::string
to_string(log_kind_t k) {
    switch (k) {
    case log_kind_t::hyperedge_detected:
        return "hyperedge_detected";
    case log_kind_t::hyperedge_decomposed:
        return "hyperedge_decomposed";
    case log_kind_t::hyperedge_decompose_failed:
        return "hyperedge_decompose_failed";
    }
    return "unknown";
}

log_entry_t
log_entry_t::detected(const hyperedge_t& he) {
    log_entry_t e;
    e.kind = log_kind_t::hyperedge_detected;
    e.instruction_index = he.instruction_index;
    e.detectors = he.detectors;
    e.probability = he.probability;
    return e;
}

log_entry_t
log_entry_t::outcome(size_t instruction_index, const decomposition_result_t& res) {
    log_entry_t e;
    e.kind = res.success ? log_kind_t::hyperedge_decomposed : log_kind_t::hyperedge_decompose_failed;
    e.instruction_index = instruction_index;
    e.detectors = res.original_detectors;
    e.virtual_detectors = res.virtual_detectors;
    e.edges_created = res.edges.size();
    e.probability = res.probability;
    e.edge_probability = res.edge_probability;
    e.failure_reason = res.failure_reason;
    return e;
}

size_t
TransformationLog::count(log_kind_t k) const {
    return std::count_if(entries.begin(), entries.end(),
                [k] (const log_entry_t& e) { return e.kind == k; });
}

std::ostream&
operator<<(std::ostream& out, const log_entry_t& e) {
    out << to_string(e.kind) << " @ " << e.instruction_index << " : D[";
    for (uint64_t d : e.detectors) out << " " << d;
    out << " ], p = " << e.probability;
    if (e.kind == log_kind_t::hyperedge_decomposed) {
        out << ", V[";
        for (uint64_t v : e.virtual_detectors) out << " " << v;
        out << " ], edges = " << e.edges_created << ", q = " << e.edge_probability;
    } else if (e.kind == log_kind_t::hyperedge_decompose_failed) {
        out << ", reason = " << e.failure_reason;
    }
    return out;
}

std::ostream&
operator<<(std::ostream& out, const TransformationLog& log) {
    for (const log_entry_t& e : log) out << e << "\n";
    return out;
}

}   // hypergraphify
