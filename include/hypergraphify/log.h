/*
 *  date:   5 October 2026
 * */

#ifndef HYPERGRAPHIFY_LOG_h
#define HYPERGRAPHIFY_LOG_h

#include "hypergraphify/decomposer.h"
#include "hypergraphify/hyperedge.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace hypergraphify {

enum class log_kind_t { hyperedge_detected, hyperedge_decomposed, hyperedge_decompose_failed };

std::string to_string(log_kind_t);

struct log_entry_t {
    log_kind_t  kind;
    size_t      instruction_index;

    std::vector<uint64_t>   detectors;
    std::vector<uint64_t>   virtual_detectors;
    size_t                  edges_created = 0;

    fp_t probability = 0.0;
    fp_t edge_probability = 0.0;

    std::string failure_reason;

    static log_entry_t  detected(const hyperedge_t&);
    static log_entry_t  outcome(size_t instruction_index, const decomposition_result_t&);
};

// Record of the decisions made during one transformation. Entries are only
// ever appended, and nothing in the pipeline reads them back.
class TransformationLog {
public:
    void    append(log_entry_t);

    const std::vector<log_entry_t>& get_entries(void) const;

    size_t  size(void) const;
    size_t  count(log_kind_t) const;

    std::vector<log_entry_t>::const_iterator begin(void) const;
    std::vector<log_entry_t>::const_iterator end(void) const;
private:
    std::vector<log_entry_t> entries;
};

std::ostream&   operator<<(std::ostream&, const log_entry_t&);
std::ostream&   operator<<(std::ostream&, const TransformationLog&);

}   // hypergraphify

#include "log.inl"

#endif  // HYPERGRAPHIFY_LOG_h
