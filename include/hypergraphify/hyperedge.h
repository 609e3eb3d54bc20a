/*
 *  date:   3 October 2026
 * */

#ifndef HYPERGRAPHIFY_HYPEREDGE_h
#define HYPERGRAPHIFY_HYPEREDGE_h

#include "hypergraphify/ext/stim.h"

#include <string>
#include <vector>

namespace hypergraphify {

// Errors with at least this many detectors cannot be matched directly.
const size_t HYPEREDGE_MIN_ORDER = 3;

struct hyperedge_t {
    size_t                  instruction_index;
    std::vector<uint64_t>   detectors;      // Absolute detector ids.
    std::vector<uint64_t>   observables;
    fp_t                    probability;

    size_t  get_order(void) const;
};

bool    is_hyperedge(const stim::DemInstruction&);

// Scans the model in order and returns every error with HYPEREDGE_MIN_ORDER or
// more detectors. If the model has repeat blocks, the instruction indices refer
// to the model returned by unroll_repeat_blocks.
std::vector<hyperedge_t>    detect_hyperedges(const stim::DetectorErrorModel&);

std::string print_he(const hyperedge_t&);

}   // hypergraphify

#include "hyperedge.inl"

#endif  // HYPERGRAPHIFY_HYPEREDGE_h
