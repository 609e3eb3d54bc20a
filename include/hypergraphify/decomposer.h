/*
 *  date:   4 October 2026
 * */

#ifndef HYPERGRAPHIFY_DECOMPOSER_h
#define HYPERGRAPHIFY_DECOMPOSER_h

#include "hypergraphify/allocator.h"

#include <string>
#include <utility>
#include <vector>

namespace hypergraphify {

typedef std::pair<uint64_t, uint64_t> chain_edge_t;

struct decomposition_result_t {
    bool success = false;

    std::vector<uint64_t>       original_detectors;
    std::vector<chain_edge_t>   edges;
    std::vector<uint64_t>       virtual_detectors;  // In allocation order.

    fp_t probability = 0.0;
    fp_t edge_probability = 0.0;
    // The edge probability is only exact for three detectors.
    bool approximate = false;

    std::string failure_reason;
};

// Probability assigned to every edge of a chain made for an error on k
// detectors with probability p:
//  (1) k == 3: q solves 2q(1-q) = p, so exactly one of the two edges fires
//      with probability p. The radicand is clamped at 0 for p > 1/2.
//  (2) k > 3:  q = p/(k-1).
// For k < 3, p is returned as is.
fp_t    chain_edge_probability(size_t k, fp_t p);

// Splits an error on k >= 3 detectors into k-1 edges using k-2 virtual
// detectors from the allocator. The edges form a path from the first to the
// last detector through the virtual detectors:
//
//      (d1, v1), (v1, v2), ..., (v_{k-3}, v_{k-2}), (v_{k-2}, dk)
//
// Calling this with fewer than three detectors does not touch the allocator and
// returns a failed result.
decomposition_result_t  decompose_hyperedge(
                            const std::vector<uint64_t>& detectors,
                            fp_t probability,
                            VirtualDetectorAllocator&);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_DECOMPOSER_h
