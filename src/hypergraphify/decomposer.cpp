/*
 *  date:   4 October 2026
 * */

#include "hypergraphify/decomposer.h"
#include "hypergraphify/hyperedge.h"

#include <math.h>

namespace hypergraphify {

fp_t
chain_edge_probability(size_t k, fp_t p) {
    if (k < HYPEREDGE_MIN_ORDER) return p;
    if (k == HYPEREDGE_MIN_ORDER) {
        fp_t r = 1 - 2*p;
        if (r < 0) r = 0;
        return 0.5 * (1 - sqrt(r));
    }
    return p / static_cast<fp_t>(k-1);
}

decomposition_result_t
decompose_hyperedge(
        const std::vector<uint64_t>& detectors,
        fp_t probability,
        VirtualDetectorAllocator& alloc)
{
    decomposition_result_t res;
    res.original_detectors = detectors;
    res.probability = probability;

    const size_t k = detectors.size();
    if (k < HYPEREDGE_MIN_ORDER) {
        res.failure_reason = "not a hyper-edge (" + std::to_string(k) + " < "
                                + std::to_string(HYPEREDGE_MIN_ORDER) + " detectors)";
        return res;
    }

    for (size_t i = 0; i < k-2; i++) {
        res.virtual_detectors.push_back(alloc.next());
    }
    // Path d1 - v1 - ... - v_{k-2} - dk.
    std::vector<uint64_t> path;
    path.push_back(detectors.front());
    path.insert(path.end(), res.virtual_detectors.begin(), res.virtual_detectors.end());
    path.push_back(detectors.back());
    for (size_t i = 0; i+1 < path.size(); i++) {
        res.edges.emplace_back(path[i], path[i+1]);
    }

    res.edge_probability = chain_edge_probability(k, probability);
    res.approximate = k > HYPEREDGE_MIN_ORDER;
    res.success = true;
    return res;
}

}   // hypergraphify
