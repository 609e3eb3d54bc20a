/*
 *  date:   8 October 2026
 * */

#ifndef HYPERGRAPHIFY_TRANSFORM_h
#define HYPERGRAPHIFY_TRANSFORM_h

#include "hypergraphify/ext/pymatching.h"
#include "hypergraphify/log.h"

namespace hypergraphify {

struct transform_config_t {
    bool verbose = false;
    bool declare_virtual_detectors = false;
    bool check_matching = false;    // Load the output into PyMatching.
};

struct transform_stats_t {
    size_t hyperedges_detected = 0;
    size_t hyperedges_decomposed = 0;
    size_t hyperedges_failed = 0;
    size_t virtual_detectors = 0;
    size_t edges_created = 0;

    fp_t time_ns = 0.0;
};

struct transform_result_t {
    stim::DetectorErrorModel    dem;
    TransformationLog           log;
    transform_stats_t           stats;
    matching_check_t            matching;
};

// Replaces every hyper-edge of the model by a chain of graphlike edges. Each
// call owns its allocator and log, so calls on different models are
// independent. A model without hyper-edges is returned as is.
transform_result_t  transform(const stim::DetectorErrorModel&, transform_config_t=transform_config_t());

}   // hypergraphify

#endif  // HYPERGRAPHIFY_TRANSFORM_h
