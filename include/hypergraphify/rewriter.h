/*
 *  date:   6 October 2026
 * */

#ifndef HYPERGRAPHIFY_REWRITER_h
#define HYPERGRAPHIFY_REWRITER_h

#include "hypergraphify/decomposer.h"
#include "hypergraphify/log.h"

#include <map>

namespace hypergraphify {

// Builds the output model in a single pass over the input. The results are
// keyed by instruction index, as returned by detect_hyperedges. A decomposed
// error is replaced in place by its chain, and its observables go on the first
// edge. An error whose decomposition failed is copied unchanged. Every other
// instruction is copied unchanged.
//
// One log entry is appended per result. If declare_virtual_detectors is set, a
// detector declaration for each virtual detector follows its chain.
stim::DetectorErrorModel    rewrite(
                                const stim::DetectorErrorModel&,
                                const std::map<size_t, decomposition_result_t>&,
                                TransformationLog&,
                                bool declare_virtual_detectors=false,
                                bool verbose=false);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_REWRITER_h
