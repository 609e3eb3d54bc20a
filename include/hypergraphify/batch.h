/*
 *  date:   10 October 2026
 *
 *  Transforms a folder of models, split across MPI ranks.
 * */

#ifndef HYPERGRAPHIFY_BATCH_h
#define HYPERGRAPHIFY_BATCH_h

#include "hypergraphify/transform.h"
#include "hypergraphify/verifier.h"

#include <string>
#include <vector>

namespace hypergraphify {

extern bool G_USE_MPI;  // Default is true.

struct batch_result_t {
    uint64_t models = 0;
    uint64_t hyperedges_detected = 0;
    uint64_t hyperedges_decomposed = 0;
    uint64_t hyperedges_failed = 0;
    uint64_t virtual_detectors = 0;
    uint64_t invalid_models = 0;    // Models that failed verification.
    uint64_t unmatchable_models = 0;    // Outputs PyMatching refused (check_matching only).
    uint64_t errors = 0;            // Files that could not be read or written.
};

// Adds the counts of one transformed model to the batch.
void    record_model(batch_result_t&, const transform_result_t&, const verify_result_t&);

// Sorted list of the *.dem files in a folder.
std::vector<std::string>    list_models(std::string input_folder);

// Rank r handles files r, r + world_size, ... The counts are summed over all
// ranks, so every rank returns the same result.
batch_result_t  transform_folder(std::string input_folder, std::string output_folder, transform_config_t);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_BATCH_h
