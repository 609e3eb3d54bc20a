/*
 *  date:   7 October 2026
 * */

#ifndef HYPERGRAPHIFY_VERIFIER_h
#define HYPERGRAPHIFY_VERIFIER_h

#include "hypergraphify/ext/stim.h"

#include <iostream>

namespace hypergraphify {

struct verify_result_t {
    bool original_non_empty = false;
    bool transformed_non_empty = false;
    bool valid = false;

    size_t  original_instructions = 0;
    size_t  transformed_instructions = 0;
    size_t  max_detectors_per_error = 0;    // Over the transformed model.
};

// Structural check of a transformation: both models must have at least one
// instruction, and every error in the transformed model must have at most two
// detectors. Neither model is modified.
verify_result_t verify(const stim::DetectorErrorModel& original, const stim::DetectorErrorModel& transformed);

// Largest number of detectors in any error of the model, repeat blocks included.
size_t  get_max_detectors_per_error(const stim::DetectorErrorModel&);
bool    is_graphlike(const stim::DetectorErrorModel&);

std::ostream&   operator<<(std::ostream&, const verify_result_t&);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_VERIFIER_h
