/*
 *  date:   2 October 2026
 * */

#ifndef HYPERGRAPHIFY_EXT_STIM_h
#define HYPERGRAPHIFY_EXT_STIM_h

#include "hypergraphify/defs.h"

#include <stim.h>

#include <vector>

namespace hypergraphify {

// Detector ids of an error instruction, in order of first appearance. The
// components of a decomposed error (separated by ^) are XORed together, so an
// id that appears an even number of times is dropped.
std::vector<uint64_t>   get_detectors(const stim::DemInstruction&);
std::vector<uint64_t>   get_observables(const stim::DemInstruction&);

bool    has_repeat_blocks(const stim::DetectorErrorModel&);

// Returns a copy of the model where every repeat block has been expanded in
// place. shift_detectors instructions are kept as they are.
stim::DetectorErrorModel    unroll_repeat_blocks(const stim::DetectorErrorModel&);

// Computes the largest absolute detector id used by an error or a detector
// declaration. Returns false if the model does not reference any detector.
bool    get_max_detector_id(const stim::DetectorErrorModel&, uint64_t& max_id);

// Walks the top-level instructions of a model without repeat blocks.
//
// FUNC should take in (1) the instruction, (2) its index in the model, and
// (3) the detector offset that applies to its targets.
template <class FUNC>
void    for_each_instruction(const stim::DetectorErrorModel&, FUNC);

// The detectors passed to these functions are absolute ids. They are written
// relative to detector_offset.
void    append_error(
            stim::DetectorErrorModel&,
            fp_t probability,
            const std::vector<uint64_t>& detectors,
            const std::vector<uint64_t>& observables,
            uint64_t detector_offset=0);
void    append_detector(stim::DetectorErrorModel&, uint64_t detector, uint64_t detector_offset=0);

}   // hypergraphify

#include "stim.inl"

#endif  // HYPERGRAPHIFY_EXT_STIM_h
