/*
 *  date:   7 October 2026
 * */

#include "hypergraphify/verifier.h"

#include <algorithm>

namespace hypergraphify {

size_t
get_max_detectors_per_error(const stim::DetectorErrorModel& dem) {
    size_t max_order = 0;
    for (const stim::DemInstruction& inst : dem.instructions) {
        if (inst.type == stim::DemInstructionType::DEM_REPEAT_BLOCK) {
            const stim::DetectorErrorModel& blk = dem.blocks[inst.target_data[1].data];
            max_order = std::max(max_order, get_max_detectors_per_error(blk));
        } else if (inst.type == stim::DemInstructionType::DEM_ERROR) {
            max_order = std::max(max_order, get_detectors(inst).size());
        }
    }
    return max_order;
}

bool
is_graphlike(const stim::DetectorErrorModel& dem) {
    return get_max_detectors_per_error(dem) <= 2;
}

verify_result_t
verify(const stim::DetectorErrorModel& original, const stim::DetectorErrorModel& transformed) {
    verify_result_t res;
    res.original_instructions = original.instructions.size();
    res.transformed_instructions = transformed.instructions.size();
    res.original_non_empty = res.original_instructions > 0;
    res.transformed_non_empty = res.transformed_instructions > 0;
    res.max_detectors_per_error = get_max_detectors_per_error(transformed);

    res.valid = res.original_non_empty
                && res.transformed_non_empty
                && res.max_detectors_per_error <= 2;
    return res;
}

std::ostream&
operator<<(std::ostream& out, const verify_result_t& res) {
    out << "original_non_empty = " << res.original_non_empty
        << ", transformed_non_empty = " << res.transformed_non_empty
        << ", valid = " << res.valid
        << " (instructions: " << res.original_instructions << " -> " << res.transformed_instructions
        << ", max detectors per error = " << res.max_detectors_per_error << ")";
    return out;
}

}   // hypergraphify
