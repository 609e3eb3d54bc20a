/*
 *  date:   3 October 2026
 * */

#include "hypergraphify/hyperedge.h"

#include <sstream>

namespace hypergraphify {

std::vector<hyperedge_t>
detect_hyperedges(const stim::DetectorErrorModel& dem) {
    if (has_repeat_blocks(dem)) {
        return detect_hyperedges(unroll_repeat_blocks(dem));
    }

    std::vector<hyperedge_t> hyperedges;
    for_each_instruction(dem,
        [&] (const stim::DemInstruction& inst, size_t idx, uint64_t detector_offset)
        {
            if (inst.type != stim::DemInstructionType::DEM_ERROR) return;
            std::vector<uint64_t> detectors = get_detectors(inst);
            if (detectors.size() < HYPEREDGE_MIN_ORDER) return;
            for (uint64_t& d : detectors) d += detector_offset;

            hyperedge_t he;
            he.instruction_index = idx;
            he.detectors = std::move(detectors);
            he.observables = get_observables(inst);
            he.probability = inst.arg_data.empty() ? 0.0 : static_cast<fp_t>(inst.arg_data[0]);
            hyperedges.push_back(std::move(he));
        });
    return hyperedges;
}

std::string
print_he(const hyperedge_t& he) {
    std::ostringstream out;
    out << "[";
    for (uint64_t d : he.detectors) out << " D" << d;
    for (uint64_t o : he.observables) out << " L" << o;
    out << " ]";
    return out.str();
}

}   // hypergraphify
