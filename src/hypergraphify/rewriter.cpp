/*
 *  date:   6 October 2026
 * */

#include "hypergraphify/rewriter.h"

#include <iostream>
#include <stdexcept>

namespace hypergraphify {

static void
append_chain(
        stim::DetectorErrorModel& out,
        const decomposition_result_t& res,
        const std::vector<uint64_t>& observables,
        uint64_t detector_offset,
        bool declare_virtual_detectors)
{
    for (size_t i = 0; i < res.edges.size(); i++) {
        const chain_edge_t& e = res.edges[i];
        append_error(out,
                    res.edge_probability,
                    {e.first, e.second},
                    i == 0 ? observables : std::vector<uint64_t>(),
                    detector_offset);
    }
    if (declare_virtual_detectors) {
        for (uint64_t v : res.virtual_detectors) append_detector(out, v, detector_offset);
    }
}

stim::DetectorErrorModel
rewrite(
        const stim::DetectorErrorModel& dem,
        const std::map<size_t, decomposition_result_t>& results,
        TransformationLog& log,
        bool declare_virtual_detectors,
        bool verbose)
{
    if (has_repeat_blocks(dem)) {
        return rewrite(unroll_repeat_blocks(dem), results, log, declare_virtual_detectors, verbose);
    }

    stim::DetectorErrorModel out;
    for_each_instruction(dem,
        [&] (const stim::DemInstruction& inst, size_t idx, uint64_t detector_offset)
        {
            switch (inst.type) {
            case stim::DemInstructionType::DEM_ERROR:
                {
                    auto it = results.find(idx);
                    if (it == results.end()) {
                        out.append_dem_instruction(inst);
                        break;
                    }
                    const decomposition_result_t& res = it->second;
                    log.append(log_entry_t::outcome(idx, res));
                    if (res.success) {
                        append_chain(out, res, get_observables(inst), detector_offset, declare_virtual_detectors);
                        if (verbose) {
                            std::cout << "[ Rewriter ] decomposed hyper-edge at instruction " << idx
                                << " into " << res.edges.size() << " edges (q = " << res.edge_probability
                                << (res.approximate ? ", approximate" : "") << ")" << std::endl;
                        }
                    } else {
                        std::cerr << "[ warning ] could not decompose hyper-edge at instruction "
                            << idx << ": " << res.failure_reason << std::endl;
                        out.append_dem_instruction(inst);
                    }
                }
                break;
            case stim::DemInstructionType::DEM_DETECTOR:
            case stim::DemInstructionType::DEM_LOGICAL_OBSERVABLE:
            case stim::DemInstructionType::DEM_SHIFT_DETECTORS:
                out.append_dem_instruction(inst);
                break;
            case stim::DemInstructionType::DEM_REPEAT_BLOCK:
                throw std::logic_error("rewrite: found a repeat block in an unrolled model");
            }
        });
    return out;
}

}   // hypergraphify
