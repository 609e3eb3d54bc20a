/*
 *  date:   2 October 2026
 * */

#include "hypergraphify/ext/stim.h"

#include <algorithm>

namespace hypergraphify {

static void
toggle(std::vector<uint64_t>& arr, uint64_t x) {
    auto it = std::find(arr.begin(), arr.end(), x);
    if (it == arr.end())    arr.push_back(x);
    else                    arr.erase(it);
}

std::vector<uint64_t>
get_detectors(const stim::DemInstruction& inst) {
    std::vector<uint64_t> detectors;
    for (stim::DemTarget t : inst.target_data) {
        if (t.is_relative_detector_id()) toggle(detectors, t.val());
    }
    return detectors;
}

std::vector<uint64_t>
get_observables(const stim::DemInstruction& inst) {
    std::vector<uint64_t> observables;
    for (stim::DemTarget t : inst.target_data) {
        if (t.is_observable_id()) toggle(observables, t.val());
    }
    return observables;
}

static void
unroll_into(const stim::DetectorErrorModel& dem, stim::DetectorErrorModel& out) {
    for (const stim::DemInstruction& inst : dem.instructions) {
        if (inst.type == stim::DemInstructionType::DEM_REPEAT_BLOCK) {
            uint64_t n_rep = inst.target_data[0].data;
            const stim::DetectorErrorModel& blk = dem.blocks[inst.target_data[1].data];
            while (n_rep--) unroll_into(blk, out);
        } else {
            out.append_dem_instruction(inst);
        }
    }
}

stim::DetectorErrorModel
unroll_repeat_blocks(const stim::DetectorErrorModel& dem) {
    stim::DetectorErrorModel out;
    unroll_into(dem, out);
    return out;
}

static void
scan_detectors(
        const stim::DetectorErrorModel& dem,
        uint64_t n_iter,
        uint64_t& detector_offset,
        bool& found,
        uint64_t& max_id)
{
    while (n_iter--) {
        for (const stim::DemInstruction& inst : dem.instructions) {
            stim::DemInstructionType type = inst.type;
            if (type == stim::DemInstructionType::DEM_REPEAT_BLOCK) {
                uint64_t n_rep = inst.target_data[0].data;
                const stim::DetectorErrorModel& blk = dem.blocks[inst.target_data[1].data];
                scan_detectors(blk, n_rep, detector_offset, found, max_id);
            } else if (type == stim::DemInstructionType::DEM_SHIFT_DETECTORS) {
                detector_offset += inst.target_data[0].data;
            } else if (type == stim::DemInstructionType::DEM_ERROR
                        || type == stim::DemInstructionType::DEM_DETECTOR)
            {
                for (stim::DemTarget t : inst.target_data) {
                    if (!t.is_relative_detector_id()) continue;
                    const uint64_t d = t.val() + detector_offset;
                    if (!found || d > max_id) max_id = d;
                    found = true;
                }
            }
        }
    }
}

bool
get_max_detector_id(const stim::DetectorErrorModel& dem, uint64_t& max_id) {
    uint64_t detector_offset = 0;
    bool found = false;
    scan_detectors(dem, 1, detector_offset, found, max_id);
    return found;
}

void
append_error(
        stim::DetectorErrorModel& dem,
        fp_t probability,
        const std::vector<uint64_t>& detectors,
        const std::vector<uint64_t>& observables,
        uint64_t detector_offset)
{
    std::vector<stim::DemTarget> targets;
    for (uint64_t d : detectors) {
        targets.push_back(stim::DemTarget::relative_detector_id(d - detector_offset));
    }
    for (uint64_t o : observables) {
        targets.push_back(stim::DemTarget::observable_id(o));
    }
    double p = static_cast<double>(probability);

    stim::DemInstruction inst;
    inst.arg_data = stim::SpanRef<const double>(&p, &p + 1);
    inst.target_data = stim::SpanRef<const stim::DemTarget>(targets.data(), targets.data() + targets.size());
    inst.type = stim::DemInstructionType::DEM_ERROR;
    dem.append_dem_instruction(inst);
}

void
append_detector(stim::DetectorErrorModel& dem, uint64_t detector, uint64_t detector_offset) {
    stim::DemTarget t = stim::DemTarget::relative_detector_id(detector - detector_offset);

    stim::DemInstruction inst;
    inst.arg_data = stim::SpanRef<const double>();
    inst.target_data = stim::SpanRef<const stim::DemTarget>(&t, &t + 1);
    inst.type = stim::DemInstructionType::DEM_DETECTOR;
    dem.append_dem_instruction(inst);
}

}   // hypergraphify
