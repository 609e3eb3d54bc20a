/*
 *  date:   2 October 2026
 * */

namespace hypergraphify {

template <class FUNC> void
for_each_instruction(const stim::DetectorErrorModel& dem, FUNC cb) {
    uint64_t detector_offset = 0;
    for (size_t i = 0; i < dem.instructions.size(); i++) {
        const stim::DemInstruction& inst = dem.instructions[i];
        cb(inst, i, detector_offset);
        if (inst.type == stim::DemInstructionType::DEM_SHIFT_DETECTORS) {
            detector_offset += inst.target_data[0].data;
        }
    }
}

inline bool
has_repeat_blocks(const stim::DetectorErrorModel& dem) {
    return !dem.blocks.empty();
}

}   // hypergraphify
