/*
 *  date:   3 October 2026
 * */

namespace hypergraphify {

inline size_t
hyperedge_t::get_order() const {
    return detectors.size();
}

inline bool
is_hyperedge(const stim::DemInstruction& inst) {
    return inst.type == stim::DemInstructionType::DEM_ERROR
        && get_detectors(inst).size() >= HYPEREDGE_MIN_ORDER;
}

}   // hypergraphify
