/*
 *  date:   8 October 2026
 * */

#include "hypergraphify/ext/pymatching.h"

#include <pymatching/sparse_blossom/driver/mwpm_decoding.h>

#include <stdexcept>

namespace hypergraphify {

matching_check_t
check_matching_compatibility(const stim::DetectorErrorModel& dem) {
    matching_check_t res;
    res.checked = true;
    try {
        pm::Mwpm solver = pm::detector_error_model_to_mwpm(dem, pm::NUM_DISTINCT_WEIGHTS);
        res.compatible = true;
        res.number_of_nodes = solver.flooder.graph.nodes.size();
    } catch (const std::invalid_argument& e) {
        res.compatible = false;
        res.reason = e.what();
    }
    return res;
}

}   // hypergraphify
