/*
 *  date:   8 October 2026
 *
 *  Checks that a model can be loaded by PyMatching.
 * */

#ifndef HYPERGRAPHIFY_EXT_PYMATCHING_h
#define HYPERGRAPHIFY_EXT_PYMATCHING_h

#include "hypergraphify/ext/stim.h"

#include <string>

namespace hypergraphify {

struct matching_check_t {
    bool    checked = false;
    bool    compatible = false;
    size_t  number_of_nodes = 0;
    std::string reason;
};

// PyMatching refuses errors with more than two detectors by throwing. The
// exception message is returned in the reason field.
matching_check_t    check_matching_compatibility(const stim::DetectorErrorModel&);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_EXT_PYMATCHING_h
