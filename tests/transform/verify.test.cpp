/*
 *  date:   14 October 2026
 * */

#include "dem_prebuilt.h"

#include <hypergraphify/transform.h>
#include <hypergraphify/verifier.h>

int main() {
    bool ok = true;

    // Two hyper-edges are removed and the result is valid.
    stim::DetectorErrorModel dem = make_dem(
            "error(0.1) D0 D1 D2\n"
            "error(0.02) D5 D6 D7\n"
            "error(0.05) D3 D4");
    transform_result_t res = transform(dem);
    verify_result_t v = verify(dem, res.dem);
    ok &= expect(count_hyperedges(dem) == 2, "input has two hyper-edges");
    ok &= expect(count_hyperedges(res.dem) == 0, "output has no hyper-edges");
    ok &= expect(v.valid, "output should be valid");
    ok &= expect(v.max_detectors_per_error == 2, "max detectors per error");
    ok &= expect(v.original_instructions == 3 && v.transformed_instructions == 5, "instruction counts");

    // The verifier does not trust the rewriter: an untouched model fails.
    verify_result_t v2 = verify(dem, dem);
    ok &= expect(v2.original_non_empty && v2.transformed_non_empty, "both models are non-empty");
    ok &= expect(!v2.valid, "hyper-edges make the model invalid");
    ok &= expect(v2.max_detectors_per_error == 3, "max detectors is reported");

    // Empty input.
    stim::DetectorErrorModel empty;
    verify_result_t v3 = verify(empty, transform(empty).dem);
    ok &= expect(!v3.original_non_empty, "empty original");
    ok &= expect(!v3.transformed_non_empty, "empty transformed");
    ok &= expect(!v3.valid, "empty models are not valid");

    // Hyper-edges inside repeat blocks are found.
    stim::DetectorErrorModel rep = make_dem("repeat 2 {\n    error(0.1) D0 D1 D2\n    shift_detectors 3\n}");
    ok &= expect(!is_graphlike(rep), "repeat block hides a hyper-edge");
    ok &= expect(is_graphlike(make_dem("error(0.1) D0 D1\nerror(0.1) L0")), "graphlike model");

    // The inputs are not modified.
    stim::DetectorErrorModel copy = dem;
    verify(dem, res.dem);
    ok &= expect(copy == dem, "verify does not modify its inputs");

    std::cout << v << std::endl;
    return static_cast<int>(!ok);
}
