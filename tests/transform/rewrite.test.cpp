/*
 *  date:   13 October 2026
 * */

#include "dem_prebuilt.h"

#include <hypergraphify/hyperedge.h>
#include <hypergraphify/rewriter.h>

#include <math.h>

static std::map<size_t, decomposition_result_t>
decompose_all(const stim::DetectorErrorModel& dem, VirtualDetectorAllocator& alloc) {
    std::map<size_t, decomposition_result_t> results;
    for (const hyperedge_t& he : detect_hyperedges(dem)) {
        results[he.instruction_index] = decompose_hyperedge(he.detectors, he.probability, alloc);
    }
    return results;
}

int main() {
    bool ok = true;

    // Declarations and graphlike errors stay in place around the chain.
    stim::DetectorErrorModel dem = make_dem(
            "detector(0, 0) D0\n"
            "error(0.05) D0 D1\n"
            "error(0.1) D0 D1 D2 L0\n"
            "logical_observable L0\n"
            "error(0.02) D2");
    VirtualDetectorAllocator alloc = VirtualDetectorAllocator::for_model(dem);
    TransformationLog log;
    stim::DetectorErrorModel out = rewrite(dem, decompose_all(dem, alloc), log);

    ok &= expect(out.instructions.size() == 6, "one hyper-edge becomes two edges");
    if (out.instructions.size() == 6) {
        ok &= expect(out.instructions[0] == dem.instructions[0], "detector declaration kept");
        ok &= expect(out.instructions[1] == dem.instructions[1], "graphlike error kept");
        ok &= expect(out.instructions[4] == dem.instructions[3], "observable declaration kept");
        ok &= expect(out.instructions[5] == dem.instructions[4], "trailing error kept");

        ok &= expect(get_detectors(out.instructions[2]) == std::vector<uint64_t>{0, 3}, "first edge is (D0, D3)");
        ok &= expect(get_detectors(out.instructions[3]) == std::vector<uint64_t>{3, 2}, "second edge is (D3, D2)");
        ok &= expect(get_observables(out.instructions[2]) == std::vector<uint64_t>{0}, "observable on the first edge");
        ok &= expect(get_observables(out.instructions[3]).empty(), "no observable on later edges");
        ok &= expect_near(out.instructions[2].arg_data[0], 0.5*(1 - sqrt(0.8)), "edge probability", 1e-9);
    }
    ok &= expect(log.size() == 1 && log.count(log_kind_t::hyperedge_decomposed) == 1, "one decomposed entry");
    if (log.size() == 1) {
        const log_entry_t& e = log.get_entries()[0];
        ok &= expect(e.instruction_index == 2, "entry has the original index");
        ok &= expect(e.detectors == std::vector<uint64_t>{0, 1, 2}, "entry has the detectors");
        ok &= expect(e.virtual_detectors == std::vector<uint64_t>{3}, "entry has the virtual detector");
        ok &= expect(e.edges_created == 2, "entry counts the edges");
    }

    // A failed decomposition keeps the original error.
    stim::DetectorErrorModel dem2 = make_dem("error(0.1) D0 D1 D2\nerror(0.2) D3 D4");
    std::map<size_t, decomposition_result_t> failed;
    decomposition_result_t bad;
    bad.original_detectors = {0, 1, 2};
    bad.probability = 0.1;
    bad.failure_reason = "refused";
    failed[0] = bad;
    TransformationLog log2;
    stim::DetectorErrorModel out2 = rewrite(dem2, failed, log2);
    ok &= expect(out2 == dem2, "failed decompositions are not dropped");
    ok &= expect(log2.count(log_kind_t::hyperedge_decompose_failed) == 1, "failure is logged");
    ok &= expect(log2.get_entries()[0].failure_reason == "refused", "failure reason is logged");

    // Virtual detectors are written relative to the current shift.
    stim::DetectorErrorModel dem3 = make_dem("error(0.1) D0\nshift_detectors(1) 5\nerror(0.1) D0 D1 D2");
    VirtualDetectorAllocator alloc3 = VirtualDetectorAllocator::for_model(dem3);
    TransformationLog log3;
    stim::DetectorErrorModel out3 = rewrite(dem3, decompose_all(dem3, alloc3), log3);
    ok &= expect(out3.instructions.size() == 4, "shifted hyper-edge is replaced");
    if (out3.instructions.size() == 4) {
        ok &= expect(out3.instructions[1] == dem3.instructions[1], "shift is kept");
        ok &= expect(get_detectors(out3.instructions[2]) == std::vector<uint64_t>{0, 3}, "relative first edge");
        ok &= expect(get_detectors(out3.instructions[3]) == std::vector<uint64_t>{3, 2}, "relative second edge");
    }
    uint64_t max_id = 0;
    ok &= expect(get_max_detector_id(out3, max_id) && max_id == 8, "virtual detector is D8 in absolute terms");

    // Virtual detectors can be declared after their chain.
    stim::DetectorErrorModel dem4 = make_dem("error(0.1) D0 D1 D2 D3\nerror(0.2) D0");
    VirtualDetectorAllocator alloc4 = VirtualDetectorAllocator::for_model(dem4);
    TransformationLog log4;
    stim::DetectorErrorModel out4 = rewrite(dem4, decompose_all(dem4, alloc4), log4, true);
    ok &= expect(out4.instructions.size() == 6, "three edges, two declarations, one error");
    if (out4.instructions.size() == 6) {
        ok &= expect(out4.instructions[3].type == stim::DemInstructionType::DEM_DETECTOR
                    && out4.instructions[3].target_data[0].val() == 4, "D4 is declared");
        ok &= expect(out4.instructions[4].type == stim::DemInstructionType::DEM_DETECTOR
                    && out4.instructions[4].target_data[0].val() == 5, "D5 is declared");
        ok &= expect(out4.instructions[5] == dem4.instructions[1], "later error kept");
    }

    return static_cast<int>(!ok);
}
