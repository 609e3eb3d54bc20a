/*
 *  date:   8 October 2026
 * */

#include "hypergraphify/transform.h"
#include "hypergraphify/rewriter.h"

#include <vtils/timer.h>

#include <iostream>

namespace hypergraphify {

transform_result_t
transform(const stim::DetectorErrorModel& dem, transform_config_t config) {
    vtils::Timer timer;
    timer.clk_start();

    transform_result_t out;

    const stim::DetectorErrorModel flat = has_repeat_blocks(dem) ? unroll_repeat_blocks(dem) : dem;
    std::vector<hyperedge_t> hyperedges = detect_hyperedges(flat);

    if (hyperedges.empty()) {
        if (config.verbose) {
            std::cout << "[ transform ] no hyper-edges found, model is already graphlike" << std::endl;
        }
        out.dem = dem;
    } else {
        if (config.verbose) {
            std::cout << "[ transform ] found " << hyperedges.size() << " hyper-edges" << std::endl;
        }
        VirtualDetectorAllocator alloc = VirtualDetectorAllocator::for_model(flat);

        std::map<size_t, decomposition_result_t> results;
        for (const hyperedge_t& he : hyperedges) {
            if (config.verbose) {
                std::cout << "[ transform ] hyper-edge at instruction " << he.instruction_index
                    << ": " << print_he(he) << ", p = " << he.probability << std::endl;
            }
            out.log.append(log_entry_t::detected(he));
            results[he.instruction_index] = decompose_hyperedge(he.detectors, he.probability, alloc);
        }
        out.dem = rewrite(flat, results, out.log, config.declare_virtual_detectors, config.verbose);

        transform_stats_t& s = out.stats;
        s.hyperedges_detected = hyperedges.size();
        for (const auto& p : results) {
            const decomposition_result_t& res = p.second;
            if (res.success) {
                s.hyperedges_decomposed++;
                s.virtual_detectors += res.virtual_detectors.size();
                s.edges_created += res.edges.size();
            } else {
                s.hyperedges_failed++;
            }
        }
    }

    if (config.check_matching) {
        out.matching = check_matching_compatibility(out.dem);
        if (config.verbose) {
            if (out.matching.compatible) {
                std::cout << "[ transform ] PyMatching accepted the model ("
                    << out.matching.number_of_nodes << " nodes)" << std::endl;
            } else {
                std::cout << "[ transform ] PyMatching rejected the model: " << out.matching.reason << std::endl;
            }
        }
    }

    out.stats.time_ns = static_cast<fp_t>(timer.clk_end());
    if (config.verbose) {
        std::cout << "[ transform ] decomposed " << out.stats.hyperedges_decomposed
            << "/" << out.stats.hyperedges_detected << " hyper-edges, added "
            << out.stats.virtual_detectors << " virtual detectors and "
            << out.stats.edges_created << " edges in " << out.stats.time_ns*1e-6 << "ms" << std::endl;
    }
    return out;
}

}   // hypergraphify
