/*
 *  date:   10 October 2026
 * */

#include "hypergraphify/batch.h"
#include "hypergraphify/io.h"

#include <vtils/filesystem.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>

#include <mpi.h>

namespace hypergraphify {

bool G_USE_MPI = true;

std::vector<std::string>
list_models(std::string input_folder) {
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(input_folder)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".dem") continue;
        files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

void
record_model(batch_result_t& b, const transform_result_t& res, const verify_result_t& vres) {
    b.models++;
    b.hyperedges_detected += res.stats.hyperedges_detected;
    b.hyperedges_decomposed += res.stats.hyperedges_decomposed;
    b.hyperedges_failed += res.stats.hyperedges_failed;
    b.virtual_detectors += res.stats.virtual_detectors;
    if (!vres.valid) b.invalid_models++;
    if (res.matching.checked && !res.matching.compatible) b.unmatchable_models++;
}

batch_result_t
transform_folder(std::string input_folder, std::string output_folder, transform_config_t config) {
    int world_rank = 0, world_size = 1;
    if (G_USE_MPI) {
        MPI_Comm_rank(MPI_COMM_WORLD, &world_rank);
        MPI_Comm_size(MPI_COMM_WORLD, &world_size);
    }
    if (world_rank == 0) {
        vtils::safe_create_directory(output_folder);
    }
    if (G_USE_MPI) {
        MPI_Barrier(MPI_COMM_WORLD);
    }

    std::vector<std::string> files = list_models(input_folder);

    batch_result_t local;
    for (size_t i = world_rank; i < files.size(); i += world_size) {
        const std::string& input_file = files[i];
        std::string output_file = 
            output_folder + "/" + std::filesystem::path(input_file).filename().string();
        try {
            stim::DetectorErrorModel dem = read_dem_from_file(input_file);
            transform_result_t res = transform(dem, config);
            write_dem_to_file(res.dem, output_file);

            verify_result_t vres = verify(dem, res.dem);
            if (!vres.valid) {
                std::cerr << "[ transform_folder ] " << input_file << " failed verification: "
                    << vres << std::endl;
            }
            if (res.matching.checked && !res.matching.compatible) {
                std::cerr << "[ transform_folder ] PyMatching rejected " << output_file << ": "
                    << res.matching.reason << std::endl;
            }
            record_model(local, res, vres);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[ transform_folder ] " << e.what() << std::endl;
            local.errors++;
        }
    }

    if (!G_USE_MPI) return local;

    std::array<uint64_t, 8> local_counts{
        local.models,
        local.hyperedges_detected,
        local.hyperedges_decomposed,
        local.hyperedges_failed,
        local.virtual_detectors,
        local.invalid_models,
        local.unmatchable_models,
        local.errors
    };
    std::array<uint64_t, 8> counts;
    MPI_Allreduce(local_counts.data(), counts.data(), counts.size(), MPI_UNSIGNED_LONG, MPI_SUM,
                    MPI_COMM_WORLD);

    batch_result_t total;
    total.models = counts[0];
    total.hyperedges_detected = counts[1];
    total.hyperedges_decomposed = counts[2];
    total.hyperedges_failed = counts[3];
    total.virtual_detectors = counts[4];
    total.invalid_models = counts[5];
    total.unmatchable_models = counts[6];
    total.errors = counts[7];
    return total;
}

}   // hypergraphify
