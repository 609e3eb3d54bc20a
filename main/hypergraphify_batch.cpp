/*
 *  date:   11 October 2026
 * */

#include <hypergraphify/batch.h>
#include <hypergraphify/io.h>

#include <vtils/cmd_parse.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <mpi.h>

using namespace hypergraphify;
using namespace vtils;

int main(int argc, char* argv[]) {
    MPI_Init(NULL, NULL);
    int world_rank = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &world_rank);

    std::string help =
        "usage: ./hypergraphify_batch <input-folder> <output-folder>\n"
        "optional:\n"
        "\t--config <ini-file>\n"
        "\t-declare-virtual (declare each virtual detector)\n"
        "\t-check-matching (load each output into PyMatching)";
    CmdParser pp(argc, argv, 2);
    pp.help = help;
    if (pp.option_set("h") || argc < 3) {
        if (world_rank == 0) std::cerr << help << std::endl;
        MPI_Finalize();
        return 1;
    }

    std::string input_folder(argv[1]);
    std::string output_folder(argv[2]);
    std::string ini_file;

    transform_config_t config;
    batch_result_t res;
    try {
        if (pp.get("config", ini_file)) {
            load_config_from_ini(ini_file, config);
        }
        config.declare_virtual_detectors |= pp.option_set("declare-virtual");
        config.check_matching |= pp.option_set("check-matching");
        // Output from every rank would interleave.
        config.verbose = false;

        res = transform_folder(input_folder, output_folder, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ hypergraphify_batch ] " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ hypergraphify_batch ] " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    if (world_rank == 0) {
        std::cout << "models = " << res.models
            << ", hyper-edges = " << res.hyperedges_detected
            << ", decomposed = " << res.hyperedges_decomposed
            << ", failed = " << res.hyperedges_failed
            << ", virtual detectors = " << res.virtual_detectors
            << ", invalid = " << res.invalid_models
            << ", rejected by PyMatching = " << res.unmatchable_models
            << ", errors = " << res.errors << std::endl;
    }
    MPI_Finalize();
    return (res.invalid_models > 0 || res.unmatchable_models > 0 || res.errors > 0) ? 1 : 0;
}
