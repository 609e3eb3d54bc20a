/*
 *  date:   11 October 2026
 * */

#include <hypergraphify/io.h>
#include <hypergraphify/transform.h>
#include <hypergraphify/verifier.h>

#include <vtils/cmd_parse.h>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace hypergraphify;
using namespace vtils;

int main(int argc, char* argv[]) {
    std::string help =
        "usage: ./hypergraphify <input-dem> --output <output-dem>\n"
        "Transforms the hyper-edges of a detector error model into graphlike chains.\n"
        "optional:\n"
        "\t--config <ini-file>\n"
        "\t--log <file, writes the transformation log>\n"
        "\t-v (verbose)\n"
        "\t-declare-virtual (declare each virtual detector)\n"
        "\t-check-matching (load the output into PyMatching)\n"
        "\t-allow-invalid (return 0 even if the output is not graphlike)";
    CmdParser pp(argc, argv, 1);
    pp.help = help;
    if (pp.option_set("h") || argc < 2) {
        std::cerr << help << std::endl;
        return 1;
    }

    std::string input_file(argv[1]);
    std::string output_file;
    std::string ini_file;
    std::string log_file;

    if (!pp.get("output", output_file, true)) {
        std::cerr << help << std::endl;
        return 1;
    }

    transform_config_t config;
    try {
        if (pp.get("config", ini_file)) {
            load_config_from_ini(ini_file, config);
        }
        config.verbose |= pp.option_set("v");
        config.declare_virtual_detectors |= pp.option_set("declare-virtual");
        config.check_matching |= pp.option_set("check-matching");
        const bool allow_invalid = pp.option_set("allow-invalid");

        stim::DetectorErrorModel dem = read_dem_from_file(input_file);
        transform_result_t res = transform(dem, config);
        verify_result_t vres = verify(dem, res.dem);

        write_dem_to_file(res.dem, output_file);
        if (pp.get("log", log_file)) {
            write_log_to_file(res.log, log_file);
        }
        if (config.verbose) {
            std::cout << "[ hypergraphify ] verification: " << vres << std::endl;
            std::cout << res.log;
        }

        if (!vres.valid && !allow_invalid) {
            std::cerr << "[ hypergraphify ] output failed verification: " << vres << std::endl;
            return 1;
        }
        if (config.check_matching && !res.matching.compatible) {
            std::cerr << "[ hypergraphify ] PyMatching rejected the output: " << res.matching.reason << std::endl;
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ hypergraphify ] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Wrote: " << output_file << std::endl;
    return 0;
}
