/*
 *  date:   15 October 2026
 * */

#include "dem_prebuilt.h"

#include <hypergraphify/io.h>
#include <hypergraphify/verifier.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

int main() {
    bool ok = true;

    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "hypergraphify_io_test";
    std::filesystem::create_directories(tmp);

    const std::string in_file = (tmp / "in.dem").string();
    const std::string out_file = (tmp / "out.dem").string();
    const std::string log_file = (tmp / "out.log").string();

    {
        std::ofstream fout(in_file);
        fout << "error(0.1) D0 D1 D2\n"
             << "error(0.05) D3 D4\n"
             << "detector D4\n"
             << "logical_observable L0\n";
    }
    stim::DetectorErrorModel dem = read_dem_from_file(in_file);
    ok &= expect(dem.instructions.size() == 4, "model is read");

    transform_result_t res = transform(dem);
    write_dem_to_file(res.dem, out_file);
    write_log_to_file(res.log, log_file);

    stim::DetectorErrorModel back = read_dem_from_file(out_file);
    ok &= expect(back == res.dem, "written model reads back the same");
    ok &= expect(verify(dem, back).valid, "written model is graphlike");
    ok &= expect(std::filesystem::file_size(log_file) > 0, "log is written");

    // Missing files and bad text throw.
    bool threw = false;
    try {
        read_dem_from_file((tmp / "missing.dem").string());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= expect(threw, "missing file throws");

    {
        std::ofstream fout((tmp / "bad.dem").string());
        fout << "error(0.1) D0 D1 Q2 nonsense\n";
    }
    threw = false;
    try {
        read_dem_from_file((tmp / "bad.dem").string());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ok &= expect(threw, "malformed model throws");

    // A write that fails after the file was opened throws.
    if (std::filesystem::exists("/dev/full")) {
        threw = false;
        try {
            write_dem_to_file(res.dem, "/dev/full");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ok &= expect(threw, "failed write throws");
    }

    // INI config.
    const std::string ini_file = (tmp / "config.ini").string();
    {
        std::ofstream fout(ini_file);
        fout << "[Transform]\n"
             << "verbose=false\n"
             << "declare_virtual_detectors=true\n";
    }
    transform_config_t config;
    config.check_matching = true;
    load_config_from_ini(ini_file, config);
    ok &= expect(config.declare_virtual_detectors, "declare_virtual_detectors is read");
    ok &= expect(!config.verbose, "verbose is read");
    ok &= expect(config.check_matching, "missing keys keep their value");

    ok &= expect(parse_bool("TRUE") && parse_bool("1") && parse_bool("yes"), "parse_bool true");
    ok &= expect(!parse_bool("0") && !parse_bool("false") && !parse_bool(""), "parse_bool false");
    ok &= expect(parse_bool(" On \t"), "parse_bool ignores whitespace");
    ok &= expect(!parse_bool("\xe9\xff"), "parse_bool rejects non-ASCII text");

    std::filesystem::remove_all(tmp);
    return static_cast<int>(!ok);
}
