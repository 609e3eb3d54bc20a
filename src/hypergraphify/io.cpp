/*
 *  date:   9 October 2026
 * */

#include "hypergraphify/io.h"

#include <vtils/ini_parse.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <ctype.h>
#include <stdio.h>

namespace hypergraphify {

stim::DetectorErrorModel
read_dem_from_file(std::string path) {
    FILE* fin = fopen(path.c_str(), "r");
    if (fin == NULL) {
        throw std::invalid_argument("could not open " + path + " for reading");
    }
    try {
        stim::DetectorErrorModel dem = stim::DetectorErrorModel::from_file(fin);
        fclose(fin);
        return dem;
    } catch (const std::invalid_argument& e) {
        fclose(fin);
        throw std::invalid_argument("failed to parse " + path + ": " + e.what());
    }
}

void
write_dem_to_file(const stim::DetectorErrorModel& dem, std::string path) {
    std::ofstream fout(path);
    if (!fout.is_open()) {
        throw std::invalid_argument("could not open " + path + " for writing");
    }
    fout << dem << "\n";
    fout.flush();
    if (fout.fail()) {
        throw std::invalid_argument("failed to write " + path);
    }
}

void
write_log_to_file(const TransformationLog& log, std::string path) {
    std::ofstream fout(path);
    if (!fout.is_open()) {
        throw std::invalid_argument("could not open " + path + " for writing");
    }
    fout << log;
    fout.flush();
    if (fout.fail()) {
        throw std::invalid_argument("failed to write " + path);
    }
}

bool
parse_bool(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [] (unsigned char c) { return isspace(c); }), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [] (unsigned char c) { return tolower(c); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

static void
get_bool(vtils::IniParser& ini, std::string key, bool& var) {
    std::string value;
    ini.get("Transform", key, value);
    if (!value.empty()) var = parse_bool(value);
}

void
load_config_from_ini(std::string ini_file, transform_config_t& config) {
    std::ifstream test(ini_file);
    if (!test.is_open()) {
        throw std::invalid_argument("could not open " + ini_file + " for reading");
    }
    test.close();

    vtils::IniParser ini(ini_file);
    get_bool(ini, "verbose", config.verbose);
    get_bool(ini, "declare_virtual_detectors", config.declare_virtual_detectors);
    get_bool(ini, "check_matching", config.check_matching);
}

}   // hypergraphify
