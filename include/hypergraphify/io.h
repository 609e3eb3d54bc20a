/*
 *  date:   9 October 2026
 * */

#ifndef HYPERGRAPHIFY_IO_h
#define HYPERGRAPHIFY_IO_h

#include "hypergraphify/transform.h"

#include <string>

namespace hypergraphify {

// These throw std::invalid_argument if the file cannot be opened or parsed.
stim::DetectorErrorModel    read_dem_from_file(std::string);
void                        write_dem_to_file(const stim::DetectorErrorModel&, std::string);
void                        write_log_to_file(const TransformationLog&, std::string);

// Reads the [Transform] section of an INI file into the config. Keys that are
// missing keep their current value.
void    load_config_from_ini(std::string, transform_config_t&);

bool    parse_bool(std::string);

}   // hypergraphify

#endif  // HYPERGRAPHIFY_IO_h
