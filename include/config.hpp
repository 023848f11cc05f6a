#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <iosfwd>
#include <string>

#include "toroid.hpp"

// Everything one run of the tool needs; defaults come from constants.hpp
struct RunConfig {
    std::string material_file;
    ToroidInductor inductor;
    double f_min;
    double f_max;
    std::string label;
    std::string output_dir;
    bool render;
    bool quiet;
};

// FT-240 Mix 31 defaults, no input file, no band limits
RunConfig default_config();

// Applies command line flags on top of default_config(). Exactly one positional
// argument (the material table) is required. Throws std::invalid_argument on an
// unknown flag, a missing or malformed value, or a wrong number of files.
RunConfig parse_args(int argc, const char* const argv[]);

void print_usage(std::ostream& os, const char* prog);

#endif // CONFIG_HPP
