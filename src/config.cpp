#include "config.hpp"
#include "constants.hpp"
#include "fileio.hpp"
#include "string_utils.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

double flag_double(const std::string& flag, const std::string& value) {
    double out = 0.0;
    if (!parse_full_double(value, out)) {
        throw std::invalid_argument("value for " + flag + " is not a number: '" + value + "'");
    }
    return out;
}

int flag_int(const std::string& flag, const std::string& value) {
    int out = 0;
    if (!parse_full_int(value, out)) {
        throw std::invalid_argument("value for " + flag + " is not an integer: '" + value + "'");
    }
    return out;
}

} // namespace

RunConfig default_config() {
    RunConfig cfg;
    cfg.inductor.core.outer_diameter_mm = DEFAULT_OD_MM;
    cfg.inductor.core.inner_diameter_mm = DEFAULT_ID_MM;
    cfg.inductor.core.height_mm = DEFAULT_HT_MM;
    cfg.inductor.turns = DEFAULT_TURNS;
    cfg.inductor.shunt_capacitance = DEFAULT_CSHUNT_F;
    cfg.f_min = 0.0;
    cfg.f_max = std::numeric_limits<double>::infinity();
    cfg.label = DEFAULT_LABEL;
    cfg.render = false;
    cfg.quiet = false;
    return cfg;
}

// ---- Usage ----
void print_usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " <material_csv> [options]\n";
    os << "  material_csv: Header row, then rows of frequency_Hz,mu',mu''\n";
    os << "  --turns N:         Number of turns (default " << DEFAULT_TURNS << ")\n";
    os << "  --od mm:           Core outer diameter (default " << DEFAULT_OD_MM << ")\n";
    os << "  --id mm:           Core inner diameter (default " << DEFAULT_ID_MM << ")\n";
    os << "  --height mm:       Core height (default " << DEFAULT_HT_MM << ")\n";
    os << "  --cshunt F:        Shunt capacitance in farads (default " << DEFAULT_CSHUNT_F << ")\n";
    os << "  --fmin Hz:         Drop table rows below this frequency\n";
    os << "  --fmax Hz:         Drop table rows above this frequency\n";
    os << "  --label text:      Winding description for the plot title\n";
    os << "  --output-dir dir:  Output directory (default: input file name without extension)\n";
    os << "  --render:          Run gnuplot to produce the PNG figure\n";
    os << "  --quiet:           Do not print the impedance table\n";
}

// ---- Parse command line ----
RunConfig parse_args(int argc, const char* const argv[]) {
    RunConfig cfg = default_config();

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--render") {
            cfg.render = true;
            continue;
        }
        if (arg == "--quiet") {
            cfg.quiet = true;
            continue;
        }
        if (arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--turns") {
            cfg.inductor.turns = flag_int(arg, value);
        } else if (arg == "--od") {
            cfg.inductor.core.outer_diameter_mm = flag_double(arg, value);
        } else if (arg == "--id") {
            cfg.inductor.core.inner_diameter_mm = flag_double(arg, value);
        } else if (arg == "--height") {
            cfg.inductor.core.height_mm = flag_double(arg, value);
        } else if (arg == "--cshunt") {
            cfg.inductor.shunt_capacitance = flag_double(arg, value);
        } else if (arg == "--fmin") {
            cfg.f_min = flag_double(arg, value);
        } else if (arg == "--fmax") {
            cfg.f_max = flag_double(arg, value);
        } else if (arg == "--label") {
            cfg.label = value;
        } else if (arg == "--output-dir") {
            cfg.output_dir = value;
        } else {
            throw std::invalid_argument("unknown flag '" + arg + "'");
        }
    }

    if (positional.size() != 1) {
        throw std::invalid_argument("expected exactly one material file");
    }
    cfg.material_file = positional[0];
    if (cfg.output_dir.empty()) {
        cfg.output_dir = get_filename_without_ext(cfg.material_file);
    }
    return cfg;
}
