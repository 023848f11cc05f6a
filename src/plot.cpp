#include "plot.hpp"
#include "constants.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// Double-quoted gnuplot string; \n inside stays a line break
std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

struct Panel {
    const char* title;
    const char* ylabel;
    const char* column;  // gnuplot using-expression for y
};

// Same order as the 2x2 layout fills: row by row
const Panel PANELS[4] = {
    {"Impedance Magnitude (|Z|)", "Ohms",    "8"},
    {"Resistance",                "Ohms",    "6"},
    {"Impedance Phase",           "Degrees", "9"},
    {"Reactance",                 "Ohms",    "7"},
};

} // namespace

std::string format_picofarads(double farads) {
    std::ostringstream ss;
    ss << farads * 1e12;
    return ss.str();
}

void write_gnuplot_script(std::ostream& out, const PlotSpec& spec) {
    const CoreGeometry& core = spec.inductor.core;

    std::ostringstream title;
    title << "Calculated Impedance of\\n" << spec.label
          << "\\n(shunt capacitance = " << format_picofarads(spec.inductor.shunt_capacitance) << " pF)";

    std::ostringstream subtitle;
    subtitle << "N = " << spec.inductor.turns
             << ", OD = " << core.outer_diameter_mm << " mm"
             << ", ID = " << core.inner_diameter_mm << " mm"
             << ", HT = " << core.height_mm << " mm";

    out << "# Impedance of a ferrite toroid inductor\n";
    out << "set terminal pngcairo size " << PLOT_WIDTH_PX << "," << PLOT_HEIGHT_PX << " enhanced font \"Sans,10\"\n";
    out << "set output " << quote(spec.image_file) << "\n";
    out << "set datafile separator \",\"\n";
    out << "set datafile columnheaders\n";
    out << "set key off\n";
    out << "set grid xtics ytics mxtics mytics lc rgb \"#000000\" lw 0.5, lc rgb \"#808080\" lw 0.3\n";
    out << "set mxtics\n";
    out << "set mytics\n";
    out << "set xlabel \"MHz\"\n";
    out << "set style line 1 lc rgb \"" << PLOT_LINE_COLOR << "\" lt 1 lw 2\n";
    out << "\n";
    out << "set multiplot layout 2,2 title " << quote(title.str() + "\\n" + subtitle.str()) << " font \",12\"\n";

    for (const Panel& panel : PANELS) {
        out << "set title " << quote(panel.title) << "\n";
        out << "set ylabel " << quote(panel.ylabel) << "\n";
        out << "plot " << quote(spec.data_file)
            << " using ($1*1e-6):" << panel.column << " with lines ls 1\n";
    }

    out << "unset multiplot\n";
    out << "set output\n";
}

void write_gnuplot_script(const std::string& script_file, const PlotSpec& spec) {
    std::ofstream out(script_file);
    if (!out) {
        throw std::runtime_error("could not open " + script_file + " for writing");
    }
    write_gnuplot_script(out, spec);
    out.close();
    if (!out) {
        throw std::runtime_error("error while writing " + script_file);
    }
}

bool render_plot(const std::string& script_file) {
    if (std::system("gnuplot --version > /dev/null 2>&1") != 0) {
        std::cerr << "Warning: gnuplot not found, skipping render of " << script_file << std::endl;
        return false;
    }

    std::string command = "gnuplot " + shell_quote(script_file);
    int status = std::system(command.c_str());
    if (status != 0) {
        std::cerr << "Warning: gnuplot exited with status " << status << " for " << script_file << std::endl;
        return false;
    }
    return true;
}
