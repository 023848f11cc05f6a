#ifndef PLOT_HPP
#define PLOT_HPP

#include <iosfwd>
#include <string>

#include "toroid.hpp"

// What goes into the four-panel impedance figure
struct PlotSpec {
    std::string data_file;   // CSV written by write_impedance_csv
    std::string image_file;  // PNG produced by gnuplot
    std::string label;       // winding description for the title
    ToroidInductor inductor;
};

// Emits a gnuplot script drawing |Z|, resistance, phase and reactance against
// frequency in MHz as a 2x2 multiplot.
void write_gnuplot_script(std::ostream& out, const PlotSpec& spec);

// Writes the script to a file. Throws std::runtime_error if it cannot be written.
void write_gnuplot_script(const std::string& script_file, const PlotSpec& spec);

// Runs gnuplot on the script. Returns false (with a warning on stderr) if
// gnuplot is missing or fails.
bool render_plot(const std::string& script_file);

// "0.65" for 0.65e-12 F
std::string format_picofarads(double farads);

#endif // PLOT_HPP
