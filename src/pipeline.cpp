#include "pipeline.hpp"
#include "material_table.hpp"
#include "impedance.hpp"
#include "fileio.hpp"
#include "plot.hpp"
#include "print_utils.hpp"

#include <chrono>
#include <iostream>

// ---- Load -> compute -> write -> plot ----
int run_pipeline(const RunConfig& cfg, std::ostream& log) {
    auto start_time = std::chrono::high_resolution_clock::now();

    // Reject a bad core before touching the input file
    validate_inductor(cfg.inductor);

    MaterialTable material = load_material_table(cfg.material_file, cfg.f_min, cfg.f_max);
    log << "Loaded " << material.size() << " samples from " << cfg.material_file
       << " (" << material.frequency.front() * 1e-6 << " - "
       << material.frequency.back() * 1e-6 << " MHz)\n";

    ImpedanceCurve curve = compute_impedance_curve(material, cfg.inductor);
    log << "Computed impedance: N = " << cfg.inductor.turns
       << ", Cs = " << format_picofarads(cfg.inductor.shunt_capacitance) << " pF\n";

    if (!create_directory(cfg.output_dir)) {
        return 1;
    }
    std::string stem = cfg.output_dir + "/" + get_filename_without_ext(cfg.material_file) + "_impedance";

    PlotSpec plot;
    plot.data_file = stem + ".csv";
    plot.image_file = stem + ".png";
    plot.label = cfg.label;
    plot.inductor = cfg.inductor;

    write_impedance_csv(plot.data_file, material, curve);
    log << "Impedance data saved to " << plot.data_file << "\n";

    std::string script_file = stem + ".gp";
    write_gnuplot_script(script_file, plot);
    log << "Plot script saved to " << script_file << "\n";

    if (cfg.render && render_plot(script_file)) {
        log << "Figure saved to " << plot.image_file << "\n";
    }

    if (!cfg.quiet) {
        print_impedance_table(log, "Impedance (inductor || shunt capacitance)", curve, 20);
    }
    print_impedance_summary(log, curve);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto ms_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    log << "Elapsed: " << ms_duration.count() << " ms\n";
    return 0;
}
