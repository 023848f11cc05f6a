#include "fileio.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include <dirent.h>
#include <sys/stat.h>

void write_impedance_csv(
    const std::string& filename,
    const MaterialTable& material,
    const ImpedanceCurve& curve
    ) {

    if (material.size() != curve.size()) {
        throw std::runtime_error("material table and impedance curve differ in length");
    }

    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("could not open " + filename + " for writing");
    }

    std::vector<double> magnitude = impedance_magnitude(curve);
    std::vector<double> phase = impedance_phase_degrees(curve);

    // Write header
    out << "frequency_Hz,mu_prime,mu_double_prime,Re_ZL,Im_ZL,Re_Z,Im_Z,abs_Z,phase_deg\n";

    out << std::scientific << std::setprecision(9);

    for (size_t n = 0; n < curve.size(); ++n) {
        out << curve.frequency[n] << ","
            << material.mu_prime[n] << "," << material.mu_double_prime[n] << ","
            << curve.inductor[n].real() << "," << curve.inductor[n].imag() << ","
            << curve.total[n].real() << "," << curve.total[n].imag() << ","
            << magnitude[n] << "," << phase[n] << "\n";
    }

    out.close();
    if (!out) {
        throw std::runtime_error("error while writing " + filename);
    }
}

// ---- Create directory if it doesn't exist ----
bool create_directory(const std::string& path) {
    // Check if directory exists
    DIR* dir = opendir(path.c_str());
    if (dir) {
        closedir(dir);
        return true;
    }

    // Create directory with read/write/execute permissions for owner
    int status = mkdir(path.c_str(), S_IRWXU);
    if (status != 0) {
        std::cerr << "Error creating directory " << path << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

// ---- Get filename without extension ----
std::string get_filename_without_ext(const std::string& filepath) {
    size_t lastSlash = filepath.find_last_of("/\\");

    // Extract just the filename part (after the last slash if it exists)
    std::string filename = (lastSlash == std::string::npos) ? filepath : filepath.substr(lastSlash + 1);

    // Remove extension if it exists
    size_t lastDot = filename.find_last_of(".");
    if (lastDot != std::string::npos && lastDot > 0) {
        filename = filename.substr(0, lastDot);
    }

    return filename;
}
