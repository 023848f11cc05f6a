#ifndef FILEIO_HPP
#define FILEIO_HPP

#include <string>

#include "impedance.hpp"
#include "material_table.hpp"

// Writes the material table and the computed impedance curve to a CSV file.
// Columns: frequency_Hz,mu_prime,mu_double_prime,Re_ZL,Im_ZL,Re_Z,Im_Z,abs_Z,phase_deg
// Throws std::runtime_error if the file cannot be written.
void write_impedance_csv(
    const std::string& filename,
    const MaterialTable& material,
    const ImpedanceCurve& curve
);

// Creates the directory if it does not exist yet. Returns false on failure.
bool create_directory(const std::string& path);

// "data/31-material.csv" -> "31-material"
std::string get_filename_without_ext(const std::string& filepath);

#endif // FILEIO_HPP
