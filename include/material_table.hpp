#ifndef MATERIAL_TABLE_HPP
#define MATERIAL_TABLE_HPP

#include <cstddef>
#include <istream>
#include <limits>
#include <string>
#include <vector>

// Complex relative permeability of a ferrite mix, one row per frequency.
// mu = mu_prime - j*mu_double_prime. The three vectors always have equal length.
struct MaterialTable {
    std::vector<double> frequency;        // Hz, strictly ascending
    std::vector<double> mu_prime;         // reactive part
    std::vector<double> mu_double_prime;  // loss part

    std::size_t size() const { return frequency.size(); }
    bool empty() const { return frequency.empty(); }
};

// Parses a delimited table: one header row, then rows of frequency_Hz, mu', mu''.
// Rows outside [f_min, f_max] are dropped. Throws DataFormatError or MissingColumnError.
MaterialTable parse_material_table(
    std::istream& in,
    const std::string& source_name,
    double f_min = 0.0,
    double f_max = std::numeric_limits<double>::infinity()
);

// Same as parse_material_table, reading from a file
MaterialTable load_material_table(
    const std::string& filename,
    double f_min = 0.0,
    double f_max = std::numeric_limits<double>::infinity()
);

// Splits one line on the given delimiter. ' ' means any run of whitespace.
std::vector<std::string> split_fields(const std::string& line, char delimiter);

// Picks ',', ';', '\t' or ' ' from the header line
char detect_delimiter(const std::string& header);

#endif // MATERIAL_TABLE_HPP
