#ifndef PRINT_UTILS_HPP
#define PRINT_UTILS_HPP

#include <complex>
#include <cstddef>
#include <iosfwd>

#include "impedance.hpp"

void print_complex_value(std::ostream& os, const std::complex<double>& z);

// Table of frequency (MHz), |Z|, phase, R, X; at most max_rows evenly spaced rows
void print_impedance_table(std::ostream& os, const char* label, const ImpedanceCurve& curve, std::size_t max_rows);

// Low-frequency inductance and self-resonant frequency
void print_impedance_summary(std::ostream& os, const ImpedanceCurve& curve);

#endif
