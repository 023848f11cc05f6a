#include "print_utils.hpp"

#include <iomanip>
#include <iostream>

void print_complex_value(std::ostream& os, const std::complex<double>& z) {
    // Handle real and imaginary parts
    if (z.imag() == 0) {
        os << z.real();
    } else if (z.real() == 0) {
        os << z.imag() << "j";
    } else {
        os << z.real();
        if (z.imag() > 0) os << "+";
        os << z.imag() << "j";
    }
}

void print_impedance_table(std::ostream& os, const char* label, const ImpedanceCurve& curve, std::size_t max_rows) {
    os << "\n" << label << ":\n";
    if (curve.size() == 0 || max_rows == 0) {
        return;
    }

    std::vector<double> magnitude = impedance_magnitude(curve);
    std::vector<double> phase = impedance_phase_degrees(curve);

    size_t stride = (curve.size() + max_rows - 1) / max_rows;

    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::setw(12) << "f [MHz]" << std::setw(14) << "|Z| [Ohm]" << std::setw(12) << "phase [deg]"
       << "   Z [Ohm]\n";
    os << std::fixed;
    for (size_t i = 0; i < curve.size(); i += stride) {
        os << std::setprecision(3) << std::setw(12) << curve.frequency[i] * 1e-6
           << std::setprecision(2) << std::setw(14) << magnitude[i]
           << std::setw(12) << phase[i] << "   ";
        print_complex_value(os, curve.total[i]);
        os << "\n";
    }

    os.flags(flags);
    os.precision(precision);
}

void print_impedance_summary(std::ostream& os, const ImpedanceCurve& curve) {
    if (curve.size() == 0) {
        return;
    }

    std::vector<double> inductance = effective_inductance(curve);
    os << "Inductance at " << curve.frequency.front() * 1e-6 << " MHz: "
       << inductance.front() * 1e6 << " uH" << std::endl;

    double srf = 0.0;
    if (find_self_resonance(curve, srf)) {
        os << "Self-resonant frequency: " << srf * 1e-6 << " MHz" << std::endl;
    } else {
        os << "Self-resonant frequency: not found between " << curve.frequency.front() * 1e-6
           << " and " << curve.frequency.back() * 1e-6 << " MHz" << std::endl;
    }
}
