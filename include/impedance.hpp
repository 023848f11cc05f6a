#ifndef IMPEDANCE_HPP
#define IMPEDANCE_HPP

#include <complex>
#include <vector>

#include "material_table.hpp"
#include "toroid.hpp"

// Impedance of the wound toroid at every sample of a material table.
// All three vectors share the indexing of the table they were computed from.
struct ImpedanceCurve {
    std::vector<double> frequency;               // Hz
    std::vector<std::complex<double>> inductor;  // Z_L, ferrite inductor alone
    std::vector<std::complex<double>> total;     // Z_tot, Z_L in parallel with the shunt capacitance

    std::size_t size() const { return frequency.size(); }
};

// Z_L = jw * FERRITE_K * N^2 * (mu' - j*mu'') * HT * log10(OD/ID)
std::complex<double> inductor_impedance(double freq, double mu_prime, double mu_double_prime,
                                        const ToroidInductor& inductor);

// 1 / (1/z + jwC). Throws NumericDomainError if z or the summed admittance is zero.
std::complex<double> parallel_with_capacitance(std::complex<double> z, double freq, double capacitance);

// Validates the inductor, then evaluates Z_L and Z_tot for every row of the table.
// Throws NumericDomainError on the first degenerate sample.
ImpedanceCurve compute_impedance_curve(const MaterialTable& material, const ToroidInductor& inductor);

// Scalar views of Z_tot
std::vector<double> impedance_magnitude(const ImpedanceCurve& curve);
std::vector<double> impedance_phase_degrees(const ImpedanceCurve& curve);
std::vector<double> impedance_resistance(const ImpedanceCurve& curve);
std::vector<double> impedance_reactance(const ImpedanceCurve& curve);

// Im(Z_L) / w for every sample, in H
std::vector<double> effective_inductance(const ImpedanceCurve& curve);

// First frequency where the susceptance of Z_tot turns from inductive (negative)
// to capacitive, linearly interpolated between the bracketing samples.
// Returns false if the curve has no such crossing.
bool find_self_resonance(const ImpedanceCurve& curve, double& srf_hz);

#endif // IMPEDANCE_HPP
