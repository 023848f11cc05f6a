#include "impedance.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>

constexpr std::complex<double> I(0.0, 1.0);

namespace {

bool is_finite(const std::complex<double>& z) {
    return std::isfinite(z.real()) && std::isfinite(z.imag());
}

std::string describe_frequency(double freq) {
    std::ostringstream ss;
    ss << freq << " Hz";
    return ss.str();
}

// Evaluates one table row into curve slot i
void evaluate_sample(const MaterialTable& material, const ToroidInductor& inductor,
                     std::size_t i, ImpedanceCurve& curve) {
    const double freq = material.frequency[i];

    std::complex<double> z_l = inductor_impedance(freq, material.mu_prime[i], material.mu_double_prime[i], inductor);
    if (!is_finite(z_l)) {
        throw NumericDomainError("inductor impedance is not finite at " + describe_frequency(freq));
    }

    curve.inductor[i] = z_l;
    curve.total[i] = parallel_with_capacitance(z_l, freq, inductor.shunt_capacitance);
}

} // namespace

std::complex<double> inductor_impedance(double freq, double mu_prime, double mu_double_prime,
                                        const ToroidInductor& inductor) {
    const double omega = 2.0 * M_PI * freq;
    const std::complex<double> mu(mu_prime, -mu_double_prime);
    return I * omega * inductance_factor(inductor) * mu;
}

std::complex<double> parallel_with_capacitance(std::complex<double> z, double freq, double capacitance) {
    if (z == std::complex<double>(0.0, 0.0)) {
        throw NumericDomainError("inductor impedance is zero at " + describe_frequency(freq)
                                 + ", admittance is undefined");
    }

    // Admittances of parallel branches add
    std::complex<double> y_l = 1.0 / z;
    std::complex<double> y_c = I * (2.0 * M_PI * freq * capacitance);
    std::complex<double> y_tot = y_l + y_c;

    if (y_tot == std::complex<double>(0.0, 0.0)) {
        throw NumericDomainError("total admittance is zero at " + describe_frequency(freq)
                                 + " (lossless resonance)");
    }

    std::complex<double> z_tot = 1.0 / y_tot;
    if (!is_finite(z_tot)) {
        throw NumericDomainError("total impedance is not finite at " + describe_frequency(freq));
    }
    return z_tot;
}

ImpedanceCurve compute_impedance_curve(const MaterialTable& material, const ToroidInductor& inductor) {
    validate_inductor(inductor);

    if (material.mu_prime.size() != material.size() || material.mu_double_prime.size() != material.size()) {
        throw DataFormatError("material table columns have different lengths");
    }

    const int N = static_cast<int>(material.size());

    ImpedanceCurve curve;
    curve.frequency = material.frequency;
    curve.inductor.assign(N, std::complex<double>(0.0, 0.0));
    curve.total.assign(N, std::complex<double>(0.0, 0.0));

    // Samples are independent; record the first failing one and raise after the loop
    int first_bad = N;

    #pragma omp parallel for schedule(static) reduction(min:first_bad) if(N >= PARALLEL_SWEEP_MIN_SAMPLES)
    for (int i = 0; i < N; ++i) {
        try {
            evaluate_sample(material, inductor, i, curve);
        } catch (const NumericDomainError&) {
            if (i < first_bad) first_bad = i;
        }
    }

    if (first_bad < N) {
        // Re-run serially so the caller gets the original message
        evaluate_sample(material, inductor, first_bad, curve);
    }
    return curve;
}

std::vector<double> impedance_magnitude(const ImpedanceCurve& curve) {
    std::vector<double> out(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        out[i] = std::abs(curve.total[i]);
    }
    return out;
}

std::vector<double> impedance_phase_degrees(const ImpedanceCurve& curve) {
    std::vector<double> out(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        out[i] = std::arg(curve.total[i]) * 180.0 / M_PI;
    }
    return out;
}

std::vector<double> impedance_resistance(const ImpedanceCurve& curve) {
    std::vector<double> out(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        out[i] = curve.total[i].real();
    }
    return out;
}

std::vector<double> impedance_reactance(const ImpedanceCurve& curve) {
    std::vector<double> out(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        out[i] = curve.total[i].imag();
    }
    return out;
}

std::vector<double> effective_inductance(const ImpedanceCurve& curve) {
    std::vector<double> out(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        double omega = 2.0 * M_PI * curve.frequency[i];
        out[i] = curve.inductor[i].imag() / omega;
    }
    return out;
}

bool find_self_resonance(const ImpedanceCurve& curve, double& srf_hz) {
    // Susceptance B = Im(1/Z): negative while inductive, positive once the shunt dominates
    for (size_t i = 1; i < curve.size(); ++i) {
        double b0 = (1.0 / curve.total[i - 1]).imag();
        double b1 = (1.0 / curve.total[i]).imag();
        if (b0 < 0.0 && b1 >= 0.0) {
            double f0 = curve.frequency[i - 1];
            double f1 = curve.frequency[i];
            srf_hz = f0 + (f1 - f0) * (-b0) / (b1 - b0);
            return true;
        }
    }
    return false;
}
