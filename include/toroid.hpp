#ifndef TOROID_HPP
#define TOROID_HPP

// Toroid core dimensions, all in mm
struct CoreGeometry {
    double outer_diameter_mm;
    double inner_diameter_mm;
    double height_mm;
};

// Wound toroid: core, turn count and the shunt capacitance that sets its SRF
struct ToroidInductor {
    CoreGeometry core;
    int turns;
    double shunt_capacitance;  // F, zero disables self-resonance
};

// Throws NumericDomainError unless OD > ID > 0 and HT > 0
void validate_core(const CoreGeometry& core);

// Throws NumericDomainError on a bad core, turns < 1 or a negative shunt capacitance
void validate_inductor(const ToroidInductor& inductor);

// HT * log10(OD/ID), in mm
double core_factor(const CoreGeometry& core);

// Inductance per unit relative permeability: FERRITE_K * N^2 * core_factor, in H
double inductance_factor(const ToroidInductor& inductor);

#endif // TOROID_HPP
