#include "toroid.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>

void validate_core(const CoreGeometry& core) {
    const double od = core.outer_diameter_mm;
    const double id = core.inner_diameter_mm;
    const double ht = core.height_mm;

    if (!std::isfinite(od) || !std::isfinite(id) || !std::isfinite(ht)) {
        throw NumericDomainError("core dimensions must be finite");
    }
    if (id <= 0.0 || ht <= 0.0) {
        std::ostringstream msg;
        msg << "core dimensions must be positive (ID = " << id << " mm, HT = " << ht << " mm)";
        throw NumericDomainError(msg.str());
    }
    // log10(OD/ID) is zero or negative otherwise
    if (od <= id) {
        std::ostringstream msg;
        msg << "outer diameter (" << od << " mm) must exceed inner diameter (" << id << " mm)";
        throw NumericDomainError(msg.str());
    }
}

void validate_inductor(const ToroidInductor& inductor) {
    validate_core(inductor.core);

    if (inductor.turns < 1) {
        std::ostringstream msg;
        msg << "turn count must be at least 1, got " << inductor.turns;
        throw NumericDomainError(msg.str());
    }
    if (!std::isfinite(inductor.shunt_capacitance) || inductor.shunt_capacitance < 0.0) {
        std::ostringstream msg;
        msg << "shunt capacitance must be a non-negative value, got " << inductor.shunt_capacitance << " F";
        throw NumericDomainError(msg.str());
    }
}

double core_factor(const CoreGeometry& core) {
    return core.height_mm * std::log10(core.outer_diameter_mm / core.inner_diameter_mm);
}

double inductance_factor(const ToroidInductor& inductor) {
    const double n = static_cast<double>(inductor.turns);
    return FERRITE_K * n * n * core_factor(inductor.core);
}
