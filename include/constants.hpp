// constants.hpp
#pragma once

// Define mathematical constants if not already defined
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Empirical ferrite toroid constant (Fair-Rite, "Specifying a Ferrite for EMI Suppression").
// Folds mu_0, the mm -> m conversion and ln -> log10 into one factor:
// L = FERRITE_K * N^2 * mu * HT[mm] * log10(OD/ID)
#define FERRITE_K 4.6052e-10

// Default core: 12 tight turns on an FT-240 Mix 31 core
#define DEFAULT_TURNS      12
#define DEFAULT_OD_MM      61.0     // outer diameter
#define DEFAULT_ID_MM      35.55    // inner diameter
#define DEFAULT_HT_MM      12.7     // height
#define DEFAULT_CSHUNT_F   0.65e-12 // sets the self-resonant frequency
#define DEFAULT_LABEL      "12 tight turns on FT-240 Mix 31 Core"

// Sweeps at least this long are evaluated with OpenMP
#define PARALLEL_SWEEP_MIN_SAMPLES 4096

// Plot styling (MATLAB default second colour order entry)
#define PLOT_LINE_COLOR "#4DBEEE"
#define PLOT_WIDTH_PX   1000
#define PLOT_HEIGHT_PX  667
