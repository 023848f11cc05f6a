#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <iosfwd>

#include "config.hpp"

// Load -> compute -> write CSV and gnuplot script -> optional render -> report.
// Progress goes to log. The inductor is validated before the material file is
// opened. Pipeline errors propagate as exceptions; returns 1 if the output
// directory cannot be created, 0 otherwise.
int run_pipeline(const RunConfig& cfg, std::ostream& log);

#endif // PIPELINE_HPP
