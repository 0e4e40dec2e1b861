// File: include/cogsim/core/model/noise.hpp
#pragma once

#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

double round_value(double v, Rounding r);

// Field rounding, then clipping to [lo, hi]. Clipping last keeps every emitted
// value inside its interval whatever the rounding mode.
double finish_value(const FieldSpec& f, double raw);

// finish_value(f, N(mean, f.noise_sd))
double observe(const FieldSpec& f, double mean, Rng& rng);

// Same as observe() for integer-valued fields.
int observe_count(const FieldSpec& f, double mean, Rng& rng);

// finish_value() for integer-valued fields computed elsewhere.
int finish_count(const FieldSpec& f, double raw);

}  // namespace cogsim
