// File: src/core/model/noise.cpp
#include "cogsim/core/model/noise.hpp"

#include <algorithm>
#include <cmath>

namespace cogsim {

double round_value(double v, Rounding r) {
  switch (r) {
    case Rounding::kNearest: return std::round(v);
    case Rounding::kTruncate: return std::trunc(v);
    case Rounding::kOneDecimal: return std::round(v * 10.0) / 10.0;
    case Rounding::kTwoDecimals: return std::round(v * 100.0) / 100.0;
  }
  return v;
}

double finish_value(const FieldSpec& f, double raw) {
  return std::clamp(round_value(raw, f.rounding), f.lo, f.hi);
}

double observe(const FieldSpec& f, double mean, Rng& rng) {
  return finish_value(f, rng.normal(mean, f.noise_sd));
}

int observe_count(const FieldSpec& f, double mean, Rng& rng) {
  return static_cast<int>(observe(f, mean, rng));
}

int finish_count(const FieldSpec& f, double raw) {
  return static_cast<int>(finish_value(f, raw));
}

}  // namespace cogsim
