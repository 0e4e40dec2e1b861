// File: include/cogsim/core/util/random.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace cogsim {

// Independent random streams derived from one base seed.
enum class RngStream : std::uint64_t {
  kIdentity = 1,  // synthetic patient ids
  kPatient = 2,   // per-patient baselines, schedule and sessions
  kProfiles = 3,  // synthetic profile generator
};

// Explicitly seeded generator handle. Never shared between threads; a worker
// derives its own instance with derive_seed().
class Rng {
 public:
  explicit Rng(std::uint64_t seed);

  // splitmix64 over (base, stream, index). Stable across platforms.
  static std::uint64_t derive_seed(std::uint64_t base, RngStream stream, std::uint64_t index);

  // Fresh non-deterministic seed for runs without a configured seed.
  static std::uint64_t entropy_seed();

  // [0, 1)
  double unit();

  // [lo, hi); returns lo when lo == hi.
  double uniform(double lo, double hi);

  // Inclusive [lo, hi].
  int uniform_int(int lo, int hi);

  // mean + sd * z with one standard normal draw, so shifting the mean never
  // changes which draw a caller receives.
  double normal(double mean, double sd);

  bool bernoulli(double p);

  // Index drawn proportionally to non-negative weights.
  std::size_t weighted_index(const std::vector<double>& weights);

  // Triangular distribution with the given mode.
  double triangular(double lo, double hi, double mode);

  // RFC 4122 version 4 UUID drawn from this generator.
  std::string uuid4();

 private:
  std::mt19937_64 engine_;
};

}  // namespace cogsim
