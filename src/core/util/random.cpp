// File: src/core/util/random.cpp
#include "cogsim/core/util/random.hpp"

#include <algorithm>
#include <cmath>

namespace cogsim {
namespace {

std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ull;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return x ^ (x >> 31);
}

}  // namespace

Rng::Rng(std::uint64_t seed) : engine_(seed) {}

std::uint64_t Rng::derive_seed(std::uint64_t base, RngStream stream, std::uint64_t index) {
  std::uint64_t h = splitmix64(base);
  h = splitmix64(h ^ static_cast<std::uint64_t>(stream));
  return splitmix64(h ^ index);
}

std::uint64_t Rng::entropy_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

double Rng::unit() {
  // 53 random bits -> [0, 1). Avoids generate_canonical's rare 1.0 result.
  return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
}

double Rng::uniform(double lo, double hi) {
  return lo + (hi - lo) * unit();
}

int Rng::uniform_int(int lo, int hi) {
  if (hi <= lo) return lo;
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(engine_);
}

double Rng::normal(double mean, double sd) {
  std::normal_distribution<double> dist(0.0, 1.0);
  return mean + sd * dist(engine_);
}

bool Rng::bernoulli(double p) {
  return unit() < p;
}

std::size_t Rng::weighted_index(const std::vector<double>& weights) {
  double total = 0.0;
  for (double w : weights) total += std::max(0.0, w);
  if (weights.empty() || total <= 0.0) return 0;

  double r = unit() * total;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    const double w = std::max(0.0, weights[i]);
    if (r < w) return i;
    r -= w;
  }
  return weights.size() - 1;
}

double Rng::triangular(double lo, double hi, double mode) {
  const double u = unit();
  if (hi <= lo) return lo;
  const double c = (mode - lo) / (hi - lo);
  if (u < c) return lo + std::sqrt(u * (hi - lo) * (mode - lo));
  return hi - std::sqrt((1.0 - u) * (hi - lo) * (hi - mode));
}

std::string Rng::uuid4() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::uint64_t hi = engine_();
  std::uint64_t lo = engine_();

  // Version nibble (4) and RFC 4122 variant bits (10xx).
  hi = (hi & 0xffffffffffff0fffull) | 0x0000000000004000ull;
  lo = (lo & 0x3fffffffffffffffull) | 0x8000000000000000ull;

  std::string out;
  out.reserve(36);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(hi >> (i * 4)) & 0xF]);
    if (i == 8 || i == 4) out.push_back('-');
  }
  out.push_back('-');
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(lo >> (i * 4)) & 0xF]);
    if (i == 12) out.push_back('-');
  }
  return out;
}

}  // namespace cogsim
