// File: src/core/util/repro_hash.cpp
#include "cogsim/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

#include "cogsim/core/io/record_codec.hpp"

namespace cogsim {
namespace {

// FNV-1a 64-bit. Not cryptographic; fast and stable across platforms.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v) { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Length prefix so ("ab","c") != ("a","bc").
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_coupling(Fnv1a64& h, const CouplingConfig& c) {
  h.add_double(c.intrusion_base);
  h.add_double(c.intrusion_gap_weight);
  h.add_double(c.intrusion_cf_pivot);
  h.add_double(c.intrusion_cf_weight);
  h.add_double(c.intrusion_depression_weight);
  h.add_double(c.intrusion_depression_scale);
  h.add_double(c.intrusion_min);
  h.add_double(c.intrusion_max);
  h.add_double(c.missed_trials_rt_threshold_ms);
  h.add_double(c.missed_trials_rt_scale_ms);
  h.add_double(c.missed_trials_sd);
  h.add_double(c.attention_span_pivot);
  h.add_double(c.attention_error_weight);
  h.add_double(c.attention_error_sd);
  h.add_double(c.orientation_cf_pivot);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Generator.
  const GeneratorConfig& g = cfg.generator;
  h.add_string(g.simulator);
  h.add_string(g.schedule);
  h.add_i32(g.patients);
  h.add_i32(g.days);
  h.add_string(g.start_date);
  h.add_bool(g.seed.has_value());
  h.add_u64(g.seed.value_or(0));
  h.add_bool(g.use_all_profiles);
  h.add_bool(g.allow_synthetic);
  h.add_bool(g.strict_count);
  // workers: not hashed, output does not depend on it.

  // Profiles.
  h.add_string(cfg.profiles.path);
  h.add_bool(cfg.profiles.search);

  // Historical schedule.
  h.add_i32(cfg.historical.records_per_patient);
  h.add_i32(cfg.historical.window_days);
  h.add_i32(cfg.historical.min_gap_days);

  add_coupling(h, cfg.coupling);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_string(cfg.output.format);

  h.add_i32(cfg.profile_synth.count);

  return to_hex(h.h);
}

std::string compute_records_digest(const std::vector<SessionRecord>& records, SimulatorKind kind) {
  Fnv1a64 h;
  for (const SessionRecord& r : records) {
    const std::string line = encode_record_json(r, kind);
    h.add_bytes(line.data(), line.size());
    h.add_bytes("\n", 1);
  }
  return to_hex(h.h);
}

}  // namespace cogsim
