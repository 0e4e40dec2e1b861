// File: src/core/model/schedule.cpp
#include "cogsim/core/model/schedule.hpp"

#include <algorithm>

#include "cogsim/core/util/civil_time.hpp"

namespace cogsim {
namespace {

EpochSeconds at(const EpochSeconds& day0, int day_offset, const IntradayWindow& w, Rng& rng) {
  const int hour = rng.uniform_int(w.hour_lo, w.hour_hi);
  const int minute = rng.uniform_int(w.minute_lo, w.minute_hi);
  return EpochSeconds{day0.s + static_cast<std::int64_t>(day_offset) * kSecondsPerDay +
                      static_cast<std::int64_t>(hour) * 3600 + static_cast<std::int64_t>(minute) * 60};
}

}  // namespace

std::vector<SessionSlot> daily_schedule(const CivilDate& start, int days, const IntradayWindow& window, Rng& rng) {
  const EpochSeconds day0 = to_epoch(start);
  std::vector<SessionSlot> out;
  out.reserve(static_cast<std::size_t>(std::max(0, days)));
  for (int d = 0; d < days; ++d) {
    out.push_back(SessionSlot{d, at(day0, d, window, rng)});
  }
  return out;
}

std::vector<SessionSlot> historical_schedule(const CivilDate& start, const HistoricalConfig& cfg, Rng& rng) {
  const int n = std::max(1, cfg.records_per_patient);
  const int gap = std::max(1, cfg.min_gap_days);

  // Sorted offsets in [0, slack], then spread by gap * i: consecutive
  // sessions are >= gap days apart and the last lands within the window.
  const int slack = std::max(0, cfg.window_days - gap * (n - 1));
  std::vector<int> offsets(static_cast<std::size_t>(n));
  for (int& o : offsets) o = rng.uniform_int(0, slack);
  std::sort(offsets.begin(), offsets.end());
  for (int i = 0; i < n; ++i) offsets[static_cast<std::size_t>(i)] += gap * i;

  const EpochSeconds day0 = to_epoch(start);
  std::vector<SessionSlot> out;
  out.reserve(offsets.size());
  for (int off : offsets) {
    out.push_back(SessionSlot{off - offsets.front(), at(day0, off, tables::kHistoricalWindow, rng)});
  }
  return out;
}

}  // namespace cogsim
