// File: include/cogsim/core/model/schedule.hpp
#pragma once

#include <vector>

#include "cogsim/core/config.hpp"
#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/types.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

struct SessionSlot {
  int day_index = 0;  // days since the patient's first session
  EpochSeconds timestamp;
};

// One session per calendar day: start + day + random time inside `window`.
std::vector<SessionSlot> daily_schedule(const CivilDate& start, int days, const IntradayWindow& window, Rng& rng);

// `records_per_patient` sessions inside [start, start + window_days], each at
// least `min_gap_days` after the previous one, between 08:00 and 18:59.
std::vector<SessionSlot> historical_schedule(const CivilDate& start, const HistoricalConfig& cfg, Rng& rng);

}  // namespace cogsim
