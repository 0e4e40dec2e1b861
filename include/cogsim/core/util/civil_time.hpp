// File: include/cogsim/core/util/civil_time.hpp
#pragma once

#include <cstdint>
#include <string>

#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// Strict "YYYY-MM-DD". Rejects impossible dates (2025-02-30).
Result<CivilDate> parse_iso_date(const std::string& s);

// Proleptic Gregorian calendar, days relative to 1970-01-01.
std::int64_t days_from_civil(const CivilDate& d);
CivilDate civil_from_days(std::int64_t days);

EpochSeconds to_epoch(const CivilDate& d);

// "2025-09-01T08:23:00", with a trailing 'Z' when utc_suffix is set.
std::string format_iso_datetime(EpochSeconds t, bool utc_suffix);

// "2025-09-01"
std::string format_iso_date(const CivilDate& d);

}  // namespace cogsim
