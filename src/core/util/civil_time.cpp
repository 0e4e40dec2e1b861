// File: src/core/util/civil_time.cpp
#include "cogsim/core/util/civil_time.hpp"

#include <cctype>
#include <cstdio>

namespace cogsim {
namespace {

bool is_leap(int y) { return (y % 4 == 0) && ((y % 100 != 0) || (y % 400 == 0)); }

int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

bool parse_digits(const std::string& s, std::size_t pos, std::size_t n, int* out) {
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

// Floor division for negative day counts (pre-1970 dates of birth).
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

}  // namespace

Result<CivilDate> parse_iso_date(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
    return Result<CivilDate>::err(Status::invalid_argument("date must be YYYY-MM-DD: '" + s + "'"));
  }
  CivilDate d;
  if (!parse_digits(s, 0, 4, &d.year) || !parse_digits(s, 5, 2, &d.month) ||
      !parse_digits(s, 8, 2, &d.day)) {
    return Result<CivilDate>::err(Status::invalid_argument("date must be YYYY-MM-DD: '" + s + "'"));
  }
  if (d.month < 1 || d.month > 12) {
    return Result<CivilDate>::err(Status::invalid_argument("month out of range in '" + s + "'"));
  }
  if (d.day < 1 || d.day > days_in_month(d.year, d.month)) {
    return Result<CivilDate>::err(Status::invalid_argument("day out of range in '" + s + "'"));
  }
  return Result<CivilDate>::ok(d);
}

// Era-based conversion (400-year cycles of 146097 days).
std::int64_t days_from_civil(const CivilDate& d) {
  const std::int64_t y = static_cast<std::int64_t>(d.year) - (d.month <= 2 ? 1 : 0);
  const std::int64_t era = floor_div(y, 400);
  const std::int64_t yoe = y - era * 400;
  const std::int64_t m = d.month;
  const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d.day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = floor_div(z, 146097);
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return CivilDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

EpochSeconds to_epoch(const CivilDate& d) {
  return EpochSeconds{days_from_civil(d) * kSecondsPerDay};
}

std::string format_iso_datetime(EpochSeconds t, bool utc_suffix) {
  const std::int64_t days = floor_div(t.s, kSecondsPerDay);
  const std::int64_t sec_of_day = t.s - days * kSecondsPerDay;
  const CivilDate d = civil_from_days(days);

  const int hours = static_cast<int>(sec_of_day / 3600);
  const int minutes = static_cast<int>((sec_of_day % 3600) / 60);
  const int seconds = static_cast<int>(sec_of_day % 60);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d%s",
                d.year, d.month, d.day, hours, minutes, seconds, utc_suffix ? "Z" : "");
  return std::string(buffer);
}

std::string format_iso_date(const CivilDate& d) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", d.year, d.month, d.day);
  return std::string(buffer);
}

}  // namespace cogsim
