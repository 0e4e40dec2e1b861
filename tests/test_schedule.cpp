// File: tests/test_schedule.cpp
#include <catch2/catch.hpp>

#include <cstdint>

#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/model/schedule.hpp"
#include "cogsim/core/util/civil_time.hpp"

using namespace cogsim;

TEST_CASE("daily schedule has one session per calendar day", "[schedule]") {
  const CivilDate start{2025, 9, 1};
  Rng rng(4);
  const auto slots = daily_schedule(start, 30, tables::composite::kWindow, rng);
  REQUIRE(slots.size() == 30);

  const std::int64_t day0 = to_epoch(start).s;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    CHECK(slots[i].day_index == static_cast<int>(i));
    const std::int64_t sec = slots[i].timestamp.s - day0 - static_cast<std::int64_t>(i) * kSecondsPerDay;
    // 08:00 .. 08:50
    REQUIRE(sec >= 8 * 3600);
    REQUIRE(sec <= 8 * 3600 + 50 * 60);
    if (i > 0) REQUIRE(slots[i - 1].timestamp < slots[i].timestamp);
  }
  CHECK(format_iso_datetime(slots[0].timestamp, false).rfind("2025-09-01T08:", 0) == 0);
}

TEST_CASE("historical sessions are sparse and well spaced", "[schedule][historical]") {
  HistoricalConfig cfg;
  cfg.records_per_patient = 5;
  cfg.window_days = 365;
  cfg.min_gap_days = 30;

  const CivilDate start{2024, 1, 1};
  const std::int64_t day0 = to_epoch(start).s;
  for (std::uint64_t seed = 0; seed < 50; ++seed) {
    Rng rng(seed);
    const auto slots = historical_schedule(start, cfg, rng);
    REQUIRE(slots.size() == 5);
    CHECK(slots.front().day_index == 0);
    for (std::size_t i = 1; i < slots.size(); ++i) {
      REQUIRE(slots[i].day_index - slots[i - 1].day_index >= 30);
      REQUIRE(slots[i].timestamp > slots[i - 1].timestamp);
    }
    REQUIRE(slots.back().timestamp.s < day0 + 366 * kSecondsPerDay);
    for (const auto& s : slots) {
      const std::int64_t sec = (s.timestamp.s - day0) % kSecondsPerDay;
      REQUIRE(sec >= 8 * 3600);
      REQUIRE(sec < 19 * 3600);
    }
  }
}

TEST_CASE("historical schedule with a tight window", "[schedule][historical]") {
  HistoricalConfig cfg;
  cfg.records_per_patient = 3;
  cfg.window_days = 60;
  cfg.min_gap_days = 30;
  Rng rng(6);
  const auto slots = historical_schedule(CivilDate{2025, 1, 1}, cfg, rng);
  REQUIRE(slots.size() == 3);
  CHECK(slots[1].day_index == 30);
  CHECK(slots[2].day_index == 60);
}
