// File: tests/test_trend.cpp
#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/model/trend.hpp"

using namespace cogsim;

namespace {

constexpr TrendSpec kAdditive{PracticeForm::kAdditive, 4, 10, 0.6, 1.0, 0.0};
constexpr TrendSpec kMultiplier{PracticeForm::kMultiplier, 4, 20, 0.55, 1.0, 0.75};

}  // namespace

TEST_CASE("trend phases follow practice, plateau, decline", "[trend]") {
  const TrendModel declining(kAdditive, true);
  CHECK(declining.phase(0) == TrendPhase::kPractice);
  CHECK(declining.phase(4) == TrendPhase::kPractice);
  CHECK(declining.phase(5) == TrendPhase::kPlateau);
  CHECK(declining.phase(10) == TrendPhase::kPlateau);
  CHECK(declining.phase(11) == TrendPhase::kDecline);
  CHECK(declining.phase(60) == TrendPhase::kDecline);

  const TrendModel stable(kAdditive, false);
  CHECK(stable.phase(11) == TrendPhase::kPlateau);
  CHECK(stable.phase(365) == TrendPhase::kPlateau);
  CHECK(stable.phase(0) == TrendPhase::kPractice);
}

TEST_CASE("practiced and decline day counts", "[trend]") {
  const TrendModel m(kAdditive, true);
  CHECK(m.practiced_days(0) == 0);
  CHECK(m.practiced_days(3) == 3);
  CHECK(m.practiced_days(29) == 4);
  CHECK(m.decline_days(10) == 0);
  CHECK(m.decline_days(13) == 3);

  const TrendModel off(kAdditive, false);
  CHECK(off.decline_days(13) == 0);
}

TEST_CASE("additive trend moves toward better then worse", "[trend]") {
  const TrendModel m(kAdditive, true);
  const FieldTrend f{1.0, 0.5};

  // Word counts: higher is better.
  CHECK(m.apply(20.0, f, Direction::kHigherIsBetter, 0) == Approx(20.0));
  CHECK(m.apply(20.0, f, Direction::kHigherIsBetter, 2) == Approx(22.0));
  CHECK(m.apply(20.0, f, Direction::kHigherIsBetter, 8) == Approx(24.0));
  CHECK(m.apply(20.0, f, Direction::kHigherIsBetter, 14) == Approx(24.0 - 2.0));

  // Completion times: lower is better.
  CHECK(m.apply(150.0, f, Direction::kLowerIsBetter, 4) == Approx(146.0));
  CHECK(m.apply(150.0, f, Direction::kLowerIsBetter, 20) == Approx(146.0 + 5.0));
}

TEST_CASE("multiplier form saturates at one", "[trend]") {
  const TrendModel m(kMultiplier, true);
  CHECK(m.practice_multiplier(0.07, 0) == Approx(0.75));
  CHECK(m.practice_multiplier(0.07, 2) == Approx(0.89));
  CHECK(m.practice_multiplier(0.07, 4) == Approx(1.0));
  CHECK(m.practice_multiplier(0.07, 30) == Approx(1.0));
  CHECK(m.decline_factor(0.05, 20) == Approx(0.0));
  CHECK(m.decline_factor(0.05, 24) == Approx(0.2));
}

TEST_CASE("high cognitive factor never enters late decline", "[trend][decline]") {
  for (std::uint64_t seed = 0; seed < 200; ++seed) {
    Rng rng(seed);
    const TrendModel m = TrendModel::for_patient(tables::composite::kTrend, 0.9, rng);
    REQUIRE_FALSE(m.decline_active());
    for (int day = 0; day < 120; ++day) REQUIRE(m.phase(day) != TrendPhase::kDecline);
  }
}

TEST_CASE("low cognitive factor declines when the gate is certain", "[trend][decline]") {
  Rng rng(5);
  const TrendModel m = TrendModel::for_patient(tables::composite::kTrend, 0.4, rng);
  CHECK(m.decline_active());
  CHECK(m.phase(21) == TrendPhase::kDecline);
}

TEST_CASE("decline gate consumes the same draws for any cf", "[trend][decline]") {
  Rng a(11);
  Rng b(11);
  (void)TrendModel::for_patient(tables::memory::kTrend, 0.95, a);
  (void)TrendModel::for_patient(tables::memory::kTrend, 0.35, b);
  CHECK(a.unit() == b.unit());
}

TEST_CASE("field trend rates stay inside their ranges", "[trend]") {
  Rng rng(3);
  const FieldTrendSpec spec{{0.5, 1.5}, {0.05, 0.25}};
  for (int i = 0; i < 500; ++i) {
    const FieldTrend f = sample_field_trend(spec, rng);
    REQUIRE(f.practice_gain >= 0.5);
    REQUIRE(f.practice_gain <= 1.5);
    REQUIRE(f.decline_rate >= 0.05);
    REQUIRE(f.decline_rate <= 0.25);
  }
}
