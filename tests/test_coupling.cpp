// File: tests/test_coupling.cpp
#include <catch2/catch.hpp>

#include "cogsim/core/config.hpp"
#include "cogsim/core/model/coupling.hpp"

using namespace cogsim;

TEST_CASE("intrusion probability combines gap, cf and depression", "[coupling]") {
  const CouplingConfig c;

  // 0.10 + 0.05*2 + 0.16*0.15 + 0.12*(6/30)
  CHECK(coupling::intrusion_probability(c, 4, 2, 0.4, 6) == Approx(0.10 + 0.10 + 0.024 + 0.024));

  // No gap, healthy cf, no depression: just the base.
  CHECK(coupling::intrusion_probability(c, 3, 3, 0.9, 0) == Approx(0.10));

  // Delayed above immediate never lowers the probability.
  CHECK(coupling::intrusion_probability(c, 2, 4, 0.9, 0) == Approx(0.10));
}

TEST_CASE("intrusion probability is clipped", "[coupling]") {
  CouplingConfig c;
  CHECK(coupling::intrusion_probability(c, 5, 0, 0.3, 27) == Approx(c.intrusion_max));

  c.intrusion_base = -1.0;
  CHECK(coupling::intrusion_probability(c, 0, 0, 1.0, 0) == Approx(c.intrusion_min));
}

TEST_CASE("intrusion flag compares the uniform draw", "[coupling]") {
  const CouplingConfig c;
  CHECK(coupling::intrusion_errors(c, 3, 3, 0.9, 0, 0.05) == 1);
  CHECK(coupling::intrusion_errors(c, 3, 3, 0.9, 0, 0.15) == 0);
}

TEST_CASE("missed trials only for slow reaction times", "[coupling]") {
  const CouplingConfig c;
  CHECK(coupling::missed_trials_mean(c, 760.0) == Approx(1.0));
  CHECK(coupling::missed_trials(c, 600, 3.7) == 0.0);
  CHECK(coupling::missed_trials(c, 590, 2.0) == 0.0);
  CHECK(coupling::missed_trials(c, 700, 2.9) == 2.0);
  CHECK(coupling::missed_trials(c, 700, -0.8) == 0.0);
}

TEST_CASE("attention and executive error means", "[coupling]") {
  const CouplingConfig c;
  CHECK(coupling::attention_errors_mean(c, 4) == Approx(1.2));
  CHECK(coupling::attention_errors_mean(c, 8) == Approx(-1.2));
  CHECK(coupling::tmt_errors_mean(110.0) == Approx(1.0));
  CHECK(coupling::tmt_errors_mean(60.0) == Approx(0.0));
}

TEST_CASE("pause lengthens when fluency drops", "[coupling]") {
  CHECK(coupling::pause_from_fluency(1000.0, 20.0, 20.0) == Approx(1000.0));
  CHECK(coupling::pause_from_fluency(1000.0, 20.0, 10.0) == Approx(2000.0));
  CHECK(coupling::pause_from_fluency(1000.0, 20.0, 0.2) == Approx(20000.0));
}

TEST_CASE("orientation probability shifts with cf", "[coupling]") {
  CHECK(coupling::orientation_probability(0.85, 0.6, 0.6, 0.25, 0.0, 0.05) == Approx(0.85));
  CHECK(coupling::orientation_probability(0.85, 0.6, 1.0, 0.25, 0.0, 0.05) == Approx(0.95));
  CHECK(coupling::orientation_probability(0.85, 0.6, 0.6, 0.25, 1.0, 0.05) == Approx(0.80));
}

TEST_CASE("fall probability grows below the gait pivot", "[coupling]") {
  CHECK(coupling::fall_probability(1.2) == Approx(0.02));
  CHECK(coupling::fall_probability(0.5) == Approx(0.04));
}

TEST_CASE("mood score and orientation total", "[coupling]") {
  CHECK(coupling::mood_score(0.5) == 3);
  CHECK(coupling::mood_score(1.0) == 5);
  CHECK(coupling::mood_score(0.0) == 1);
  CHECK(coupling::mood_score(0.8) == 4);

  CHECK(coupling::orientation_correct(true, true) == 8);
  CHECK(coupling::orientation_correct(true, false) == 4);
  CHECK(coupling::orientation_correct(false, false) == 0);
}
