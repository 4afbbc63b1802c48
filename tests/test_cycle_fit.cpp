#include "pk_curve.hpp"
#include "regimen.hpp"
#include <catch2/catch.hpp>
#include <cmath>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {
TargetCurve flat_curve(double level, int n_days = 28) {
  TargetCurve c;
  for (int i = 0; i < n_days; ++i) {
    c.day.push_back(i);
    c.level.push_back(level);
  }
  return c;
}
} // namespace

TEST_CASE("CYCLE FIT CANDIDATES", "[cyclefit]") {
  PkRegistry reg = PkRegistry::builtin();
  CycleFitter fitter(reg);
  TargetCurve target = menstrual_reference_curve();

  auto cands = fitter.candidates("EEn im", target.day);
  // intervals 3.5, 4, 5, 7, 9, 10, 14, 28 -> 4+4+5+7+9+10+14+28 phases
  REQUIRE(cands.size() == 81);
  REQUIRE(cands.front().interval_days == 3.5);
  REQUIRE(cands.back().interval_days == 28.0);
  REQUIRE(cands.back().phase_days == 27.0);
  for (const auto &c : cands) {
    REQUIRE(c.interval_days >= 2.0);
    REQUIRE(c.interval_days <= 28.0);
    REQUIRE(c.phase_days < c.interval_days);
    REQUIRE(c.basis.size() == target.day.size());
  }

  SECTION("Preferred intervals outside the pool are added") {
    auto eb = fitter.candidates("EB im", target.day);
    REQUIRE(eb.front().interval_days == 2.0);
    REQUIRE(eb.size() == 81 + 2 + 3);
  }

  SECTION("Basis is the shifted steady state") {
    const PkParams &p = reg.at("EEn im");
    Vector basis = fitter.basis_curve(p, 7.0, 3.0, target.day);
    REQUIRE_THAT(basis[5], WithinRel(steady_state_unit_level(2.0, 7.0, p), 1e-12));
    // day 1 is 5 days after the previous cycle's dose on day -4
    REQUIRE_THAT(basis[1], WithinRel(steady_state_unit_level(5.0, 7.0, p), 1e-12));
  }
}

TEST_CASE("CYCLE FIT MENSTRUAL REFERENCE", "[cyclefit]") {
  PkRegistry reg = PkRegistry::builtin();
  CycleFitter fitter(reg);
  TargetCurve target = menstrual_reference_curve();
  REQUIRE(target.day.size() == 28);

  auto fit = fitter.fit_cycle("EEn im", target, 4);
  REQUIRE(fit.has_value());
  REQUIRE(fit->schedules.size() == 3);

  // greedy picks, in order
  REQUIRE(fit->schedules[0].interval_days == 28.0);
  REQUIRE(fit->schedules[0].phase_days == 8.0);
  REQUIRE(fit->schedules[0].dose_mg == 4.0);
  REQUIRE(fit->schedules[1].phase_days == 18.0);
  REQUIRE(fit->schedules[1].dose_mg == 1.5);
  REQUIRE(fit->schedules[2].phase_days == 5.0);
  REQUIRE(fit->schedules[2].dose_mg == 0.5);
  for (const auto &s : fit->schedules)
    REQUIRE(s.model_key == "EEn im");

  REQUIRE_THAT(fit->residual_rms, WithinAbs(32.6393, 1e-3));
  REQUIRE(fit->fitted_curve.size() == 28);
  REQUIRE_THAT(fit->fitted_curve[0], WithinAbs(83.0, 0.05));
  REQUIRE_THAT(fit->fitted_curve[14], WithinAbs(156.0, 0.05));
}

TEST_CASE("CYCLE FIT PROPERTIES", "[cyclefit]") {
  PkRegistry reg = PkRegistry::builtin();
  CycleFitter fitter(reg);

  SECTION("Greedy steps never increase the unrounded MSE") {
    TargetCurve target = menstrual_reference_curve();
    auto cands = fitter.candidates("EV im", target.day);
    Vector trace;
    auto picked = fitter.greedy_select(cands, target.level, 4, &trace);
    REQUIRE(picked.size() == trace.size());
    REQUIRE_FALSE(picked.empty());

    double baseline = mean_square_error(target.level, Vector(28, 0.0));
    REQUIRE(trace[0] < baseline);
    for (std::size_t i = 1; i < trace.size(); ++i)
      REQUIRE(trace[i] <= trace[i - 1]);
  }

  SECTION("Flat target picks an interval that divides the cycle") {
    auto fit = fitter.fit_cycle("EEn im", flat_curve(400.0), 1);
    REQUIRE(fit.has_value());
    REQUIRE(fit->schedules.size() == 1);
    const Schedule &s = fit->schedules[0];
    REQUIRE(std::fmod(28.0, s.interval_days) == 0.0);
    REQUIRE(s.interval_days == 3.5);
    REQUIRE(s.dose_mg == 3.0);
    REQUIRE(fit->residual_rms >= 0.0);
    REQUIRE(fit->residual_rms < 0.05 * 400.0);
  }

  SECTION("Residual is zero only for an exact fit") {
    const PkParams &p = reg.at("EC im");
    TargetCurve exact;
    for (int i = 0; i < 28; ++i)
      exact.day.push_back(i);
    exact.level = fitter.basis_curve(p, 7.0, 2.0, exact.day);
    for (double &v : exact.level)
      v *= 5.0;

    auto fit = fitter.fit_cycle("EC im", exact, 1);
    REQUIRE(fit.has_value());
    REQUIRE(fit->schedules[0].interval_days == 7.0);
    REQUIRE(fit->schedules[0].phase_days == 2.0);
    REQUIRE(fit->schedules[0].dose_mg == 5.0);
    REQUIRE_THAT(fit->residual_rms, WithinAbs(0.0, 1e-9));
  }

  SECTION("Target points beyond the cycle are ignored") {
    TargetCurve longer = menstrual_reference_curve();
    longer.day.push_back(28.0);
    longer.level.push_back(46.34);
    longer.day.push_back(29.0);
    longer.level.push_back(41.19);
    auto a = fitter.fit_cycle("EEn im", longer, 4);
    auto b = fitter.fit_cycle("EEn im", menstrual_reference_curve(), 4);
    REQUIRE(a.has_value());
    REQUIRE(a->fitted_curve.size() == 28);
    REQUIRE(a->residual_rms == b->residual_rms);
  }

  SECTION("Nothing to fit") {
    REQUIRE_FALSE(fitter.fit_cycle("EEn im", flat_curve(0.0), 4).has_value());
    REQUIRE_FALSE(fitter.fit_cycle("EEn im", TargetCurve{}, 4).has_value());
    REQUIRE_FALSE(fitter.fit_cycle("EX retired", flat_curve(100.0), 4).has_value());
    // fitted doses too small to keep
    REQUIRE_FALSE(fitter.fit_cycle("EEn im", flat_curve(5.0), 4).has_value());
  }

  SECTION("Coincident rate constants are not supported") {
    PkRegistry custom({{"X", {100.0, 0.5, 0.5, 0.3}}}, {}, {});
    CycleFitter f(custom);
    REQUIRE_FALSE(f.fit_cycle("X", flat_curve(100.0), 4).has_value());
  }
}
