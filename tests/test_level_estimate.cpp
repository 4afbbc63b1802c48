#include "level_estimate.hpp"
#include "pk_curve.hpp"
#include <catch2/catch.hpp>
#include <cmath>
#include <type_traits>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {
const double T0 = 1735689600.0; // 2025-01-01T00:00:00Z
const double DAY = SECONDS_PER_DAY;
} // namespace

// Components keep a reference to the registry; temporaries are rejected
static_assert(std::is_constructible<LevelEstimator, const PkRegistry &>::value,
              "");
static_assert(!std::is_constructible<LevelEstimator, PkRegistry &&>::value, "");

TEST_CASE("LEVEL AT", "[aggregate]") {
  PkRegistry reg = PkRegistry::builtin();
  LevelEstimator est(reg);
  const PkParams &een = reg.at("EEn im");

  std::vector<DoseRecord> doses{{T0, "EEn im", 4.0, DoseSource::Manual},
                                {T0 + 7 * DAY, "EEn im", 4.0,
                                 DoseSource::Automatic}};

  SECTION("Sum of single dose curves") {
    double now = T0 + 10 * DAY;
    double expected = single_dose_level(10.0, 4.0, een) +
                      single_dose_level(3.0, 4.0, een);
    REQUIRE_THAT(est.level_at(now, doses), WithinRel(expected, 1e-12));
  }

  SECTION("Nothing before the first dose") {
    REQUIRE(est.level_at(T0 - DAY, doses) == 0.0);
    REQUIRE(est.level_at(T0, doses) == 0.0);
    REQUIRE(est.level_at(T0, {}) == 0.0);
  }

  SECTION("Linear in scale") {
    double now = T0 + 9.5 * DAY;
    double base = est.level_at(now, doses);
    REQUIRE_THAT(est.level_at(now, doses, 1.37), WithinRel(1.37 * base, 1e-12));
    REQUIRE(est.level_at(now, doses, 0.0) == 0.0);
  }

  SECTION("Linear in each amount") {
    double now = T0 + 9.5 * DAY;
    std::vector<DoseRecord> doubled = doses;
    doubled[1].amount_mg *= 2.0;
    double first = est.dose_level(now, doses[0]);
    double second = est.dose_level(now, doses[1]);
    REQUIRE_THAT(est.level_at(now, doubled),
                 WithinRel(first + 2.0 * second, 1e-12));
  }

  SECTION("Unknown models are skipped") {
    std::vector<DoseRecord> mixed = doses;
    mixed.push_back({T0, "EX retired", 10.0, DoseSource::Manual});
    double now = T0 + 8 * DAY;
    REQUIRE(est.level_at(now, mixed) == est.level_at(now, doses));
  }

  SECTION("Patch models use the wear time") {
    DoseRecord patch{T0, "patch tw", 100.0, DoseSource::Manual};
    const PkParams &p = reg.at("patch tw");
    double now = T0 + 5 * DAY;
    REQUIRE_THAT(est.level_at(now, {patch}),
                 WithinRel(patch_level(5.0, 100.0, p, 3.5), 1e-12));
    REQUIRE(est.level_at(now, {patch}) < single_dose_level(5.0, 100.0, p));
  }

  SECTION("Series") {
    auto series = est.level_series(T0, T0 + 2 * DAY, DAY, doses);
    REQUIRE(series.size() == 3);
    REQUIRE(series[0] == 0.0);
    REQUIRE_THAT(series[2], WithinRel(est.level_at(T0 + 2 * DAY, doses), 1e-12));
    REQUIRE(est.level_series(T0, T0 + DAY, 0.0, doses).empty());
  }
}

TEST_CASE("CALIBRATION", "[calibrate]") {
  PkRegistry reg = PkRegistry::builtin();
  LevelEstimator est(reg);
  std::vector<DoseRecord> doses{{T0, "EEn im", 4.0, DoseSource::Manual}};
  const double now = T0 + 20 * DAY;

  SECTION("No tests") {
    Calibration cal = est.calibrate({}, doses, now);
    REQUIRE(cal.factor == 1.0);
    REQUIRE(cal.variance == 0.0);
  }

  SECTION("Tests that predict nothing are unusable") {
    // both taken before the only dose
    std::vector<BloodTest> tests{{T0 - 2 * DAY, 150.0, false},
                                 {T0 - 2 * DAY, 150.0, false}};
    Calibration cal = est.calibrate(tests, doses, now);
    REQUIRE(cal.factor == 1.0);
    REQUIRE(cal.variance == 0.0);
  }

  SECTION("Single test gives its ratio") {
    double t = T0 + 5 * DAY;
    double predicted = est.level_at(t, doses);
    std::vector<BloodTest> tests{{t, 0.8 * predicted, false}};
    Calibration cal = est.calibrate(tests, doses, now);
    REQUIRE_THAT(cal.factor, WithinRel(0.8, 1e-12));
    REQUIRE_THAT(cal.variance, WithinAbs(0.0, 1e-15));
  }

  SECTION("Recent tests weigh more") {
    double t_old = T0 + 3 * DAY;
    double t_new = T0 + 10 * DAY;
    std::vector<BloodTest> tests{
        {t_old, 1.5 * est.level_at(t_old, doses), false},
        {t_new, 0.5 * est.level_at(t_new, doses), false}};
    const double lambda = 0.1;
    CalibrationOptions opts;
    opts.decay_lambda = lambda;

    double w_old = std::exp(-lambda * 17.0);
    double w_new = std::exp(-lambda * 10.0);
    double mean = (1.5 * w_old + 0.5 * w_new) / (w_old + w_new);
    double var = (w_old * (1.5 - mean) * (1.5 - mean) +
                  w_new * (0.5 - mean) * (0.5 - mean)) /
                 (w_old + w_new);

    Calibration cal = est.calibrate(tests, doses, now, opts);
    REQUIRE_THAT(cal.factor, WithinRel(mean, 1e-12));
    REQUIRE_THAT(cal.variance, WithinRel(var, 1e-12));
    REQUIRE(cal.factor < 1.0);
  }

  SECTION("Factor is clamped to [0, 2]") {
    double t = T0 + 5 * DAY;
    double predicted = est.level_at(t, doses);
    Calibration high = est.calibrate({{t, 5.0 * predicted, false}}, doses, now);
    REQUIRE(high.factor == 2.0);
    Calibration zero = est.calibrate({{t, 0.0, false}}, doses, now);
    REQUIRE(zero.factor == 0.0);
  }

  SECTION("Exclusion threshold is configurable") {
    double t = T0 + 5 * DAY;
    double predicted = est.level_at(t, doses);
    CalibrationOptions opts;
    opts.min_predicted_level = predicted + 1.0;
    Calibration cal = est.calibrate({{t, 2.0 * predicted, false}}, doses, now,
                                    opts);
    REQUIRE(cal.factor == 1.0);
    REQUIRE(cal.variance == 0.0);
  }
}

TEST_CASE("BASELINE AND PRUNING", "[calibrate, prune]") {
  PkRegistry reg = PkRegistry::builtin();
  LevelEstimator est(reg);
  std::vector<DoseRecord> doses{{T0, "EEn im", 4.0, DoseSource::Manual}};

  SECTION("Latest off-schedule test anchors a decaying baseline") {
    std::vector<BloodTest> tests{{T0 - 10 * DAY, 90.0, false},
                                 {T0 - 4 * DAY, 120.0, false},
                                 {T0 - 1 * DAY, 300.0, true}};
    double now = T0 + 2 * DAY;
    Calibration cal = est.calibrate(tests, doses, now);
    double base = est.baseline_level(tests, doses, cal, "EEn im", now);
    REQUIRE_THAT(base, WithinRel(120.0 * std::exp(-0.402 * 6.0), 1e-12));
  }

  SECTION("No baseline once a test is explained by the doses") {
    std::vector<BloodTest> tests{{T0 + 3 * DAY, 120.0, false}};
    double now = T0 + 4 * DAY;
    Calibration cal;
    REQUIRE(est.baseline_level(tests, doses, cal, "EEn im", now) == 0.0);
    Calibration scaled{1.2, 0.0};
    REQUIRE(est.baseline_level({{T0 - DAY, 120.0, false}}, doses, scaled,
                               "EEn im", now) == 0.0);
  }

  SECTION("Current level carries the baseline through time") {
    std::vector<BloodTest> tests{{T0 - 4 * DAY, 120.0, false}};
    Calibration cal = est.calibrate(tests, doses, T0 + 2 * DAY);
    const double k3 = reg.at("EEn im").k3;

    // before the first dose only the anchor contributes
    REQUIRE_THAT(est.current_level(T0 - DAY, doses, tests, cal, "EEn im"),
                 WithinRel(120.0 * std::exp(-k3 * 3.0), 1e-12));
    // before the test there is nothing to anchor on
    REQUIRE(est.current_level(T0 - 5 * DAY, doses, tests, cal, "EEn im") ==
            0.0);

    double t = T0 + 2 * DAY;
    REQUIRE_THAT(est.current_level(t, doses, tests, cal, "EEn im"),
                 WithinRel(est.level_at(t, doses, cal.factor) +
                               est.baseline_level(tests, doses, cal,
                                                  "EEn im", t),
                           1e-12));
    REQUIRE(est.current_level(t, doses, tests, cal, "EEn im") >
            est.level_at(t, doses, cal.factor));
  }

  SECTION("Stale doses are pruned per model") {
    double horizon = reg.terminal_elimination_days("EEn im");
    REQUIRE_THAT(horizon, WithinRel(43.511680183886234, 1e-12));

    double now = T0 + 50 * DAY;
    std::vector<DoseRecord> records{
        {T0, "EEn im", 4.0, DoseSource::Manual},            // 50 days old
        {T0 + 10 * DAY, "EEn im", 4.0, DoseSource::Manual}, // 40 days old
        {T0, "EX retired", 4.0, DoseSource::Manual}};
    auto kept = est.prune_stale_doses(records, now);
    REQUIRE(kept.size() == 2);
    REQUIRE(kept[0].timestamp == T0 + 10 * DAY);
    REQUIRE(kept[1].model_key == "EX retired");
  }
}

TEST_CASE("UNIT CONVERSION", "[units]") {
  REQUIRE(unit_conversion_factor("pg/mL").value() == 1.0);
  REQUIRE_THAT(unit_conversion_factor("pmol/L").value(),
               WithinAbs(3.6713, 1e-12));
  REQUIRE_FALSE(unit_conversion_factor("ng/dL").has_value());
}
