#pragma once

#include "pk_records.hpp"
#include "pk_registry.hpp"

#include <optional>
#include <string>
#include <vector>

struct Calibration {
  double factor = 1.0;   // multiplies model predictions, in [0, factor_max]
  double variance = 0.0; // weighted variance of measured/predicted ratios
};

struct CalibrationOptions {
  double decay_lambda = 0.02;       // recency decay [1/day]
  double min_predicted_level = 1.0; // tests predicting less are skipped
  double factor_max = 2.0;
};

// Aggregator and calibration over a fixed model registry
class LevelEstimator {
public:
  explicit LevelEstimator(const PkRegistry &reg) : reg_(reg) {}
  LevelEstimator(PkRegistry &&) = delete;

  // Contribution of one record at query_time [s]; 0 for unknown models
  double dose_level(double query_time, const DoseRecord &dose) const;

  // Sum of all contributions at query_time [s], times scale
  double level_at(double query_time, const std::vector<DoseRecord> &doses,
                  double scale = 1.0) const;

  // Levels at start, start + step, ... up to and including end [s]
  std::vector<double> level_series(double start, double end, double step,
                                   const std::vector<DoseRecord> &doses,
                                   double scale = 1.0) const;

  // Recency-weighted measured/predicted ratio. (1, 0) with no usable test.
  Calibration calibrate(const std::vector<BloodTest> &tests,
                        const std::vector<DoseRecord> &doses, double now,
                        const CalibrationOptions &opts = {}) const;

  // Level anchored on the latest off-schedule test when no test can be
  // explained by the doses (all predict <= 0). Decays with the model's k3.
  double baseline_level(const std::vector<BloodTest> &tests,
                        const std::vector<DoseRecord> &doses,
                        const Calibration &cal, const std::string &model_key,
                        double now) const;

  // Calibrated dose sum plus the baseline anchor at query_time [s]
  double current_level(double query_time, const std::vector<DoseRecord> &doses,
                       const std::vector<BloodTest> &tests,
                       const Calibration &cal,
                       const std::string &model_key) const;

  // Drop records older than their model's terminal elimination horizon
  std::vector<DoseRecord> prune_stale_doses(const std::vector<DoseRecord> &doses,
                                            double now) const;

private:
  const PkRegistry &reg_;
};

// pg/mL -> requested units
std::optional<double> unit_conversion_factor(const std::string &units);
