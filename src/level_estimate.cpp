#include "../include/level_estimate.hpp"
#include "../include/pk_curve.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

//---------------------------------------------
// Level aggregation and blood test calibration
// Units:
//   timestamps: s since epoch
//   ages:       day
//   levels:     pg/mL
//---------------------------------------------

// 1. Aggregator
double LevelEstimator::dose_level(double query_time,
                                  const DoseRecord &dose) const {
  const PkParams *p = reg_.find(dose.model_key);
  if (!p)
    return 0.0; // records may outlive a model table update

  double t_days = (query_time - dose.timestamp) / SECONDS_PER_DAY;
  if (reg_.is_patch(dose.model_key))
    return patch_level(t_days, dose.amount_mg, *p,
                       reg_.wear_days(dose.model_key));
  return single_dose_level(t_days, dose.amount_mg, *p);
}

double LevelEstimator::level_at(double query_time,
                                const std::vector<DoseRecord> &doses,
                                double scale) const {
  double total = 0.0;
  for (const auto &dose : doses)
    total += dose_level(query_time, dose);
  return total * scale;
}

std::vector<double>
LevelEstimator::level_series(double start, double end, double step,
                             const std::vector<DoseRecord> &doses,
                             double scale) const {
  std::vector<double> out;
  if (!(step > 0.0) || end < start)
    return out;
  const std::size_t n =
      static_cast<std::size_t>(std::floor((end - start) / step)) + 1;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    double t = start + static_cast<double>(i) * step;
    out.push_back(level_at(t, doses, scale));
  }
  return out;
}

// 2. Calibration
Calibration LevelEstimator::calibrate(const std::vector<BloodTest> &tests,
                                      const std::vector<DoseRecord> &doses,
                                      double now,
                                      const CalibrationOptions &opts) const {
  double weighted_sum = 0.0;
  double weight_total = 0.0;
  std::vector<std::pair<double, double>> ratio_weight;

  for (const auto &test : tests) {
    double predicted = level_at(test.timestamp, doses, 1.0);
    if (predicted < opts.min_predicted_level)
      continue;

    double ratio = test.measured_level / predicted;
    double age_days = (now - test.timestamp) / SECONDS_PER_DAY;
    double weight = std::exp(-opts.decay_lambda * age_days);
    if (!std::isfinite(ratio) || !std::isfinite(weight))
      continue;

    weighted_sum += ratio * weight;
    weight_total += weight;
    ratio_weight.emplace_back(ratio, weight);
  }

  Calibration cal;
  if (weight_total <= 0.0)
    return cal;

  double mean = weighted_sum / weight_total;
  double var_sum = 0.0;
  for (const auto &rw : ratio_weight)
    var_sum += rw.second * (rw.first - mean) * (rw.first - mean);

  cal.factor = std::clamp(mean, 0.0, opts.factor_max);
  cal.variance = var_sum / weight_total;
  return cal;
}

// 3. Zero-state baseline
double LevelEstimator::baseline_level(const std::vector<BloodTest> &tests,
                                      const std::vector<DoseRecord> &doses,
                                      const Calibration &cal,
                                      const std::string &model_key,
                                      double now) const {
  // Only meaningful when calibration had nothing to work with
  if (cal.factor != 1.0 || cal.variance != 0.0)
    return 0.0;

  const BloodTest *latest = nullptr;
  for (const auto &test : tests) {
    if (test.on_schedule)
      continue;
    if (level_at(test.timestamp, doses) > 0.0)
      return 0.0;
    if (!latest || test.timestamp > latest->timestamp)
      latest = &test;
  }
  if (!latest)
    return 0.0;

  const PkParams *p = reg_.find(model_key);
  double age_days = (now - latest->timestamp) / SECONDS_PER_DAY;
  if (!p || age_days < 0.0)
    return 0.0;
  return latest->measured_level * std::exp(-p->k3 * age_days);
}

double LevelEstimator::current_level(double query_time,
                                     const std::vector<DoseRecord> &doses,
                                     const std::vector<BloodTest> &tests,
                                     const Calibration &cal,
                                     const std::string &model_key) const {
  return level_at(query_time, doses, cal.factor) +
         baseline_level(tests, doses, cal, model_key, query_time);
}

// 4. Stale records
std::vector<DoseRecord>
LevelEstimator::prune_stale_doses(const std::vector<DoseRecord> &doses,
                                  double now) const {
  std::vector<DoseRecord> kept;
  kept.reserve(doses.size());
  for (const auto &dose : doses) {
    if (!reg_.has_model(dose.model_key)) {
      kept.push_back(dose);
      continue;
    }
    double cutoff =
        now - reg_.terminal_elimination_days(dose.model_key) * SECONDS_PER_DAY;
    if (dose.timestamp >= cutoff)
      kept.push_back(dose);
  }
  return kept;
}

std::optional<double> unit_conversion_factor(const std::string &units) {
  if (units == "pg/mL")
    return 1.0;
  if (units == "pmol/L")
    return 3.6713;
  return std::nullopt;
}
