#include "../include/regimen.hpp"
#include "../include/pk_curve.hpp"
#include <algorithm>
#include <cmath>
#include <set>

//---------------------------------------------
// Dosing schedule solvers
// Units:
//   interval, phase, cycle day: day
//   dose:  mg (mcg/day for patches)
//   level: pg/mL
//---------------------------------------------

double round_dose(double raw, const DoseRounding &r) {
  // nearbyint: ties go to the even multiple
  double d = std::nearbyint(raw / r.step) * r.step;
  return std::clamp(d, r.min_dose, r.max_dose);
}

// 1-1. Steady-state trough: every earlier dose seen at a whole number of
// intervals before the next administration
double RegimenSolver::trough_per_unit_dose(const std::string &model_key,
                                           double interval_days) const {
  const PkParams *p = reg_.find(model_key);
  if (!p || !(interval_days > 0.0))
    return 0.0;

  const bool patch = reg_.is_patch(model_key);
  const double wear = reg_.wear_days(model_key);
  double trough = 0.0;
  for (int n = 1; n < opts_.horizon_periods; ++n) {
    double t = n * interval_days;
    trough += patch ? patch_level(t, 1.0, *p, wear)
                    : single_dose_level(t, 1.0, *p);
  }
  return trough;
}

// 1-2. First feasible preferred interval
std::optional<Schedule>
RegimenSolver::suggest_regimen(const std::string &model_key,
                               double target_trough) const {
  if (!reg_.has_model(model_key) || !(target_trough > 0.0))
    return std::nullopt;

  for (double interval : reg_.preferred_intervals(model_key)) {
    if (7.0 / interval > opts_.max_doses_per_week)
      continue;

    double per_dose = trough_per_unit_dose(model_key, interval);
    if (per_dose <= 0.0)
      continue;

    Schedule s;
    s.dose_mg = round_dose(target_trough / per_dose, opts_.rounding);
    s.interval_days = interval;
    s.phase_days = 0.0;
    s.model_key = model_key;
    return s;
  }
  return std::nullopt;
}

// 2-1. Basis curves
Vector CycleFitter::basis_curve(const PkParams &p, double interval_days,
                                double phase_days, const Vector &days) const {
  Vector v;
  v.reserve(days.size());
  for (double day : days) {
    double t_mod = std::fmod(day - phase_days, interval_days);
    if (t_mod < 0.0)
      t_mod += interval_days;
    v.push_back(steady_state_unit_level(t_mod, interval_days, p));
  }
  return v;
}

std::vector<FitCandidate> CycleFitter::candidates(const std::string &model_key,
                                                  const Vector &days) const {
  std::vector<FitCandidate> out;
  const PkParams *p = reg_.find(model_key);
  if (!p)
    return out;

  std::set<double> intervals(opts_.extra_intervals.begin(),
                             opts_.extra_intervals.end());
  for (double v : reg_.preferred_intervals(model_key))
    intervals.insert(v);

  for (double interval : intervals) {
    if (interval < opts_.min_interval || interval > opts_.max_interval)
      continue;
    int n_phases = std::max(1, static_cast<int>(std::ceil(interval)));
    for (int ph = 0; ph < n_phases; ++ph) {
      double phase = static_cast<double>(ph);
      if (phase >= opts_.cycle_days)
        break;
      out.push_back({interval, phase, basis_curve(*p, interval, phase, days)});
    }
  }
  return out;
}

// 2-2. Greedy forward selection
std::vector<std::size_t>
CycleFitter::greedy_select(const std::vector<FitCandidate> &cands,
                           const Vector &target, std::size_t max_schedules,
                           Vector *mse_trace) const {
  std::vector<std::size_t> selected;
  const std::size_t n = target.size();
  double prev_mse = mean_square_error(target, Vector(n, 0.0));

  Matrix cols;
  for (std::size_t step = 0; step < max_schedules; ++step) {
    std::size_t best_ci = cands.size();
    double best_mse = prev_mse;

    for (std::size_t ci = 0; ci < cands.size(); ++ci) {
      if (std::find(selected.begin(), selected.end(), ci) != selected.end())
        continue;
      cols.clear();
      for (std::size_t si : selected)
        cols.push_back(cands[si].basis);
      cols.push_back(cands[ci].basis);

      Vector x = nnls(cols, target);
      double mse = mean_square_error(target, combine_columns(cols, x, n));
      if (mse < best_mse) {
        best_mse = mse;
        best_ci = ci;
      }
    }

    if (best_ci == cands.size())
      break; // nothing improves
    if (step > 0 && prev_mse > 0.0 &&
        (prev_mse - best_mse) / prev_mse < opts_.min_relative_gain)
      break;
    selected.push_back(best_ci);
    prev_mse = best_mse;
    if (mse_trace)
      mse_trace->push_back(best_mse);
  }
  return selected;
}

// 2-3. Full fit
std::optional<FitResult> CycleFitter::fit_cycle(const std::string &model_key,
                                                const TargetCurve &target,
                                                std::size_t max_schedules) const {
  const PkParams *p = reg_.find(model_key);
  if (!p || max_schedules == 0)
    return std::nullopt;
  // geometric-series basis needs three distinct roots
  if (classify_rates(p->k1, p->k2, p->k3) != RateCase::Distinct)
    return std::nullopt;

  Vector days, levels;
  const std::size_t npts = std::min(target.day.size(), target.level.size());
  for (std::size_t i = 0; i < npts; ++i) {
    if (target.day[i] < 0.0 || target.day[i] >= opts_.cycle_days)
      continue;
    days.push_back(target.day[i]);
    levels.push_back(target.level[i]);
  }
  if (days.empty())
    return std::nullopt;

  std::vector<FitCandidate> cands = candidates(model_key, days);
  std::vector<std::size_t> selected =
      greedy_select(cands, levels, max_schedules);
  if (selected.empty())
    return std::nullopt;

  Matrix cols;
  for (std::size_t si : selected)
    cols.push_back(cands[si].basis);
  Vector x = nnls(cols, levels);

  FitResult res;
  Vector rounded;
  Matrix kept_cols;
  for (std::size_t j = 0; j < selected.size(); ++j) {
    if (x[j] < opts_.negligible_dose)
      continue;
    const FitCandidate &c = cands[selected[j]];
    Schedule s;
    s.dose_mg = round_dose(x[j], opts_.rounding);
    s.interval_days = c.interval_days;
    s.phase_days = c.phase_days;
    s.model_key = model_key;
    res.schedules.push_back(s);
    rounded.push_back(s.dose_mg);
    kept_cols.push_back(c.basis);
  }
  if (res.schedules.empty())
    return std::nullopt;

  // quality as delivered: rounded doses, not the NNLS optimum
  res.fitted_curve = combine_columns(kept_cols, rounded, levels.size());
  res.residual_rms = std::sqrt(mean_square_error(levels, res.fitted_curve));
  return res;
}

// 3. Reference data
TargetCurve menstrual_reference_curve() {
  TargetCurve c;
  c.level = {37.99,  40.59,  37.49,  34.99,  35.49,  39.54,  41.99,
             44.34,  53.43,  58.58,  71.43,  98.92,  132.31, 177.35,
             255.88, 182.80, 85.23,  70.98,  87.97,  109.92, 122.77,
             132.56, 150.30, 133.81, 137.16, 134.96, 92.73,  85.68};
  for (std::size_t i = 0; i < c.level.size(); ++i)
    c.day.push_back(static_cast<double>(i));
  return c;
}

std::optional<double> target_trough(const std::string &target_type) {
  if (target_type == "target_range")
    return 200.0;
  if (target_type == "menstrual_range")
    return 100.0;
  return std::nullopt;
}
