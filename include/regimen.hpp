#pragma once

#include "linalg.hpp"
#include "pk_records.hpp"
#include "pk_registry.hpp"

#include <optional>
#include <string>
#include <vector>

// Dose rounding shared by both solvers
struct DoseRounding {
  double step = 0.5;     // round to nearest multiple (ties to even)
  double min_dose = 0.5;
  double max_dose = 20.0;
};

double round_dose(double raw, const DoseRounding &r);

// 1. Single target: trough at steady state
struct RegimenOptions {
  double max_doses_per_week = 4.0;
  int horizon_periods = 60; // past doses summed for the steady-state trough
  DoseRounding rounding;
};

class RegimenSolver {
public:
  explicit RegimenSolver(const PkRegistry &reg, RegimenOptions opts = {})
      : reg_(reg), opts_(opts) {}
  RegimenSolver(PkRegistry &&, RegimenOptions = {}) = delete;

  // Steady-state trough for 1 unit every interval_days; 0 if unknown model
  double trough_per_unit_dose(const std::string &model_key,
                              double interval_days) const;

  // First preferred interval (clinical order) with a positive trough wins
  std::optional<Schedule> suggest_regimen(const std::string &model_key,
                                          double target_trough) const;

private:
  const PkRegistry &reg_;
  RegimenOptions opts_;
};

// 2. Cycle fit: superposition of periodic schedules against a curve
struct CycleFitOptions {
  double cycle_days = 28.0;
  double min_interval = 2.0;
  double max_interval = 28.0;
  std::vector<double> extra_intervals{3.5, 4.0, 5.0, 7.0, 9.0, 10.0, 14.0, 28.0};
  double min_relative_gain = 0.01; // stop once a step improves MSE less
  double negligible_dose = 0.25;   // fitted doses below this are dropped
  DoseRounding rounding;
};

// One (interval, phase) pair with its unit-dose curve on the target days
struct FitCandidate {
  double interval_days;
  double phase_days;
  Vector basis;
};

class CycleFitter {
public:
  explicit CycleFitter(const PkRegistry &reg, CycleFitOptions opts = {})
      : reg_(reg), opts_(opts) {}
  CycleFitter(PkRegistry &&, CycleFitOptions = {}) = delete;

  // Steady-state unit-dose level on each cycle day for (interval, phase)
  Vector basis_curve(const PkParams &p, double interval_days,
                     double phase_days, const Vector &days) const;

  std::vector<FitCandidate> candidates(const std::string &model_key,
                                       const Vector &days) const;

  // Indices into `cands` picked by greedy forward selection with NNLS
  // refits, in selection order. mse_trace[i] is the unrounded MSE after the
  // (i+1)-th pick.
  std::vector<std::size_t> greedy_select(const std::vector<FitCandidate> &cands,
                                         const Vector &target,
                                         std::size_t max_schedules,
                                         Vector *mse_trace = nullptr) const;

  std::optional<FitResult> fit_cycle(const std::string &model_key,
                                     const TargetCurve &target,
                                     std::size_t max_schedules = 4) const;

private:
  const PkRegistry &reg_;
  CycleFitOptions opts_;
};

// Mean serum estradiol over a 28-day menstrual cycle [pg/mL]
TargetCurve menstrual_reference_curve();

// Trough target [pg/mL] for a named target type; none if unknown
std::optional<double> target_trough(const std::string &target_type);
