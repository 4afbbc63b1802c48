#pragma once

#include "level_estimate.hpp"
#include "pk_records.hpp"
#include "pk_registry.hpp"

#include <map>
#include <string>
#include <vector>

// Largest accepted cycle-fit schedule count
constexpr std::size_t MAX_SCHEDULES_CAP = 16;

// Settings for one evaluation pass (see input/run.inp)
struct RunConfig {
  std::string ester = "EEn";
  std::string method = "im";
  double dose_mg = 4.0;
  double interval_days = 7.0;
  double phase_days = 0.0;
  double dose_time_sec = 8 * 3600.0; // time of day (UTC) for generated doses
  std::string mode = "manual";       // manual, automatic, both
  std::string units = "pg/mL";
  bool auto_regimen = false;
  std::string target_type = "target_range";

  double now = 0.0; // [s]; 0 -> wall clock
  double lookahead_days = 90.0;
  std::size_t max_schedules = 4;
  CalibrationOptions calibration;

  std::string doses_csv;
  std::string tests_csv;
  std::string target_csv;
  std::string output_csv = "output.csv";
  double output_days = 28.0;
  double output_step_hours = 6.0;

  // Additions/overrides on top of the built-in model tables
  std::map<std::string, PkParams> model_overrides;
  std::map<std::string, double> wear_overrides;
  std::map<std::string, std::vector<double>> interval_overrides;
};

// 1. Run configuration (key = value, '#' comments)
bool load_run_config(const std::string &filename, RunConfig &cfg);

// Built-in tables merged with the config's overrides. Throws
// std::invalid_argument for non-positive parameters.
PkRegistry build_registry(const RunConfig &cfg);

// "HH:MM" -> seconds after midnight
bool parse_dose_time(const std::string &text, double &seconds);

// 2. Record files (CSV, optional header line)
//   doses:  timestamp, model, dose_mg[, source]
//   tests:  timestamp, level[, on_schedule]
//   target: cycle_day, level
bool load_doses_csv(const std::string &filename, std::vector<DoseRecord> &doses);
bool load_tests_csv(const std::string &filename, std::vector<BloodTest> &tests);
bool load_target_csv(const std::string &filename, TargetCurve &curve);
