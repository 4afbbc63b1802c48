#include "dose_schedule.hpp"
#include "level_estimate.hpp"
#include "regimen.hpp"
#include "run_config.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <stdexcept>
#include <vector>

//---------------------------------------------
// One evaluation pass: doses + blood tests -> current level,
// calibration, suggested schedule(s), level time series.
// Units:
//   timestamps: s since epoch
//   levels:     pg/mL internally, converted to `units` for output
//---------------------------------------------

int main(int argc, char *argv[]) {

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " path/to/run.inp\n";
    return 1;
  }

  // 1. Read run configuration and build the model tables
  RunConfig cfg;
  if (!load_run_config(argv[1], cfg))
    return 1;

  std::optional<PkRegistry> reg;
  try {
    reg.emplace(build_registry(cfg));
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  auto cf = unit_conversion_factor(cfg.units);
  if (!cf) {
    std::cerr << "Warning: unknown units " << cfg.units
              << ", reporting pg/mL.\n";
    cfg.units = "pg/mL";
    cf = 1.0;
  }

  double now = cfg.now;
  if (now <= 0.0) {
    now = std::chrono::duration<double>(
              std::chrono::system_clock::now().time_since_epoch())
              .count();
  }

  // 2. Records
  std::vector<DoseRecord> doses;
  if (!cfg.doses_csv.empty() && !load_doses_csv(cfg.doses_csv, doses))
    std::cerr << "Continuing without recorded doses.\n";

  std::vector<BloodTest> tests;
  if (!cfg.tests_csv.empty() && !load_tests_csv(cfg.tests_csv, tests))
    std::cerr << "Continuing without blood tests.\n";

  TargetCurve cycle_target = menstrual_reference_curve();
  if (!cfg.target_csv.empty() &&
      !load_target_csv(cfg.target_csv, cycle_target)) {
    std::cerr << "Falling back to the built-in cycle curve.\n";
    cycle_target = menstrual_reference_curve();
  }

  LevelEstimator est(*reg);
  doses = est.prune_stale_doses(doses, now);
  std::vector<DoseRecord> auto_doses =
      generate_auto_doses(cfg, *reg, cycle_target, now);
  std::vector<DoseRecord> all_doses(doses);
  all_doses.insert(all_doses.end(), auto_doses.begin(), auto_doses.end());
  std::cout << "Using " << doses.size() << " recorded and "
            << auto_doses.size() << " generated doses\n";

  // 3. Calibration and current level
  Calibration cal = est.calibrate(tests, all_doses, now, cfg.calibration);
  const std::string model_key =
      resolve_model_key(cfg.ester, cfg.method, cfg.interval_days)
          .value_or("");
  double baseline =
      est.baseline_level(tests, all_doses, cal, model_key, now);
  double current =
      est.current_level(now, all_doses, tests, cal, model_key);

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "Scaling factor   = " << cal.factor << " (variance "
            << cal.variance << ")\n";
  if (baseline > 0.0)
    std::cout << "Baseline level   = " << baseline * *cf << " " << cfg.units
              << "\n";
  std::cout << std::setprecision(1);
  std::cout << "Current level    = " << current * *cf << " " << cfg.units
            << "\n";

  // 4. Suggested regimen
  if (cfg.auto_regimen) {
    auto solver_key = resolve_solver_model_key(cfg.ester, cfg.method);
    if (!solver_key) {
      std::cerr << "Warning: no model for " << cfg.ester << " "
                << cfg.method << "\n";
    } else if (cfg.target_type == "menstrual_range") {
      CycleFitter fitter(*reg);
      auto fit =
          fitter.fit_cycle(*solver_key, cycle_target, cfg.max_schedules);
      if (!fit) {
        std::cout << "Cycle fit: no schedule improves on zero dosing\n";
      } else {
        std::cout << "Cycle fit (" << fit->schedules.size()
                  << " schedules, residual RMS " << std::setprecision(2)
                  << fit->residual_rms << " pg/mL):\n";
        for (const auto &s : fit->schedules) {
          std::cout << "  " << std::setprecision(1) << s.dose_mg << " "
                    << dose_units(cfg.method) << " every " << s.interval_days
                    << " d, phase " << s.phase_days << " d (" << s.model_key
                    << ")\n";
        }
      }
    } else {
      auto trough = target_trough(cfg.target_type);
      if (!trough) {
        std::cerr << "Warning: unknown target type " << cfg.target_type
                  << ", using target_range\n";
        trough = 200.0;
      }
      RegimenSolver solver(*reg);
      auto s = solver.suggest_regimen(*solver_key, *trough);
      if (s) {
        std::cout << "Suggested regimen: " << s->dose_mg << " "
                  << dose_units(cfg.method) << " every " << s->interval_days
                  << " d (" << s->model_key << ")\n";
      } else {
        std::cout << "Suggested regimen: none feasible\n";
      }
    }
  }

  // 5. Level time series around now
  std::ofstream fout(cfg.output_csv);
  if (!fout) {
    std::cerr << "Error: cannot open output file: " << cfg.output_csv << "\n";
    return 1;
  }
  const double step = cfg.output_step_hours * 3600.0;
  const double start = now - cfg.output_days * SECONDS_PER_DAY;
  const double end = now + cfg.output_days * SECONDS_PER_DAY;
  std::vector<double> series =
      est.level_series(start, end, step, all_doses, cal.factor);

  // same level as "Current level": doses plus any baseline anchor
  fout << "timestamp,day,level_" << cfg.units << "\n";
  fout << std::fixed;
  for (std::size_t i = 0; i < series.size(); ++i) {
    double t = start + static_cast<double>(i) * step;
    double level =
        series[i] + est.baseline_level(tests, all_doses, cal, model_key, t);
    fout << std::setprecision(0) << t << "," << std::setprecision(3)
         << (t - now) / SECONDS_PER_DAY << "," << level * *cf << "\n";
  }
  fout.close();
  std::cout << "Level series written to " << cfg.output_csv << " ("
            << series.size() << " rows)\n";

  return 0;
}
