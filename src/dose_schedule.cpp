#include "../include/dose_schedule.hpp"
#include "../include/regimen.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

// 1. One schedule -> dose records
std::vector<DoseRecord> expand_schedule(const Schedule &s, double now,
                                        double tod_seconds,
                                        double lookahead_days,
                                        ScheduleAnchor anchor,
                                        double cycle_days) {
  std::vector<DoseRecord> doses;
  if (!(s.interval_days > 0.0) || !(s.dose_mg > 0.0))
    return doses;

  const double interval_sec = s.interval_days * SECONDS_PER_DAY;
  const double future_limit = now + lookahead_days * SECONDS_PER_DAY;
  const long long epoch_day_now =
      static_cast<long long>(std::floor(now / SECONDS_PER_DAY));

  double t;
  if (anchor == ScheduleAnchor::CycleDay) {
    const long long cycle = std::max(1LL, std::llround(cycle_days));
    long long cycle_day_now = ((epoch_day_now % cycle) + cycle) % cycle;
    long long phase = static_cast<long long>(s.phase_days);
    long long days_back = ((cycle_day_now - phase) % cycle + cycle) % cycle;
    t = static_cast<double>(epoch_day_now - days_back) * SECONDS_PER_DAY +
        tod_seconds;
    while (t <= now)
      t += interval_sec;
  } else {
    double today_dose =
        static_cast<double>(epoch_day_now) * SECONDS_PER_DAY + tod_seconds;
    double start = today_dose > now ? today_dose - interval_sec : today_dose;
    t = start + interval_sec;
  }

  while (t <= future_limit) {
    doses.push_back({t, s.model_key, s.dose_mg, DoseSource::Automatic});
    t += interval_sec;
  }
  return doses;
}

// 2. Configuration -> dose records
std::vector<DoseRecord> generate_auto_doses(const RunConfig &cfg,
                                            const PkRegistry &reg,
                                            const TargetCurve &cycle_target,
                                            double now) {
  std::vector<DoseRecord> doses;
  if (cfg.mode != "automatic" && cfg.mode != "both")
    return doses;

  double dose_mg = cfg.dose_mg;
  double interval_days = cfg.interval_days;

  if (cfg.auto_regimen) {
    std::optional<std::string> key =
        resolve_solver_model_key(cfg.ester, cfg.method);
    if (key && cfg.target_type == "menstrual_range") {
      CycleFitter fitter(reg);
      auto fit = fitter.fit_cycle(*key, cycle_target, cfg.max_schedules);
      if (fit) {
        for (const auto &s : fit->schedules) {
          auto part = expand_schedule(s, now, cfg.dose_time_sec,
                                      cfg.lookahead_days,
                                      ScheduleAnchor::CycleDay);
          doses.insert(doses.end(), part.begin(), part.end());
        }
        return doses;
      }
    } else if (key) {
      auto trough = target_trough(cfg.target_type);
      RegimenSolver solver(reg);
      auto s = solver.suggest_regimen(*key, trough.value_or(200.0));
      if (s) {
        dose_mg = s->dose_mg;
        interval_days = s->interval_days;
      }
    }
  }

  auto model_key = resolve_model_key(cfg.ester, cfg.method, interval_days);
  if (!model_key)
    return doses;

  Schedule s{dose_mg, interval_days, cfg.phase_days, *model_key};
  ScheduleAnchor anchor = cfg.phase_days > 0.0 ? ScheduleAnchor::CycleDay
                                               : ScheduleAnchor::TimeOfDay;
  return expand_schedule(s, now, cfg.dose_time_sec, cfg.lookahead_days, anchor);
}
