#pragma once

#include <string>
#include <vector>

constexpr double SECONDS_PER_DAY = 86400.0;

enum class DoseSource { Manual, Automatic };

// One administration; contributes linearly in amount_mg from timestamp on
struct DoseRecord {
  double timestamp;      // [s] since epoch
  std::string model_key; // PK model
  double amount_mg;      // [mg] (mcg/day for patches)
  DoseSource source = DoseSource::Manual;
};

// Lab measurement
struct BloodTest {
  double timestamp;        // [s] since epoch
  double measured_level;   // [pg/mL]
  bool on_schedule = false; // taken under a validated steady-state schedule
};

// Periodic dosing plan
struct Schedule {
  double dose_mg;
  double interval_days;
  double phase_days; // cycle day of the first dose, [0, cycle length)
  std::string model_key;
};

// Reference level over one cycle
struct TargetCurve {
  std::vector<double> day;   // cycle day
  std::vector<double> level; // [pg/mL]
};

struct FitResult {
  std::vector<Schedule> schedules;
  double residual_rms;             // of the rounded-dose curve vs target
  std::vector<double> fitted_curve; // one entry per target point used
};

const char *to_string(DoseSource src);
bool parse_dose_source(const std::string &text, DoseSource &out);
