#pragma once

#include "pk_records.hpp"
#include "pk_registry.hpp"
#include "run_config.hpp"

#include <vector>

// How the first generated dose of a schedule is placed
enum class ScheduleAnchor {
  CycleDay,  // most recent epoch day with (day mod cycle) == phase
  TimeOfDay  // today's dose time, or one interval earlier if still ahead
};

// Future doses of `s` in (now, now + lookahead_days], at tod_seconds (UTC)
std::vector<DoseRecord> expand_schedule(const Schedule &s, double now,
                                        double tod_seconds,
                                        double lookahead_days,
                                        ScheduleAnchor anchor,
                                        double cycle_days = 28.0);

// Recurring doses implied by a run configuration: nothing in manual mode;
// solver output when auto_regimen is set, else the configured dose/interval.
std::vector<DoseRecord> generate_auto_doses(const RunConfig &cfg,
                                            const PkRegistry &reg,
                                            const TargetCurve &cycle_target,
                                            double now);
