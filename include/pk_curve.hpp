#pragma once

#include "pk_registry.hpp"

// Relative difference below which two rate constants share a closed form
constexpr double RATE_COINCIDENCE_TOL = 1e-7;

// Which rate constants coincide; selects the closed form
enum class RateCase {
  AllEqual,
  K1EqK2, // k1 = k2 != k3
  K1EqK3, // k1 = k3 != k2
  K2EqK3, // k2 = k3 != k1
  Distinct
};

bool rates_coincide(double ka, double kb);
RateCase classify_rates(double k1, double k2, double k3);

// Serum level at t days after a bolus (injection/oral) of `dose` mg.
// Zero for t <= 0, dose <= 0 or a non-finite evaluation.
double single_dose_level(double t, double dose, const PkParams &p);

// Secondary compartment content (scaled by d) at t days after a dose
double secondary_compartment_level(double t, double dose, const PkParams &p);

// Serum level at t days after applying a patch worn for wear_days
double patch_level(double t, double dose, const PkParams &p, double wear_days);

// Steady-state serum level at t_mod in [0, T) for a unit bolus repeated every
// T days forever. Only valid for RateCase::Distinct; 0 otherwise.
double steady_state_unit_level(double t_mod, double T, const PkParams &p);
