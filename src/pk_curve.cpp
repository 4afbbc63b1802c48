#include "../include/pk_curve.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

//---------------------------------------------
// Three-compartment chain: depot -> secondary -> serum -> out
//   dA1/dt = -k1 A1
//   dA2/dt =  k1 A1 - k2 A2
//   dA3/dt =  k2 A2 - k3 A3
// Serum level = d * A3 for a unit dose in A1 at t = 0.
// Units:
//   t:     day
//   dose:  mg (mcg/day for patches)
//   level: pg/mL
//---------------------------------------------

namespace {

// Non-finite or cancellation-negative results contribute nothing
double sanitize(double v) {
  if (!std::isfinite(v) || v < 0.0)
    return 0.0;
  return v;
}

// 1-1. Divided differences of f(k) = e^{-kt} over the rate constants.
// The chain response is k1 k2 f[k1, k2, k3]; repeated nodes give the
// coincident-rate limits, so every case shares one evaluation.

// Below this spread (c - a) t the second difference is summed as a series
constexpr double SERIES_SPREAD = 0.5;
constexpr int SERIES_TERMS = 24;

// f[a, b]
double exp_diff1(double t, double a, double b) {
  if (a > b)
    std::swap(a, b);
  const double h = b - a;
  if (h == 0.0)
    return -t * std::exp(-a * t);
  return std::exp(-a * t) * std::expm1(-h * t) / h;
}

// f[a, b, c]
double exp_diff2(double t, double a, double b, double c) {
  if (a > b)
    std::swap(a, b);
  if (b > c)
    std::swap(b, c);
  if (a > b)
    std::swap(a, b);

  if ((c - a) * t > SERIES_SPREAD)
    return (exp_diff1(t, b, c) - exp_diff1(t, a, b)) / (c - a);

  // e^{-at} t^2 sum_m (-1)^m h_m(x, y) / (m + 2)!, x = (b - a) t,
  // y = (c - a) t, h_m the complete homogeneous polynomial
  const double x = (b - a) * t;
  const double y = (c - a) * t;
  double h = 1.0, x_pow = 1.0, fact = 2.0, sign = 1.0;
  double sum = 0.5;
  for (int m = 1; m < SERIES_TERMS; ++m) {
    x_pow *= x;
    h = y * h + x_pow;
    fact *= m + 2;
    sign = -sign;
    sum += sign * h / fact;
  }
  return std::exp(-a * t) * t * t * sum;
}

// Closed forms, one per rate case. `s` = dose * d * k1 * k2.
double level_all_equal(double t, double s, double k) {
  return s * t * t * std::exp(-k * t) / 2.0;
}

// Double root k, single root c
//   s * (e^{-ct} - e^{-kt} (1 + (k - c) t)) / (k - c)^2
double level_double_root(double t, double s, double k, double c) {
  return s * exp_diff2(t, k, k, c);
}

double level_distinct(double t, double s, double k1, double k2, double k3) {
  return s * exp_diff2(t, k1, k2, k3);
}

} // namespace

bool rates_coincide(double ka, double kb) {
  return std::abs(ka - kb) <=
         RATE_COINCIDENCE_TOL * std::max(std::abs(ka), std::abs(kb));
}

RateCase classify_rates(double k1, double k2, double k3) {
  bool e12 = rates_coincide(k1, k2);
  bool e13 = rates_coincide(k1, k3);
  bool e23 = rates_coincide(k2, k3);

  if ((e12 && e13) || (e12 && e23) || (e13 && e23))
    return RateCase::AllEqual;
  if (e12)
    return RateCase::K1EqK2;
  if (e13)
    return RateCase::K1EqK3;
  if (e23)
    return RateCase::K2EqK3;
  return RateCase::Distinct;
}

// 1-2. Bolus response
double single_dose_level(double t, double dose, const PkParams &p) {
  // nothing has reached serum at t = 0
  if (t <= 0.0 || dose <= 0.0 || p.d <= 0.0)
    return 0.0;

  const double s = dose * p.d * p.k1 * p.k2;
  double v = 0.0;
  switch (classify_rates(p.k1, p.k2, p.k3)) {
  case RateCase::AllEqual:
    v = level_all_equal(t, s, p.k1);
    break;
  case RateCase::K1EqK2:
    v = level_double_root(t, s, p.k1, p.k3);
    break;
  case RateCase::K1EqK3:
    v = level_double_root(t, s, p.k1, p.k2);
    break;
  case RateCase::K2EqK3:
    v = level_double_root(t, s, p.k2, p.k1);
    break;
  case RateCase::Distinct:
    v = level_distinct(t, s, p.k1, p.k2, p.k3);
    break;
  }
  return sanitize(v);
}

// 1-3. Secondary compartment (d * A2), needed for patch removal
double secondary_compartment_level(double t, double dose, const PkParams &p) {
  if (t < 0.0 || dose <= 0.0 || p.d <= 0.0)
    return 0.0;

  return sanitize(-dose * p.d * p.k1 * exp_diff1(t, p.k1, p.k2));
}

// 1-4. Patch: depot feeds the chain while worn, then is removed.
double patch_level(double t, double dose, const PkParams &p, double wear_days) {
  if (t < 0.0)
    return 0.0;
  if (t <= wear_days)
    return single_dose_level(t, dose, p);

  // State at removal, then free decay of A2 -> A3 -> out
  const double a2_w = secondary_compartment_level(wear_days, dose, p);
  const double a3_w = single_dose_level(wear_days, dose, p);
  const double ta = t - wear_days;

  double v = 0.0;
  if (a2_w > 0.0)
    v -= a2_w * p.k2 * exp_diff1(ta, p.k2, p.k3);
  if (a3_w > 0.0)
    v += a3_w * std::exp(-p.k3 * ta);
  return sanitize(v);
}

// 2. Steady state for a periodic unit bolus. Each exponential mode sums the
// geometric series e^{-k(t + nT)}, n = 0..inf.
double steady_state_unit_level(double t_mod, double T, const PkParams &p) {
  if (T <= 0.0 || p.d <= 0.0)
    return 0.0;
  if (classify_rates(p.k1, p.k2, p.k3) != RateCase::Distinct)
    return 0.0;

  auto geom = [T](double k, double t) {
    return std::exp(-k * t) / -std::expm1(-k * T);
  };

  const double k1 = p.k1, k2 = p.k2, k3 = p.k3;
  double v = p.d * k1 * k2 *
             (geom(k1, t_mod) / (k1 - k2) / (k1 - k3) -
              geom(k2, t_mod) / (k1 - k2) / (k2 - k3) +
              geom(k3, t_mod) / (k1 - k3) / (k2 - k3));
  return sanitize(v);
}
