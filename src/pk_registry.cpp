#include "../include/pk_registry.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

//---------------------------------------------
// PK model tables
// Units:
//   d:            level (pg/mL) per mg
//   k1, k2, k3:   1/day
//   wear, interval: day
//---------------------------------------------

namespace {

// Ester + method -> model key. "patch" is a placeholder resolved by interval.
struct MethodKey {
  const char *ester;
  const char *method;
  const char *model;
};

const MethodKey METHOD_TABLE[] = {
    {"EB", "im", "EB im"},       {"EV", "im", "EV im"},
    {"EEn", "im", "EEn im"},     {"EC", "im", "EC im"},
    {"EUn", "im", "EUn im"},
    // SubQ uses the IM parameters except for EUn
    {"EB", "subq", "EB im"},     {"EV", "subq", "EV im"},
    {"EEn", "subq", "EEn im"},   {"EC", "subq", "EC im"},
    {"EUn", "subq", "EUn casubq"},
    {"E", "patch", "patch"},     {"E", "oral", "E oral"},
};

const char *lookup_method(const std::string &ester, const std::string &method) {
  for (const auto &m : METHOD_TABLE) {
    if (ester == m.ester && method == m.method)
      return m.model;
  }
  return nullptr;
}

} // namespace

// 1-1. Construction with validation
PkRegistry::PkRegistry(std::map<std::string, PkParams> params,
                       std::map<std::string, double> wear_days,
                       std::map<std::string, std::vector<double>> intervals)
    : params_(std::move(params)), wear_(std::move(wear_days)),
      intervals_(std::move(intervals)) {
  for (const auto &kv : params_) {
    const PkParams &p = kv.second;
    if (!(p.d > 0.0 && p.k1 > 0.0 && p.k2 > 0.0 && p.k3 > 0.0))
      throw std::invalid_argument("Model '" + kv.first +
                                  "' must have positive d, k1, k2, k3.");
  }
  for (const auto &kv : wear_) {
    if (!(kv.second > 0.0))
      throw std::invalid_argument("Wear time for '" + kv.first +
                                  "' must be > 0.");
  }
  for (const auto &kv : intervals_) {
    for (double v : kv.second) {
      if (!(v > 0.0))
        throw std::invalid_argument("Intervals for '" + kv.first +
                                    "' must be > 0.");
    }
  }
}

PkRegistry PkRegistry::builtin() {
  std::map<std::string, PkParams> params{
      {"EB im", {1893.1, 0.67, 61.5, 4.34}},
      {"EV im", {478.0, 0.236, 4.85, 1.24}},
      {"EEn im", {191.4, 0.119, 0.601, 0.402}},
      {"EC im", {246.0, 0.0825, 3.57, 0.669}},
      {"EUn im", {471.5, 0.01729, 6.528, 2.285}},
      {"EUn casubq", {16.15, 0.046, 0.022, 0.101}},
      {"patch tw", {16.792, 0.283, 5.592, 4.3}},
      {"patch ow", {59.481, 0.107, 7.842, 5.193}},
      // k1 large: depot passes straight through, k2 absorption, k3 ~16h t1/2
      {"E oral", {51.5, 100.0, 8.88, 1.032}},
  };
  std::map<std::string, double> wear{
      {"patch tw", 3.5},
      {"patch ow", 7.0},
  };
  std::map<std::string, std::vector<double>> intervals{
      {"EB im", {2.0, 3.0}},       {"EV im", {3.5, 5.0, 7.0}},
      {"EEn im", {7.0, 10.0}},     {"EC im", {7.0}},
      {"EUn im", {14.0, 28.0}},    {"EUn casubq", {14.0, 28.0}},
      {"patch tw", {3.5}},         {"patch ow", {7.0}},
      {"E oral", {1.0}},
  };
  return PkRegistry(std::move(params), std::move(wear), std::move(intervals));
}

// 1-2. Lookups
bool PkRegistry::has_model(const std::string &key) const {
  return params_.count(key) != 0;
}

const PkParams *PkRegistry::find(const std::string &key) const {
  auto it = params_.find(key);
  return it == params_.end() ? nullptr : &it->second;
}

const PkParams &PkRegistry::at(const std::string &key) const {
  auto it = params_.find(key);
  if (it == params_.end())
    throw std::out_of_range("Unknown PK model: " + key);
  return it->second;
}

bool PkRegistry::is_patch(const std::string &key) const {
  return wear_.count(key) != 0;
}

double PkRegistry::wear_days(const std::string &key) const {
  auto it = wear_.find(key);
  return it == wear_.end() ? 0.0 : it->second;
}

std::vector<double>
PkRegistry::preferred_intervals(const std::string &key) const {
  auto it = intervals_.find(key);
  if (it == intervals_.end())
    return {7.0};
  return it->second;
}

std::vector<std::string> PkRegistry::model_keys() const {
  std::vector<std::string> keys;
  keys.reserve(params_.size());
  for (const auto &kv : params_)
    keys.push_back(kv.first);
  return keys;
}

double PkRegistry::terminal_elimination_days(const std::string &key,
                                             double half_lives) const {
  const PkParams *p = find(key);
  if (!p)
    return 30.0;
  return half_lives * std::log(2.0) * (1.0 / p->k1 + 1.0 / p->k2 + 1.0 / p->k3);
}

// 2. Ester/method helpers
std::optional<std::string> resolve_model_key(const std::string &ester,
                                             const std::string &method,
                                             double interval_days) {
  const char *key = lookup_method(ester, method);
  if (!key)
    return std::nullopt;
  std::string model(key);
  if (model == "patch")
    return std::string(interval_days <= 5.0 ? "patch tw" : "patch ow");
  return model;
}

std::optional<std::string> resolve_solver_model_key(const std::string &ester,
                                                    const std::string &method) {
  const char *key = lookup_method(ester, method);
  if (!key)
    return std::nullopt;
  std::string model(key);
  if (model == "patch")
    return std::string("patch tw");
  return model;
}

bool is_combination_supported(const PkRegistry &reg, const std::string &ester,
                              const std::string &method) {
  const char *key = lookup_method(ester, method);
  if (!key)
    return false;
  if (std::string(key) == "patch")
    return reg.has_model("patch tw") && reg.has_model("patch ow");
  return reg.has_model(key);
}

std::string dose_units(const std::string &method) {
  return method == "patch" ? "mcg/day" : "mg";
}
