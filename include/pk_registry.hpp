#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// Three-compartment depot -> secondary -> serum chain
//   d:  scale [level per mg]
//   k1: depot release rate [1/day]
//   k2: secondary -> serum transfer rate [1/day]
//   k3: serum elimination rate [1/day]
struct PkParams {
  double d;
  double k1;
  double k2;
  double k3;
};

// Static lookup data for a run. Built once and shared by const reference; no
// mutators after construction.
class PkRegistry {
public:
  PkRegistry(std::map<std::string, PkParams> params,
             std::map<std::string, double> wear_days,
             std::map<std::string, std::vector<double>> intervals);

  // Tables shipped with the project
  static PkRegistry builtin();

  bool has_model(const std::string &key) const;
  const PkParams *find(const std::string &key) const;
  const PkParams &at(const std::string &key) const;

  bool is_patch(const std::string &key) const;
  double wear_days(const std::string &key) const;

  // Preferred intervals in order of clinical preference; {7} when unlisted
  std::vector<double> preferred_intervals(const std::string &key) const;

  std::vector<std::string> model_keys() const;

  const std::map<std::string, PkParams> &params() const { return params_; }
  const std::map<std::string, double> &wear_table() const { return wear_; }
  const std::map<std::string, std::vector<double>> &interval_table() const {
    return intervals_;
  }

  // Days until a dose has decayed to ~1% of its peak; 30 if unknown
  double terminal_elimination_days(const std::string &key,
                                   double half_lives = 5.0) const;

private:
  std::map<std::string, PkParams> params_;
  std::map<std::string, double> wear_;
  std::map<std::string, std::vector<double>> intervals_;
};

// Ester + method -> model key. For "E"+"patch" the interval chooses between
// twice-weekly and once-weekly wear.
std::optional<std::string> resolve_model_key(const std::string &ester,
                                             const std::string &method,
                                             double interval_days = 7.0);

// Same, but a bare patch defaults to the twice-weekly model
std::optional<std::string> resolve_solver_model_key(const std::string &ester,
                                                    const std::string &method);

bool is_combination_supported(const PkRegistry &reg, const std::string &ester,
                              const std::string &method);

std::string dose_units(const std::string &method);
