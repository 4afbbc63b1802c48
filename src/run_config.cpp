#include "../include/run_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

void trim(std::string &s) {
  auto is_not_space = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

// Whole-field numeric parse; trailing garbage is a failure
bool parse_number(const std::string &text, double &out) {
  std::stringstream ss(text);
  double v;
  if (!(ss >> v))
    return false;
  ss >> std::ws;
  if (!ss.eof())
    return false;
  out = v;
  return true;
}

std::vector<std::string> split_fields(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  for (char c : line) {
    if (c == ',' || c == ';') {
      trim(field);
      fields.push_back(field);
      field.clear();
    } else {
      field += c;
    }
  }
  trim(field);
  fields.push_back(field);
  return fields;
}

bool parse_number_list(const std::string &text, std::vector<double> &out) {
  out.clear();
  for (const auto &f : split_fields(text)) {
    double v;
    if (!parse_number(f, v))
      return false;
    out.push_back(v);
  }
  return !out.empty();
}

bool parse_flag(const std::string &text, bool &out) {
  if (text == "1" || text == "true" || text == "yes") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "no") {
    out = false;
    return true;
  }
  return false;
}

// "model[EEn im]" -> name "model", key "EEn im"
bool split_table_key(const std::string &name, std::string &table,
                     std::string &key) {
  auto open = name.find('[');
  auto close = name.rfind(']');
  if (open == std::string::npos || close == std::string::npos || close < open)
    return false;
  table = name.substr(0, open);
  key = name.substr(open + 1, close - open - 1);
  trim(table);
  trim(key);
  return !key.empty();
}

// Shared line reader: strips '#' comments and blank lines
template <typename Handler>
bool for_each_line(const std::string &filename, const char *what,
                   Handler handle) {
  std::ifstream fin(filename);
  if (!fin) {
    std::cerr << "Error: cannot open " << what << " file: " << filename << "\n";
    return false;
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(fin, line)) {
    ++lineno;
    auto pos = line.find('#');
    if (pos != std::string::npos)
      line = line.substr(0, pos);
    trim(line);
    if (line.empty())
      continue;
    handle(line, lineno);
  }
  return true;
}

} // namespace

// 1-1. Run configuration
bool load_run_config(const std::string &filename, RunConfig &cfg) {
  bool ok = for_each_line(filename, "input", [&](const std::string &line,
                                                 std::size_t lineno) {
    // expect name = value
    std::string name, value;
    std::stringstream ss(line);
    if (!std::getline(ss, name, '=') || !std::getline(ss, value)) {
      std::cerr << "Warning: line " << lineno << " is not name = value: "
                << line << "\n";
      return;
    }
    trim(name);
    trim(value);

    auto bad_value = [&]() {
      std::cerr << "Warning: bad value for " << name << " on line " << lineno
                << ": " << value << "\n";
    };
    auto set_number = [&](double &dst) {
      if (!parse_number(value, dst))
        bad_value();
    };

    std::string table, key;
    if (split_table_key(name, table, key)) {
      std::vector<double> nums;
      if (!parse_number_list(value, nums)) {
        bad_value();
      } else if (table == "model" && nums.size() == 4) {
        cfg.model_overrides[key] = PkParams{nums[0], nums[1], nums[2], nums[3]};
      } else if (table == "wear" && nums.size() == 1) {
        cfg.wear_overrides[key] = nums[0];
      } else if (table == "intervals") {
        cfg.interval_overrides[key] = nums;
      } else {
        bad_value();
      }
      return;
    }

    if (name == "ester")
      cfg.ester = value;
    else if (name == "method")
      cfg.method = value;
    else if (name == "dose_mg")
      set_number(cfg.dose_mg);
    else if (name == "interval_days")
      set_number(cfg.interval_days);
    else if (name == "phase_days")
      set_number(cfg.phase_days);
    else if (name == "dose_time") {
      if (!parse_dose_time(value, cfg.dose_time_sec)) {
        bad_value();
        cfg.dose_time_sec = 8 * 3600.0;
      }
    } else if (name == "mode")
      cfg.mode = value;
    else if (name == "units")
      cfg.units = value;
    else if (name == "auto_regimen") {
      if (!parse_flag(value, cfg.auto_regimen))
        bad_value();
    } else if (name == "target_type")
      cfg.target_type = value;
    else if (name == "now")
      set_number(cfg.now);
    else if (name == "lookahead_days")
      set_number(cfg.lookahead_days);
    else if (name == "max_schedules") {
      double v = 0.0;
      if (parse_number(value, v) && v >= 1.0) {
        if (v > MAX_SCHEDULES_CAP) {
          std::cerr << "Warning: max_schedules capped at " << MAX_SCHEDULES_CAP
                    << "\n";
          v = MAX_SCHEDULES_CAP;
        }
        cfg.max_schedules = static_cast<std::size_t>(v);
      } else {
        bad_value();
      }
    } else if (name == "decay_lambda")
      set_number(cfg.calibration.decay_lambda);
    else if (name == "min_predicted_level")
      set_number(cfg.calibration.min_predicted_level);
    else if (name == "doses_csv")
      cfg.doses_csv = value;
    else if (name == "tests_csv")
      cfg.tests_csv = value;
    else if (name == "target_csv")
      cfg.target_csv = value;
    else if (name == "output_csv")
      cfg.output_csv = value;
    else if (name == "output_days")
      set_number(cfg.output_days);
    else if (name == "output_step_hours")
      set_number(cfg.output_step_hours);
    else
      std::cerr << "Warning: unknown key " << name << " on line " << lineno
                << "\n";
  });
  return ok;
}

PkRegistry build_registry(const RunConfig &cfg) {
  PkRegistry base = PkRegistry::builtin();
  auto params = base.params();
  auto wear = base.wear_table();
  auto intervals = base.interval_table();

  for (const auto &kv : cfg.model_overrides)
    params[kv.first] = kv.second;
  for (const auto &kv : cfg.wear_overrides)
    wear[kv.first] = kv.second;
  for (const auto &kv : cfg.interval_overrides)
    intervals[kv.first] = kv.second;
  return PkRegistry(std::move(params), std::move(wear), std::move(intervals));
}

bool parse_dose_time(const std::string &text, double &seconds) {
  std::string s = text;
  trim(s);
  auto colon = s.find(':');
  std::string hh = s.substr(0, colon);
  std::string mm = colon == std::string::npos ? "0" : s.substr(colon + 1);

  double h, m;
  if (!parse_number(hh, h) || !parse_number(mm, m))
    return false;
  if (h < 0.0 || h >= 24.0 || m < 0.0 || m >= 60.0)
    return false;
  seconds = static_cast<int>(h) * 3600.0 + static_cast<int>(m) * 60.0;
  return true;
}

// 2-1. Dose records
bool load_doses_csv(const std::string &filename,
                    std::vector<DoseRecord> &doses) {
  doses.clear();
  bool first = true;
  bool ok = for_each_line(filename, "dose", [&](const std::string &line,
                                                std::size_t lineno) {
    auto f = split_fields(line);
    DoseRecord rec;
    if (f.empty() || !parse_number(f[0], rec.timestamp)) {
      if (!first)
        std::cerr << "Warning: could not parse dose line " << lineno << ": "
                  << line << "\n";
      first = false;
      return; // header
    }
    first = false;
    if (f.size() < 3 || f[1].empty() || !parse_number(f[2], rec.amount_mg) ||
        rec.amount_mg < 0.0) {
      std::cerr << "Warning: could not read dose on line " << lineno << ": "
                << line << "\n";
      return;
    }
    rec.model_key = f[1];
    if (f.size() > 3 && !parse_dose_source(f[3], rec.source)) {
      std::cerr << "Warning: unknown dose source on line " << lineno << ": "
                << f[3] << "\n";
      return;
    }
    doses.push_back(rec);
  });
  if (!ok)
    return false;

  std::sort(doses.begin(), doses.end(),
            [](const DoseRecord &a, const DoseRecord &b) {
              return a.timestamp < b.timestamp;
            });
  std::cout << "Loaded " << doses.size() << " dose records from " << filename
            << "\n";
  return true;
}

// 2-2. Blood tests
bool load_tests_csv(const std::string &filename,
                    std::vector<BloodTest> &tests) {
  tests.clear();
  bool first = true;
  bool ok = for_each_line(filename, "blood test", [&](const std::string &line,
                                                      std::size_t lineno) {
    auto f = split_fields(line);
    BloodTest test;
    if (f.empty() || !parse_number(f[0], test.timestamp)) {
      if (!first)
        std::cerr << "Warning: could not parse test line " << lineno << ": "
                  << line << "\n";
      first = false;
      return;
    }
    first = false;
    if (f.size() < 2 || !parse_number(f[1], test.measured_level) ||
        test.measured_level < 0.0) {
      std::cerr << "Warning: could not read level on line " << lineno << ": "
                << line << "\n";
      return;
    }
    if (f.size() > 2 && !parse_flag(f[2], test.on_schedule)) {
      std::cerr << "Warning: bad on_schedule flag on line " << lineno << ": "
                << f[2] << "\n";
      return;
    }
    tests.push_back(test);
  });
  if (!ok)
    return false;

  std::cout << "Loaded " << tests.size() << " blood tests from " << filename
            << "\n";
  return true;
}

// 2-3. Target curve
bool load_target_csv(const std::string &filename, TargetCurve &curve) {
  curve.day.clear();
  curve.level.clear();
  bool first = true;
  bool ok = for_each_line(filename, "target", [&](const std::string &line,
                                                  std::size_t lineno) {
    auto f = split_fields(line);
    double day, level;
    if (f.empty() || !parse_number(f[0], day)) {
      if (!first)
        std::cerr << "Warning: could not parse line " << lineno << ": " << line
                  << "\n";
      first = false;
      return; // skip header
    }
    first = false;
    if (f.size() < 2 || !parse_number(f[1], level)) {
      std::cerr << "Warning: could not read level on line " << lineno << ": "
                << line << "\n";
      return;
    }
    curve.day.push_back(day);
    curve.level.push_back(level);
  });
  if (!ok)
    return false;

  if (curve.day.size() < 2) {
    std::cerr << "Error: not enough target points in file.\n";
    return false;
  }
  std::cout << "Loaded " << curve.day.size() << " target points from "
            << filename << "\n";
  return true;
}
