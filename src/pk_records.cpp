#include "../include/pk_records.hpp"

const char *to_string(DoseSource src) {
  return src == DoseSource::Automatic ? "automatic" : "manual";
}

bool parse_dose_source(const std::string &text, DoseSource &out) {
  if (text == "manual") {
    out = DoseSource::Manual;
    return true;
  }
  if (text == "automatic") {
    out = DoseSource::Automatic;
    return true;
  }
  return false;
}
