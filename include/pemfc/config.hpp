#pragma once

#include <pemfc/operating_point.hpp>
#include <pemfc/params.hpp>
#include <pemfc/sweep.hpp>

#include <iosfwd>
#include <map>
#include <string>

namespace pemfc {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

struct SimConfig {
  // [general]
  std::string output_dir = "out";
  int omp_threads = 0;               // 0 => leave as-is
  bool write_outputs = true;

  // [operating]
  double T = 353.0;                  // [K]
  double P_H2 = 3.0;                 // [atm]
  double P_O2 = 3.0;                 // [atm]

  // [cell]
  double alpha = FuelCellParams::kDefaultAlpha;
  double area_resistance = FuelCellParams::kDefaultAreaResistance;  // [Ohm cm^2]
  double i_limit = FuelCellParams::kDefaultLimitingCurrent;         // [A/cm^2]

  // [sweep]
  SweepOptions sweep;

  // [report]
  double i_query = 1.0;              // [A/cm^2]
  Lookup lookup = Lookup::Nearest;

  // [verify]
  bool verify = true;

  // Throws InvalidParameter for out-of-domain values.
  FuelCellParams params() const;
};

IniMap parse_ini_file(const std::string& path);
IniMap parse_ini_stream(std::istream& in, const std::string& source_name);

SimConfig config_from_ini(const IniMap& ini);
SimConfig load_config(const std::string& ini_path);

} // namespace pemfc
