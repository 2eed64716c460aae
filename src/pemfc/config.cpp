#include <pemfc/config.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace pemfc {

namespace {

std::string trim(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& key, const std::string& v) {
  std::string x = to_lower(trim(v));
  if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  throw std::runtime_error(key + ": invalid boolean '" + v + "'");
}

double parse_double(const std::string& key, const std::string& v) {
  std::string x = trim(v);
  if (x.empty()) throw std::runtime_error(key + ": empty value");
  char* end = nullptr;
  double out = std::strtod(x.c_str(), &end);
  if (end == x.c_str() || *end != '\0') {
    throw std::runtime_error(key + ": invalid number '" + v + "'");
  }
  return out;
}

std::size_t parse_size(const std::string& key, const std::string& v) {
  double d = parse_double(key, v);
  if (!std::isfinite(d)) throw std::runtime_error(key + ": must be finite, got '" + v + "'");
  if (d < 0.0) throw std::runtime_error(key + ": must not be negative");
  if (d >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
    throw std::runtime_error(key + ": out of range '" + v + "'");
  }
  return static_cast<std::size_t>(d);
}

int parse_int(const std::string& key, const std::string& v) {
  double d = parse_double(key, v);
  if (!std::isfinite(d) || d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(key + ": not a representable integer '" + v + "'");
  }
  return static_cast<int>(d);
}

std::optional<std::string> get_str_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return std::nullopt;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return std::nullopt;
  return trim(kit->second);
}

std::string get_str(const IniMap& ini, const std::string& sec, const std::string& key,
                    const std::string& def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? *v : def;
}

double get_double(const IniMap& ini, const std::string& sec, const std::string& key, double def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_double("[" + sec + "] " + key, *v) : def;
}

int get_int(const IniMap& ini, const std::string& sec, const std::string& key, int def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_int("[" + sec + "] " + key, *v) : def;
}

std::size_t get_size(const IniMap& ini, const std::string& sec, const std::string& key, std::size_t def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_size("[" + sec + "] " + key, *v) : def;
}

bool get_bool(const IniMap& ini, const std::string& sec, const std::string& key, bool def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_bool("[" + sec + "] " + key, *v) : def;
}

} // namespace

IniMap parse_ini_stream(std::istream& in, const std::string& source_name) {
  IniMap ini;
  std::string current = "general"; // default if no section
  ini[current] = IniSection{};

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;

    // Strip comments (# or ;)
    auto cut = line.find_first_of("#;");
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      current = trim(line.substr(1, line.size() - 2));
      if (current.empty()) {
        throw std::runtime_error(source_name + ": empty section at line " + std::to_string(lineno));
      }
      ini[current];
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error(source_name + ": expected key=value at line " + std::to_string(lineno));
    }
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) {
      throw std::runtime_error(source_name + ": empty key at line " + std::to_string(lineno));
    }
    ini[current][key] = val;
  }

  return ini;
}

IniMap parse_ini_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open config INI: " + path);
  }
  return parse_ini_stream(f, path);
}

SimConfig config_from_ini(const IniMap& ini) {
  SimConfig cfg;

  cfg.output_dir = get_str(ini, "general", "output_dir", cfg.output_dir);
  cfg.omp_threads = get_int(ini, "general", "omp_threads", cfg.omp_threads);
  cfg.write_outputs = get_bool(ini, "general", "write_outputs", cfg.write_outputs);

  cfg.T = get_double(ini, "operating", "T", cfg.T);
  cfg.P_H2 = get_double(ini, "operating", "P_H2", cfg.P_H2);
  cfg.P_O2 = get_double(ini, "operating", "P_O2", cfg.P_O2);

  cfg.alpha = get_double(ini, "cell", "alpha", cfg.alpha);
  cfg.area_resistance = get_double(ini, "cell", "area_resistance", cfg.area_resistance);
  cfg.i_limit = get_double(ini, "cell", "i_limit", cfg.i_limit);

  cfg.sweep.n_samples = get_size(ini, "sweep", "n_samples", cfg.sweep.n_samples);
  cfg.sweep.i_start = get_double(ini, "sweep", "i_start", cfg.sweep.i_start);
  cfg.sweep.end_margin = get_double(ini, "sweep", "end_margin", cfg.sweep.end_margin);

  cfg.i_query = get_double(ini, "report", "i_query", cfg.i_query);
  cfg.lookup = parse_lookup(get_str(ini, "report", "lookup", to_string(cfg.lookup)));

  cfg.verify = get_bool(ini, "verify", "enabled", cfg.verify);

  // basic sanity; physical domains are checked by FuelCellParams / run_sweep
  if (cfg.sweep.n_samples < 2) throw std::runtime_error("[sweep] n_samples must be >= 2");
  if (cfg.omp_threads < 0) throw std::runtime_error("[general] omp_threads must be >= 0");

  return cfg;
}

SimConfig load_config(const std::string& ini_path) {
  return config_from_ini(parse_ini_file(ini_path));
}

FuelCellParams SimConfig::params() const {
  return FuelCellParams(T, P_H2, P_O2, alpha, area_resistance, i_limit);
}

} // namespace pemfc
