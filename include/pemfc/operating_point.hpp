#pragma once

#include <pemfc/sweep.hpp>

#include <cstddef>
#include <string>

namespace pemfc {

// Nearest: report the closest sweep sample as-is.
// Linear: interpolate every quantity between the two bracketing samples.
enum class Lookup { Nearest, Linear };

Lookup parse_lookup(const std::string& s);
const char* to_string(Lookup l);

struct OperatingPoint {
  std::size_t index = 0;   // nearest sample (the sample itself for Nearest)
  double i = 0.0;          // [A/cm^2]
  double v_cell = 0.0;     // [V]
  double p_cell = 0.0;     // [W/cm^2]
  double v_act = 0.0;      // [V]
  double v_ohmic = 0.0;    // [V]
  double v_conc = 0.0;     // [V]
};

// Index minimizing |curve.i[k] - i_query|; ties go to the lower index.
std::size_t nearest_index(const PolarizationCurve& curve, double i_query);

OperatingPoint sample_at(const PolarizationCurve& curve, std::size_t k);

// Outside the sweep, Linear clamps to the first/last sample.
OperatingPoint operating_point(const PolarizationCurve& curve, double i_query,
                               Lookup mode = Lookup::Nearest);

// Sample with the largest power density.
OperatingPoint peak_power(const PolarizationCurve& curve);

} // namespace pemfc
