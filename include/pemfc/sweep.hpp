#pragma once

#include <pemfc/params.hpp>

#include <cstddef>
#include <vector>

namespace pemfc {

struct SweepOptions {
  std::size_t n_samples = 100;
  double i_start = 0.001;    // [A/cm^2] first sample
  double end_margin = 0.05;  // [A/cm^2] last sample is i_limit - end_margin
};

// Index-aligned sweep result: entry k of every vector describes the same
// operating point. Samples are strictly increasing in i.
struct PolarizationCurve {
  double E_nernst = 0.0;         // [V], constant across the sweep

  std::vector<double> i;         // [A/cm^2]
  std::vector<double> v_cell;    // [V]
  std::vector<double> p_cell;    // [W/cm^2]

  std::vector<double> v_act;     // [V]
  std::vector<double> v_ohmic;   // [V]
  std::vector<double> v_conc;    // [V]

  std::size_t size() const { return i.size(); }
  bool empty() const { return i.empty(); }
};

// n_samples evenly spaced values from i_start to i_limit - end_margin, both ends
// included. Throws InvalidParameter unless every sample lies in (0, i_limit).
std::vector<double> current_density_range(const FuelCellParams& p, const SweepOptions& opt);

PolarizationCurve run_sweep(const FuelCellParams& p, const SweepOptions& opt = SweepOptions{});

} // namespace pemfc
