#pragma once

#include <pemfc/config.hpp>
#include <pemfc/operating_point.hpp>
#include <pemfc/params.hpp>
#include <pemfc/sweep.hpp>

#include <iosfwd>
#include <string>

namespace pemfc {

// Console breakdown at the query point plus the peak power.
void print_breakdown(std::ostream& os,
                     const PolarizationCurve& curve,
                     const OperatingPoint& at,
                     const OperatingPoint& peak);

// Writes polarization.dat, losses.dat and results.json under cfg.output_dir.
// config_used names the copied input config ("" when running on defaults).
void write_sweep_outputs(const SimConfig& cfg,
                         const FuelCellParams& p,
                         const PolarizationCurve& curve,
                         const OperatingPoint& at,
                         const OperatingPoint& peak,
                         const std::string& config_used = "");

} // namespace pemfc
