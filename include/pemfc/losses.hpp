#pragma once

#include <pemfc/params.hpp>

#include <vector>

namespace pemfc {

// Open-circuit (Nernst) voltage [V]:
//   E = E0 - 0.85e-3 (T - 298.15) + RT/(2F) ln(P_H2 sqrt(P_O2))
// Independent of current density.
double nernst_voltage(const FuelCellParams& p);

// Tafel activation loss [V], floored at 0:
//   v_act = RT/(2 alpha F) ln((i + 1e-6) / i0),  i0 = 1e-3 A/cm^2
// Throws DomainError for negative or non-finite i.
double activation_loss(const FuelCellParams& p, double i);
std::vector<double> activation_loss(const FuelCellParams& p, const std::vector<double>& i);

// Membrane resistive loss [V]: v_ohmic = i * area_resistance.
double ohmic_loss(const FuelCellParams& p, double i);
std::vector<double> ohmic_loss(const FuelCellParams& p, const std::vector<double>& i);

// Mass-transport loss [V]:
//   v_conc = -RT/(2F) ln(1 - i_safe/i_limit),  i_safe = min(i, i_limit - 1e-4)
// Requests at or beyond i_limit saturate at the clamp. Throws DomainError for
// negative or non-finite i, and when i_limit <= 1e-4 leaves no room for the clamp.
double concentration_loss(const FuelCellParams& p, double i);
std::vector<double> concentration_loss(const FuelCellParams& p, const std::vector<double>& i);

} // namespace pemfc
