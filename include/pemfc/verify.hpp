#pragma once

#include <pemfc/params.hpp>
#include <pemfc/sweep.hpp>

#include <cstddef>

namespace pemfc {

struct VerificationReport {
  bool aligned = false;                // all vectors have the same length

  bool balance_ok = false;
  double balance_residual = 0.0;       // max |E - v_act - v_ohmic - v_conc - v_cell| [V]

  bool power_ok = false;
  double power_residual = 0.0;         // max |v_cell * i - p_cell| [W/cm^2]

  bool samples_ok = false;             // strictly increasing, inside (0, i_limit)
  bool monotone_losses_ok = false;     // act/ohmic non-decreasing, conc increasing

  bool interior_peak = false;          // max power not at the first or last sample
  std::size_t peak_index = 0;

  bool all_ok() const {
    return aligned && balance_ok && power_ok && samples_ok && monotone_losses_ok && interior_peak;
  }
};

VerificationReport verify_curve(const FuelCellParams& p, const PolarizationCurve& curve,
                                double tol = 1e-9);

} // namespace pemfc
