#include <pemfc/verify.hpp>

#include <algorithm>
#include <cmath>

namespace pemfc {

VerificationReport verify_curve(const FuelCellParams& p, const PolarizationCurve& curve,
                                double tol) {
  VerificationReport r;
  const std::size_t n = curve.size();

  r.aligned = n > 0 && curve.v_cell.size() == n && curve.p_cell.size() == n &&
              curve.v_act.size() == n && curve.v_ohmic.size() == n && curve.v_conc.size() == n;
  if (!r.aligned) return r;

  for (std::size_t k = 0; k < n; ++k) {
    double v = curve.E_nernst - curve.v_act[k] - curve.v_ohmic[k] - curve.v_conc[k];
    r.balance_residual = std::max(r.balance_residual, std::fabs(v - curve.v_cell[k]));
    r.power_residual = std::max(r.power_residual, std::fabs(curve.v_cell[k] * curve.i[k] - curve.p_cell[k]));
  }
  r.balance_ok = r.balance_residual <= tol;
  r.power_ok = r.power_residual <= tol;

  r.samples_ok = curve.i.front() > 0.0 && curve.i.back() < p.i_limit();
  r.monotone_losses_ok = true;
  for (std::size_t k = 1; k < n; ++k) {
    if (!(curve.i[k] > curve.i[k - 1])) r.samples_ok = false;
    if (curve.v_act[k] < curve.v_act[k - 1]) r.monotone_losses_ok = false;
    if (curve.v_ohmic[k] < curve.v_ohmic[k - 1]) r.monotone_losses_ok = false;
    if (!(curve.v_conc[k] > curve.v_conc[k - 1])) r.monotone_losses_ok = false;
  }

  auto it = std::max_element(curve.p_cell.begin(), curve.p_cell.end());
  r.peak_index = static_cast<std::size_t>(it - curve.p_cell.begin());
  r.interior_peak = r.peak_index > 0 && r.peak_index + 1 < n;

  return r;
}

} // namespace pemfc
