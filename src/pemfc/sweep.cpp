#include <pemfc/sweep.hpp>
#include <pemfc/errors.hpp>
#include <pemfc/losses.hpp>

#include <exception>
#include <string>

namespace pemfc {

std::vector<double> current_density_range(const FuelCellParams& p, const SweepOptions& opt) {
  if (opt.n_samples < 2) {
    throw InvalidParameter("sweep: n_samples must be >= 2");
  }
  const double i0 = opt.i_start;
  const double i1 = p.i_limit() - opt.end_margin;
  if (!(i0 > 0.0)) {
    throw InvalidParameter("sweep: i_start must be positive, got " + std::to_string(i0));
  }
  if (!(i1 > i0)) {
    throw InvalidParameter("sweep: empty range [" + std::to_string(i0) + ", " + std::to_string(i1) +
                           "]; check i_start and end_margin against i_limit");
  }
  if (!(i1 < p.i_limit())) {
    throw InvalidParameter("sweep: end_margin must be positive so samples stay below i_limit");
  }

  std::vector<double> i(opt.n_samples, 0.0);
  const double di = (i1 - i0) / static_cast<double>(opt.n_samples - 1);
  for (std::size_t k = 0; k < i.size(); ++k) {
    i[k] = i0 + di * static_cast<double>(k);
  }
  i.back() = i1;
  return i;
}

PolarizationCurve run_sweep(const FuelCellParams& p, const SweepOptions& opt) {
  PolarizationCurve c;
  c.i = current_density_range(p, opt);
  c.E_nernst = nernst_voltage(p);

  const std::size_t n = c.i.size();
  c.v_act.assign(n, 0.0);
  c.v_ohmic.assign(n, 0.0);
  c.v_conc.assign(n, 0.0);
  c.v_cell.assign(n, 0.0);
  c.p_cell.assign(n, 0.0);

  // Samples are independent. An exception cannot leave an OpenMP region, so the
  // first failure is carried out and rethrown after the loop.
  std::exception_ptr failure = nullptr;
  const long long nn = static_cast<long long>(n);

#ifdef PEMFC_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (long long k = 0; k < nn; ++k) {
    try {
      const double ik = c.i[k];
      c.v_act[k] = activation_loss(p, ik);
      c.v_ohmic[k] = ohmic_loss(p, ik);
      c.v_conc[k] = concentration_loss(p, ik);
      c.v_cell[k] = c.E_nernst - c.v_act[k] - c.v_ohmic[k] - c.v_conc[k];
      c.p_cell[k] = c.v_cell[k] * ik;
    } catch (...) {
#ifdef PEMFC_HAS_OPENMP
#pragma omp critical(pemfc_sweep_failure)
#endif
      {
        if (!failure) failure = std::current_exception();
      }
    }
  }

  if (failure) std::rethrow_exception(failure);
  return c;
}

} // namespace pemfc
