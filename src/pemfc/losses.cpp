#include <pemfc/losses.hpp>
#include <pemfc/constants.hpp>
#include <pemfc/errors.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace pemfc {

namespace {

void require_current(double i, const char* who) {
  if (!std::isfinite(i) || i < 0.0) {
    throw DomainError(std::string(who) + ": current density must be finite and >= 0, got " +
                      std::to_string(i));
  }
}

double require_finite(double v, const char* who, double i) {
  if (!std::isfinite(v)) {
    throw DomainError(std::string(who) + ": non-finite result at i=" + std::to_string(i));
  }
  return v;
}

template <typename F>
std::vector<double> elementwise(const std::vector<double>& i, F f) {
  std::vector<double> out(i.size(), 0.0);
  for (std::size_t k = 0; k < i.size(); ++k) out[k] = f(i[k]);
  return out;
}

} // namespace

double nernst_voltage(const FuelCellParams& p) {
  const double E_T = kStandardPotential - kPotentialTempCoeff * (p.T() - kStandardTemperature);

  const double q = p.P_H2() * std::sqrt(p.P_O2());
  if (!(q > 0.0)) {
    throw InvalidParameter("nernst_voltage: partial pressures must be positive");
  }
  const double E = E_T + thermal_voltage(p.T()) * std::log(q);
  if (!std::isfinite(E)) {
    throw InvalidParameter("nernst_voltage: non-finite open-circuit voltage");
  }
  return E;
}

double activation_loss(const FuelCellParams& p, double i) {
  require_current(i, "activation_loss");
  const double tafel = kGasConstant * p.T() / (kElectronsPerH2 * p.alpha() * kFaraday);
  const double v = tafel * std::log((i + kActivationGuard) / kExchangeCurrentDensity);
  // Below i0 the Tafel form goes negative; a loss is never a gain.
  return require_finite(std::max(0.0, v), "activation_loss", i);
}

std::vector<double> activation_loss(const FuelCellParams& p, const std::vector<double>& i) {
  return elementwise(i, [&p](double x) { return activation_loss(p, x); });
}

double ohmic_loss(const FuelCellParams& p, double i) {
  return i * p.area_resistance();
}

std::vector<double> ohmic_loss(const FuelCellParams& p, const std::vector<double>& i) {
  return elementwise(i, [&p](double x) { return ohmic_loss(p, x); });
}

double concentration_loss(const FuelCellParams& p, double i) {
  require_current(i, "concentration_loss");
  if (!(p.i_limit() > kLimitingCurrentGuard)) {
    throw DomainError("concentration_loss: i_limit must exceed the clamp guard " +
                      std::to_string(kLimitingCurrentGuard) + ", got " + std::to_string(p.i_limit()));
  }
  const double i_safe = std::min(i, p.i_limit() - kLimitingCurrentGuard);
  const double arg = 1.0 - i_safe / p.i_limit();
  if (!(arg > 0.0)) {
    throw DomainError("concentration_loss: 1 - i/i_limit <= 0 at i=" + std::to_string(i));
  }
  return require_finite(-thermal_voltage(p.T()) * std::log(arg), "concentration_loss", i);
}

std::vector<double> concentration_loss(const FuelCellParams& p, const std::vector<double>& i) {
  return elementwise(i, [&p](double x) { return concentration_loss(p, x); });
}

} // namespace pemfc
