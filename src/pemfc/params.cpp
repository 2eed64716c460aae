#include <pemfc/params.hpp>
#include <pemfc/errors.hpp>

#include <cmath>
#include <string>

namespace pemfc {

namespace {

void require(bool ok, const std::string& msg) {
  if (!ok) throw InvalidParameter("FuelCellParams: " + msg);
}

} // namespace

FuelCellParams::FuelCellParams(double T, double P_H2, double P_O2,
                               double alpha, double area_resistance, double i_limit)
    : T_(T), P_H2_(P_H2), P_O2_(P_O2),
      alpha_(alpha), area_resistance_(area_resistance), i_limit_(i_limit) {
  require(std::isfinite(T_) && T_ > 0.0, "T must be positive, got " + std::to_string(T_));
  require(std::isfinite(P_H2_) && P_H2_ > 0.0, "P_H2 must be positive, got " + std::to_string(P_H2_));
  require(std::isfinite(P_O2_) && P_O2_ > 0.0, "P_O2 must be positive, got " + std::to_string(P_O2_));
  require(alpha_ > 0.0 && alpha_ <= 1.0, "alpha must be in (0,1], got " + std::to_string(alpha_));
  require(std::isfinite(area_resistance_) && area_resistance_ >= 0.0,
          "area_resistance must be >= 0, got " + std::to_string(area_resistance_));
  require(std::isfinite(i_limit_) && i_limit_ > 0.0, "i_limit must be positive, got " + std::to_string(i_limit_));
}

} // namespace pemfc
