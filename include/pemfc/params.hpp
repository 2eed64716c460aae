#pragma once

namespace pemfc {

// Operating conditions and cell construction parameters.
// Validated on construction and read-only afterwards.
class FuelCellParams {
public:
  static constexpr double kDefaultAlpha = 0.5;
  static constexpr double kDefaultAreaResistance = 0.2; // Ohm cm^2
  static constexpr double kDefaultLimitingCurrent = 1.8; // A/cm^2

  FuelCellParams(double T, double P_H2, double P_O2,
                 double alpha = kDefaultAlpha,
                 double area_resistance = kDefaultAreaResistance,
                 double i_limit = kDefaultLimitingCurrent);

  double T() const { return T_; }
  double P_H2() const { return P_H2_; }
  double P_O2() const { return P_O2_; }
  double alpha() const { return alpha_; }
  double area_resistance() const { return area_resistance_; }
  double i_limit() const { return i_limit_; }

private:
  double T_;                // [K]
  double P_H2_;             // [atm]
  double P_O2_;             // [atm]
  double alpha_;            // charge-transfer coefficient, (0,1]
  double area_resistance_;  // [Ohm cm^2]
  double i_limit_;          // [A/cm^2]
};

} // namespace pemfc
