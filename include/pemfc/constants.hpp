#pragma once

namespace pemfc {

// Universal constants (values as used by the reference polarization model).
constexpr double kGasConstant = 8.314;   // J/(mol K)
constexpr double kFaraday     = 96485.0; // C/mol

// Hydrogen/oxygen cell thermodynamics.
constexpr double kStandardPotential   = 1.229;   // V at 298.15 K
constexpr double kStandardTemperature = 298.15;  // K
constexpr double kPotentialTempCoeff  = 0.85e-3; // V/K, linear E0(T) correction
constexpr double kElectronsPerH2      = 2.0;

// Kinetics and numerical guards.
constexpr double kExchangeCurrentDensity = 1e-3; // A/cm^2
constexpr double kActivationGuard        = 1e-6; // A/cm^2, keeps ln((i+eps)/i0) finite at i=0
constexpr double kLimitingCurrentGuard   = 1e-4; // A/cm^2, clamp distance below i_limit

// RT/(nF) [V]
inline double thermal_voltage(double T) { return kGasConstant * T / (kElectronsPerH2 * kFaraday); }

} // namespace pemfc
