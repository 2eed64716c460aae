#include <pemfc/report.hpp>
#include <pemfc/io.hpp>

#include <filesystem>
#include <ios>
#include <ostream>
#include <sstream>

namespace pemfc {

namespace fs = std::filesystem;

namespace {

std::string num(double v) {
  std::ostringstream ss;
  ss.precision(10);
  ss << v;
  return ss.str();
}

} // namespace

void print_breakdown(std::ostream& os,
                     const PolarizationCurve& curve,
                     const OperatingPoint& at,
                     const OperatingPoint& peak) {
  const std::ios::fmtflags flags = os.flags();
  const std::streamsize prec = os.precision();
  os << std::fixed;
  os.precision(4);

  os << "--- Simulation Results at " << at.i << " A/cm^2 ---\n";
  os << "Open Circuit (Nernst): " << curve.E_nernst << " V\n";
  os << "Total Voltage:      " << at.v_cell << " V\n";
  os << "Power Density:      " << at.p_cell << " W/cm^2\n";
  os << "Max Power Peak:     " << peak.p_cell << " W/cm^2 at " << peak.i << " A/cm^2\n";
  os << "Loss Breakdown:\n";
  os << "  - Activation Loss: " << at.v_act << " V (Starting the reaction)\n";
  os << "  - Ohmic Loss:      " << at.v_ohmic << " V (Resistance)\n";
  os << "  - Mass Transport:  " << at.v_conc << " V (Gas starvation)\n";

  os.flags(flags);
  os.precision(prec);
}

void write_sweep_outputs(const SimConfig& cfg,
                         const FuelCellParams& p,
                         const PolarizationCurve& curve,
                         const OperatingPoint& at,
                         const OperatingPoint& peak,
                         const std::string& config_used) {
  fs::path outdir(cfg.output_dir);
  ensure_dir(outdir.string());

  {
    std::vector<std::vector<double>> cols = {curve.i, curve.v_cell, curve.p_cell};
    write_table((outdir / "polarization.dat").string(), {"i", "v_cell", "p_cell"}, cols,
                "i [A/cm^2], v_cell [V], p_cell [W/cm^2]");
  }
  {
    std::vector<std::vector<double>> cols = {curve.i, curve.v_act, curve.v_ohmic, curve.v_conc};
    write_table((outdir / "losses.dat").string(), {"i", "v_act", "v_ohmic", "v_conc"}, cols,
                "i [A/cm^2], losses [V]");
  }

  ResultsIndex idx;
  idx.config_used = config_used;
  idx.summary["T_K"] = num(p.T());
  idx.summary["P_H2_atm"] = num(p.P_H2());
  idx.summary["P_O2_atm"] = num(p.P_O2());
  idx.summary["alpha"] = num(p.alpha());
  idx.summary["area_resistance_ohm_cm2"] = num(p.area_resistance());
  idx.summary["i_limit_A_per_cm2"] = num(p.i_limit());
  idx.summary["n_samples"] = std::to_string(curve.size());
  idx.summary["E_nernst_V"] = num(curve.E_nernst);
  idx.summary["lookup"] = to_string(cfg.lookup);
  idx.summary["i_query_A_per_cm2"] = num(cfg.i_query);
  idx.summary["i_reported_A_per_cm2"] = num(at.i);
  idx.summary["v_cell_V"] = num(at.v_cell);
  idx.summary["p_cell_W_per_cm2"] = num(at.p_cell);
  idx.summary["v_act_V"] = num(at.v_act);
  idx.summary["v_ohmic_V"] = num(at.v_ohmic);
  idx.summary["v_conc_V"] = num(at.v_conc);
  idx.summary["peak_power_W_per_cm2"] = num(peak.p_cell);
  idx.summary["peak_power_i_A_per_cm2"] = num(peak.i);

  idx.datasets["polarization"] = DatasetMeta{"polarization.dat", {"i", "v_cell", "p_cell"},
                                             "Polarization and power density curves"};
  idx.datasets["losses"] = DatasetMeta{"losses.dat", {"i", "v_act", "v_ohmic", "v_conc"},
                                       "Voltage loss breakdown"};

  write_results_json(outdir.string(), idx);
}

} // namespace pemfc
