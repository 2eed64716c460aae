#include <pemfc/config.hpp>
#include <pemfc/io.hpp>
#include <pemfc/operating_point.hpp>
#include <pemfc/report.hpp>
#include <pemfc/sweep.hpp>
#include <pemfc/verify.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef PEMFC_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "pemfc (PEM fuel cell polarization sweep)\n"
            << "Usage:\n"
            << "  pemfc [--config <path/to/config.ini>]\n"
            << "Without --config the built-in operating point is used (T=353 K, P_H2=P_O2=3 atm).\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    std::string cfg_path;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }

    pemfc::SimConfig cfg = cfg_path.empty() ? pemfc::SimConfig{} : pemfc::load_config(cfg_path);

#ifdef PEMFC_HAS_OPENMP
    if (cfg.omp_threads > 0) {
      omp_set_num_threads(cfg.omp_threads);
    }
#endif

    const pemfc::FuelCellParams params = cfg.params();
    const pemfc::PolarizationCurve curve = pemfc::run_sweep(params, cfg.sweep);
    std::cout << "[sweep] " << curve.size() << " samples, i in [" << curve.i.front() << ", "
              << curve.i.back() << "] A/cm^2, E_nernst=" << curve.E_nernst << " V\n";

    if (cfg.verify) {
      auto rep = pemfc::verify_curve(params, curve);
      std::cout << "[verify] voltage balance residual: " << rep.balance_residual
                << " (ok=" << (rep.balance_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] power identity residual: " << rep.power_residual
                << " (ok=" << (rep.power_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] samples ordered: " << (rep.samples_ok ? "true" : "false")
                << ", monotone losses: " << (rep.monotone_losses_ok ? "true" : "false")
                << ", interior peak (k=" << rep.peak_index << "): "
                << (rep.interior_peak ? "true" : "false") << "\n";
    }

    const pemfc::OperatingPoint at = pemfc::operating_point(curve, cfg.i_query, cfg.lookup);
    const pemfc::OperatingPoint peak = pemfc::peak_power(curve);
    pemfc::print_breakdown(std::cout, curve, at, peak);

    if (cfg.write_outputs) {
      std::string config_used;
      pemfc::ensure_dir(cfg.output_dir);
      if (!cfg_path.empty()) {
        config_used = "config_used.ini";
        pemfc::copy_file(cfg_path, (std::filesystem::path(cfg.output_dir) / config_used).string());
      }
      pemfc::write_sweep_outputs(cfg, params, curve, at, peak, config_used);
      std::cout << "[report] Output in: " << cfg.output_dir << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
