#include <pemfc/operating_point.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace pemfc {

namespace {

void require_curve(const PolarizationCurve& c, const char* who) {
  if (c.empty()) throw std::runtime_error(std::string(who) + ": empty curve");
  const std::size_t n = c.size();
  if (c.v_cell.size() != n || c.p_cell.size() != n || c.v_act.size() != n ||
      c.v_ohmic.size() != n || c.v_conc.size() != n) {
    throw std::runtime_error(std::string(who) + ": curve vectors are not index-aligned");
  }
}

// return k such that i[k-1] <= xq < i[k], with k in [1, n-1].
std::size_t upper_index(const std::vector<double>& x, double xq) {
  auto it = std::upper_bound(x.begin(), x.end(), xq);
  if (it == x.begin()) return 1;
  if (it == x.end()) return x.size() - 1;
  return static_cast<std::size_t>(it - x.begin());
}

double lerp(double a, double b, double t) { return (1.0 - t) * a + t * b; }

} // namespace

Lookup parse_lookup(const std::string& s) {
  std::string x = s;
  std::transform(x.begin(), x.end(), x.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (x == "nearest") return Lookup::Nearest;
  if (x == "linear") return Lookup::Linear;
  throw std::runtime_error("lookup must be one of: nearest, linear (got '" + s + "')");
}

const char* to_string(Lookup l) {
  return l == Lookup::Linear ? "linear" : "nearest";
}

std::size_t nearest_index(const PolarizationCurve& curve, double i_query) {
  require_curve(curve, "nearest_index");
  std::size_t best = 0;
  double best_d = std::fabs(curve.i[0] - i_query);
  for (std::size_t k = 1; k < curve.size(); ++k) {
    double d = std::fabs(curve.i[k] - i_query);
    if (d < best_d) {
      best_d = d;
      best = k;
    }
  }
  return best;
}

OperatingPoint sample_at(const PolarizationCurve& curve, std::size_t k) {
  require_curve(curve, "sample_at");
  if (k >= curve.size()) throw std::out_of_range("sample_at: index out of range");
  OperatingPoint op;
  op.index = k;
  op.i = curve.i[k];
  op.v_cell = curve.v_cell[k];
  op.p_cell = curve.p_cell[k];
  op.v_act = curve.v_act[k];
  op.v_ohmic = curve.v_ohmic[k];
  op.v_conc = curve.v_conc[k];
  return op;
}

OperatingPoint operating_point(const PolarizationCurve& curve, double i_query, Lookup mode) {
  const std::size_t nearest = nearest_index(curve, i_query);
  if (mode == Lookup::Nearest || curve.size() < 2) return sample_at(curve, nearest);

  if (i_query <= curve.i.front()) return sample_at(curve, 0);
  if (i_query >= curve.i.back()) return sample_at(curve, curve.size() - 1);

  const std::size_t k1 = upper_index(curve.i, i_query);
  const std::size_t k0 = k1 - 1;
  const double t = (i_query - curve.i[k0]) / (curve.i[k1] - curve.i[k0]);

  OperatingPoint op;
  op.index = nearest;
  op.i = i_query;
  op.v_cell = lerp(curve.v_cell[k0], curve.v_cell[k1], t);
  op.p_cell = lerp(curve.p_cell[k0], curve.p_cell[k1], t);
  op.v_act = lerp(curve.v_act[k0], curve.v_act[k1], t);
  op.v_ohmic = lerp(curve.v_ohmic[k0], curve.v_ohmic[k1], t);
  op.v_conc = lerp(curve.v_conc[k0], curve.v_conc[k1], t);
  return op;
}

OperatingPoint peak_power(const PolarizationCurve& curve) {
  require_curve(curve, "peak_power");
  auto it = std::max_element(curve.p_cell.begin(), curve.p_cell.end());
  return sample_at(curve, static_cast<std::size_t>(it - curve.p_cell.begin()));
}

} // namespace pemfc
