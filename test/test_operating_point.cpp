// test/test_operating_point.cpp
/**
 * Unit Test: Operating-point queries
 *
 * Test Coverage:
 *   1. Nearest-sample lookup (ties, out-of-range queries)
 *   2. Linear interpolation between bracketing samples
 *   3. Peak power point
 *   4. Lookup mode parsing
 *   5. Reference scenario at 1.0 A/cm^2, both lookup modes
 */

#include "test_result.hpp"

#include <pemfc/losses.hpp>
#include <pemfc/operating_point.hpp>

#include <stdexcept>

using namespace pemfc;

// Hand-built 3-sample curve so expectations are exact.
PolarizationCurve small_curve() {
    PolarizationCurve c;
    c.E_nernst = 1.2;
    c.i = {0.5, 1.0, 1.5};
    c.v_act = {0.1, 0.2, 0.25};
    c.v_ohmic = {0.1, 0.2, 0.3};
    c.v_conc = {0.0, 0.1, 0.35};
    c.v_cell = {1.0, 0.7, 0.3};
    c.p_cell = {0.5, 0.7, 0.45};
    return c;
}

void test_nearest(TestResult& result) {
    std::cout << "\n=== Test 1: Nearest Sample ===\n";
    PolarizationCurve c = small_curve();

    result.check(nearest_index(c, 0.9) == 1, "0.9 maps to sample 1");
    result.check(nearest_index(c, 0.75) == 0, "Tie between samples 0 and 1 resolves to the lower index");
    result.check(nearest_index(c, -3.0) == 0, "Below the sweep maps to the first sample");
    result.check(nearest_index(c, 10.0) == 2, "Above the sweep maps to the last sample");

    OperatingPoint op = operating_point(c, 1.1, Lookup::Nearest);
    result.check(op.index == 1 && op.i == 1.0 && op.v_cell == 0.7 && op.p_cell == 0.7,
                 "Nearest lookup reports the sample verbatim");
    result.check(op.v_act == 0.2 && op.v_ohmic == 0.2 && op.v_conc == 0.1, "Loss breakdown comes from the same index");

    result.check(throws<std::runtime_error>([] { nearest_index(PolarizationCurve{}, 1.0); }),
                 "Empty curve rejected");
    PolarizationCurve broken = small_curve();
    broken.v_conc.pop_back();
    result.check(throws<std::runtime_error>([&] { operating_point(broken, 1.0); }),
                 "Misaligned curve rejected");
    result.check(throws<std::out_of_range>([&] { sample_at(c, 3); }), "sample_at past the end rejected");
}

void test_linear(TestResult& result) {
    std::cout << "\n=== Test 2: Linear Interpolation ===\n";
    PolarizationCurve c = small_curve();

    OperatingPoint op = operating_point(c, 1.25, Lookup::Linear);
    result.check(op.i == 1.25, "Reported current is the query itself");
    result.check(is_close(op.v_cell, 0.5, 1e-12), "v_cell interpolated to 0.5 V");
    result.check(is_close(op.p_cell, 0.575, 1e-12), "p_cell interpolated to 0.575 W/cm^2");
    result.check(is_close(op.v_act, 0.225, 1e-12) && is_close(op.v_ohmic, 0.25, 1e-12) &&
                     is_close(op.v_conc, 0.225, 1e-12),
                 "Loss components interpolated");

    OperatingPoint exact = operating_point(c, 1.0, Lookup::Linear);
    result.check(exact.v_cell == 0.7, "Query on a sample returns that sample");

    OperatingPoint low = operating_point(c, 0.1, Lookup::Linear);
    OperatingPoint high = operating_point(c, 2.0, Lookup::Linear);
    result.check(low.index == 0 && low.i == 0.5, "Below the sweep clamps to the first sample");
    result.check(high.index == 2 && high.i == 1.5, "Above the sweep clamps to the last sample");
}

void test_peak(TestResult& result) {
    std::cout << "\n=== Test 3: Peak Power ===\n";
    PolarizationCurve c = small_curve();
    OperatingPoint peak = peak_power(c);
    result.check(peak.index == 1 && peak.p_cell == 0.7 && peak.i == 1.0, "Peak power at sample 1");
}

void test_parse(TestResult& result) {
    std::cout << "\n=== Test 4: Lookup Parsing ===\n";
    result.check(parse_lookup("nearest") == Lookup::Nearest, "'nearest' parsed");
    result.check(parse_lookup("Linear") == Lookup::Linear, "'Linear' parsed case-insensitively");
    result.check(std::string(to_string(Lookup::Linear)) == "linear", "to_string round-trips");
    result.check(throws<std::runtime_error>([] { parse_lookup("cubic"); }), "Unknown mode rejected");
}

void test_reference_scenario(TestResult& result) {
    std::cout << "\n=== Test 5: Reference Scenario at 1.0 A/cm^2 ===\n";
    FuelCellParams p(353.0, 3.0, 3.0);
    PolarizationCurve c = run_sweep(p);

    const double exact_v = nernst_voltage(p) - activation_loss(p, 1.0) - ohmic_loss(p, 1.0) -
                           concentration_loss(p, 1.0);

    OperatingPoint nearest = operating_point(c, 1.0, Lookup::Nearest);
    result.check(nearest.index == 57, "Nearest sample index is 57");
    result.check(is_close(nearest.v_cell, 0.7830, 1e-3), "Nearest v_cell = 0.7830 V");
    result.check(is_close(nearest.p_cell, 0.7893, 1e-3), "Nearest p_cell = 0.7893 W/cm^2");
    result.check(is_close(c.E_nernst - nearest.v_act - nearest.v_ohmic - nearest.v_conc, nearest.v_cell, 1e-12),
                 "Breakdown sums with E_nernst to v_cell");

    OperatingPoint lin = operating_point(c, 1.0, Lookup::Linear);
    result.check(is_close(lin.v_cell, exact_v, 1e-4), "Linear v_cell matches direct evaluation: " +
                 std::to_string(lin.v_cell));
    result.check(is_close(lin.p_cell, 0.7850, 1e-3), "Linear p_cell = 0.7850 W/cm^2");
    result.check(is_close(lin.v_ohmic, 0.2, 1e-12), "Ohmic loss interpolates exactly");
}

int main() {
    std::cout << "\nOperating Point Unit Tests\n";

    TestResult result;
    test_nearest(result);
    test_linear(result);
    test_peak(result);
    test_parse(result);
    test_reference_scenario(result);
    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
