// test/test_params.cpp
/**
 * Unit Test: FuelCellParams
 *
 * Test Coverage:
 *   1. Defaults for alpha, area resistance and limiting current
 *   2. Explicit construction parameters
 *   3. Domain validation (InvalidParameter)
 */

#include "test_result.hpp"

#include <pemfc/errors.hpp>
#include <pemfc/params.hpp>

#include <limits>

using pemfc::FuelCellParams;
using pemfc::InvalidParameter;

void test_defaults(TestResult& result) {
    std::cout << "\n=== Test 1: Defaults ===\n";
    FuelCellParams p(353.0, 3.0, 3.0);
    result.check(p.T() == 353.0 && p.P_H2() == 3.0 && p.P_O2() == 3.0, "Operating conditions stored");
    result.check(p.alpha() == 0.5, "Default alpha is 0.5");
    result.check(p.area_resistance() == 0.2, "Default area resistance is 0.2 Ohm cm^2");
    result.check(p.i_limit() == 1.8, "Default limiting current is 1.8 A/cm^2");
}

void test_explicit(TestResult& result) {
    std::cout << "\n=== Test 2: Explicit Parameters ===\n";
    FuelCellParams p(330.0, 1.5, 0.21, 1.0, 0.0, 2.5);
    result.check(p.alpha() == 1.0, "alpha = 1 accepted (closed upper bound)");
    result.check(p.area_resistance() == 0.0, "Zero area resistance accepted");
    result.check(p.i_limit() == 2.5, "Custom limiting current stored");

    FuelCellParams copy = p;
    result.check(copy.P_O2() == 0.21 && copy.T() == 330.0, "Copies carry the same values");
}

void test_validation(TestResult& result) {
    std::cout << "\n=== Test 3: Domain Validation ===\n";
    const double nan = std::numeric_limits<double>::quiet_NaN();

    result.check(throws<InvalidParameter>([] { FuelCellParams(0.0, 1.0, 1.0); }), "T = 0 rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(-10.0, 1.0, 1.0); }), "Negative T rejected");
    result.check(throws<InvalidParameter>([nan] { FuelCellParams(nan, 1.0, 1.0); }), "NaN T rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 0.0, 1.0); }), "P_H2 = 0 rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 1.0, -1.0); }), "Negative P_O2 rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 1.0, 1.0, 0.0); }), "alpha = 0 rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 1.0, 1.0, 1.01); }), "alpha > 1 rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 1.0, 1.0, 0.5, -0.1); }),
                 "Negative area resistance rejected");
    result.check(throws<InvalidParameter>([] { FuelCellParams(353.0, 1.0, 1.0, 0.5, 0.2, 0.0); }),
                 "i_limit = 0 rejected");

    try {
        FuelCellParams(353.0, 1.0, 1.0, 2.0);
        result.fail("alpha = 2 should throw");
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        result.check(msg.find("alpha") != std::string::npos, "Error message names the field: " + msg);
    }
}

int main() {
    std::cout << "\nFuelCellParams Unit Tests\n";

    TestResult result;
    test_defaults(result);
    test_explicit(result);
    test_validation(result);
    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
