#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dabtps/v1/analytical_model.hpp"

#include <limits>
#include <string>

using namespace dabtps::v1;
using Catch::Approx;

namespace {

ConverterParameters make_params(Real v2) {
    return ConverterParameters::from_half_period(200.0, v2, 1e-5, 20e-6);
}

}  // namespace

TEST_CASE("v1 six-mode seeds classify into their own mode", "[v1][classifier]") {
    SixModeModel model;
    const ConverterParameters params = make_params(50.0);

    for (const auto mode : model.modes()) {
        const DutyRatioPoint seed = model.seed(mode, params);
        INFO(to_string(mode));
        CHECK(model.classify(seed, params) == mode);
        CHECK(model.is_feasible(mode, seed, params));
        for (const Real slack : model.physical_constraints(mode, seed, params)) {
            CHECK(slack < 0.0);
        }
    }
}

TEST_CASE("v1 classifier resolves shared boundaries by priority", "[v1][classifier]") {
    SixModeModel model;
    const ConverterParameters params = make_params(50.0);

    // d0 + d2 = 1 belongs to both Mode1 and Mode2
    const DutyRatioPoint boundary(0.6, 0.2, 0.4);
    CHECK(model.is_feasible(OperatingMode::Mode1, boundary, params));
    CHECK(model.is_feasible(OperatingMode::Mode2, boundary, params));
    CHECK(model.classify(boundary, params) == OperatingMode::Mode1);

    // d0 = d1 belongs to both Mode1 and Mode5
    const DutyRatioPoint diagonal(0.4, 0.4, 0.3);
    CHECK(model.classify(diagonal, params) == OperatingMode::Mode1);

    // Just past the boundary the second mode wins
    CHECK(model.classify(DutyRatioPoint(0.6, 0.2, 0.45), params) == OperatingMode::Mode2);
    CHECK(model.classify(DutyRatioPoint(0.35, 0.4, 0.3), params) == OperatingMode::Mode5);
}

TEST_CASE("v1 classifier returns Undefined for infeasible input", "[v1][classifier]") {
    const ConverterParameters params = make_params(260.0);

    SECTION("non-finite duties") {
        SixModeModel model;
        const Real nan = std::numeric_limits<Real>::quiet_NaN();
        CHECK(model.classify(DutyRatioPoint(nan, 0.2, 0.3), params) == OperatingMode::Undefined);
        CHECK(model.classify(DutyRatioPoint(0.2, kInfinity, 0.3), params) == OperatingMode::Undefined);
    }

    SECTION("outside every zone") {
        ZoneModel model;
        CHECK(model.classify(DutyRatioPoint(0.05, 0.05, 0.9), params) == OperatingMode::Undefined);
    }

    SECTION("mode from another model") {
        ZoneModel model;
        CHECK_FALSE(model.has_mode(OperatingMode::Mode1));
        CHECK_FALSE(model.is_feasible(OperatingMode::Mode1, DutyRatioPoint(0.5, 0.5, 0.5), params));
        CHECK(model.physical_constraints(OperatingMode::Mode1, DutyRatioPoint(0.5, 0.5, 0.5), params).empty());
    }
}

TEST_CASE("v1 zone regions depend on the voltage ratio", "[v1][classifier][zone]") {
    ZoneModel model;

    SECTION("boost ratio leaves zone II empty") {
        const Region region = model.region(OperatingMode::ZoneII, 1.3);
        CHECK(find_interior_point(region, 0.01, 0.99).margin < 0.0);
        CHECK(find_interior_point(model.region(OperatingMode::ZoneI, 1.3), 0.01, 0.99).margin > 0.0);
    }

    SECTION("buck ratio leaves zone I empty") {
        CHECK(find_interior_point(model.region(OperatingMode::ZoneI, 0.7), 0.01, 0.99).margin < 0.0);
        const InteriorPoint inside = find_interior_point(model.region(OperatingMode::ZoneII, 0.7), 0.01, 0.99);
        REQUIRE(inside.margin > 0.0);
        CHECK(model.classify(inside.point, make_params(140.0)) == OperatingMode::ZoneII);
    }

    SECTION("plain phase shift lies in zone V") {
        const ConverterParameters params = make_params(260.0);
        const auto sps = model.sps_point(0.8 * model.power_scale(params), params);
        REQUIRE(sps.has_value());
        CHECK(sps->d1 == 1.0);
        CHECK(sps->d2 == 1.0);
        CHECK(model.classify(*sps, params) == OperatingMode::ZoneV);
    }
}

TEST_CASE("v1 mode tags round-trip through their names", "[v1][classifier]") {
    for (const auto mode : kAllModeTags) {
        const auto parsed = parse_operating_mode(to_string(mode));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == mode);
    }
    CHECK_FALSE(parse_operating_mode("MODE_7").has_value());
    CHECK(std::string(to_string(OperatingMode::ZoneII)) == "ZONE_II");
    CHECK(std::string(to_string(ModelKind::Zone)) == "zone");
}
