#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dabtps/v1/analytical_model.hpp"
#include "dabtps/v1/waveform.hpp"

#include <cmath>
#include <vector>

using namespace dabtps::v1;
using Catch::Approx;

namespace {

ConverterParameters make_six_mode_params() {
    return ConverterParameters::from_half_period(200.0, 50.0, 1e-5, 20e-6);
}

ConverterParameters make_zone_params(Real m) {
    ConverterParameters p;
    p.v1 = 200.0;
    p.v2 = 200.0 * m;
    p.fs = 50e3;
    p.inductance = 20e-6;
    return p;
}

/// Cell-centred points of the unit cube strictly inside a mode region
std::vector<DutyRatioPoint> interior_samples(const AnalyticalModel& model, OperatingMode mode,
                                             const ConverterParameters& params, Real step) {
    std::vector<DutyRatioPoint> out;
    const int n = static_cast<int>(std::round(1.0 / step));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            for (int k = 0; k < n; ++k) {
                const DutyRatioPoint x((i + 0.5) * step, (j + 0.5) * step, (k + 0.5) * step);
                if (model.is_feasible(mode, x, params, -1e-6)) {
                    out.push_back(x);
                }
            }
        }
    }
    return out;
}

void check_against_waveform(const AnalyticalModel& model, OperatingMode mode, const ConverterParameters& params) {
    const auto samples = interior_samples(model, mode, params, 0.05);
    INFO("mode " << to_string(mode) << " samples " << samples.size());
    REQUIRE(samples.size() >= 10);

    const Real p_unit = model.power_scale(params);
    const Real i_unit = model.current_scale(params);
    for (const auto& x : samples) {
        const WaveformMetrics wave = simulate_inductor_current(model, x, params);
        CHECK(model.power(mode, x, params) == Approx(wave.power).margin(1e-9 * p_unit));
        CHECK(model.irms_squared(mode, x, params) == Approx(wave.irms * wave.irms).margin(1e-9 * i_unit * i_unit));
    }
}

}  // namespace

TEST_CASE("v1 six-mode formulas match the integrated inductor current", "[v1][model][waveform]") {
    SixModeModel model;
    const ConverterParameters params = make_six_mode_params();
    for (const auto mode : model.modes()) {
        check_against_waveform(model, mode, params);
    }
}

TEST_CASE("v1 zone formulas match the integrated inductor current", "[v1][model][zone][waveform]") {
    ZoneModel model;

    SECTION("boost ratio covers zones I and V") {
        const ConverterParameters params = make_zone_params(1.3);
        check_against_waveform(model, OperatingMode::ZoneI, params);
        check_against_waveform(model, OperatingMode::ZoneV, params);
    }

    SECTION("buck ratio covers zones II and V") {
        const ConverterParameters params = make_zone_params(0.7);
        check_against_waveform(model, OperatingMode::ZoneII, params);
        check_against_waveform(model, OperatingMode::ZoneV, params);
    }
}

TEST_CASE("v1 six-mode power and Irms^2 are continuous across mode boundaries", "[v1][model][continuity]") {
    SixModeModel model;
    const Real m = 0.25;

    struct Boundary {
        OperatingMode a;
        OperatingMode b;
        DutyRatioPoint x;
    };
    const std::vector<Boundary> boundaries = {
        {OperatingMode::Mode1, OperatingMode::Mode2, {0.6, 0.2, 0.4}},    // d0 + d2 = 1
        {OperatingMode::Mode2, OperatingMode::Mode3, {0.7, 0.2, 0.5}},    // d0 + d2 = 1 + d1
        {OperatingMode::Mode4, OperatingMode::Mode5, {0.2, 0.5, 0.3}},    // d0 + d2 = d1
        {OperatingMode::Mode5, OperatingMode::Mode6, {0.3, 0.6, 0.7}},    // d0 + d2 = 1
        {OperatingMode::Mode1, OperatingMode::Mode5, {0.4, 0.4, 0.3}},    // d0 = d1
        {OperatingMode::Mode2, OperatingMode::Mode6, {0.5, 0.5, 0.7}},    // d0 = d1
    };

    for (const auto& b : boundaries) {
        INFO(to_string(b.a) << " / " << to_string(b.b));
        CHECK(model.scaled_power(b.a, b.x, m) == Approx(model.scaled_power(b.b, b.x, m)).margin(1e-12));
        CHECK(model.scaled_irms_squared(b.a, b.x, m) ==
              Approx(model.scaled_irms_squared(b.b, b.x, m)).margin(1e-12));
    }
}

TEST_CASE("v1 Irms^2 stays non-negative on valid points", "[v1][model][degeneracy]") {
    SECTION("six-mode model over the whole cube") {
        SixModeModel model;
        for (const Real m : {0.25, 0.8, 1.0, 1.5}) {
            ConverterParameters params = make_six_mode_params();
            params.v2 = params.v1 * m;
            const Real step = 0.04;
            for (int i = 0; i < 25; ++i) {
                for (int j = 0; j < 25; ++j) {
                    for (int k = 0; k < 25; ++k) {
                        const DutyRatioPoint x((i + 0.5) * step, (j + 0.5) * step, (k + 0.5) * step);
                        const OperatingMode mode = model.classify(x, params);
                        REQUIRE(mode != OperatingMode::Undefined);
                        CHECK(model.scaled_irms_squared(mode, x, m) >= -1e-9);
                    }
                }
            }
        }
    }

    SECTION("zone model inside its zones") {
        ZoneModel model;
        for (const Real m : {0.7, 1.3}) {
            const ConverterParameters params = make_zone_params(m);
            for (const auto mode : model.modes()) {
                for (const auto& x : interior_samples(model, mode, params, 0.05)) {
                    CHECK(model.scaled_irms_squared(mode, x, m) >= -1e-9);
                }
            }
        }
    }
}

TEST_CASE("v1 plain phase shift reduces to the textbook power curve", "[v1][model][sps]") {
    SixModeModel model;
    const ConverterParameters params = make_six_mode_params();
    const Real m = params.voltage_ratio();

    const DutyRatioPoint x(0.25, 0.0, 0.0);
    CHECK(model.scaled_power(OperatingMode::Mode1, x, m) == Approx(m * 0.25 * 0.75));

    const auto point = model.sps_point(500.0, params);
    REQUIRE(point.has_value());
    CHECK(point->d0 == Approx(0.1127).margin(1e-4));
    CHECK(point->d1 == 0.0);
    CHECK(point->d2 == 0.0);

    // Beyond m/4 of the power base nothing is reachable by phase shift alone
    CHECK_FALSE(model.sps_point(params.power_base() * m * 0.26, params).has_value());
}

TEST_CASE("v1 zone critical powers bracket the phase-shift range", "[v1][model][zone]") {
    for (const Real m : {0.7, 0.9, 1.1, 1.3}) {
        INFO("m = " << m);
        const Real low = ZoneModel::critical_power_low(m);
        const Real high = ZoneModel::critical_power_high(m);
        CHECK(low > 0.0);
        CHECK(low < high);
        CHECK(high < ZoneModel::max_scaled_power(m));
    }

    CHECK(ZoneModel::critical_power_low(1.3) == Approx(kPi * 0.3 / 2.6));
    CHECK(ZoneModel::critical_power_low(1.0) == 0.0);
    CHECK(ZoneModel::critical_power_high(1.0) == 0.0);
    CHECK(ZoneModel::max_scaled_power(1.0) == Approx(kPi / 4.0));
}

TEST_CASE("v1 zone design sizes turns ratio and inductance", "[v1][model][design]") {
    CHECK(optimal_scaled_power(1.3) == Approx(0.55461).margin(1e-9));

    ZoneDesignInputs inputs;
    inputs.v1 = 400.0;
    inputs.v2_min = 200.0;
    inputs.fs = 100e3;
    inputs.p_max = 3000.0;
    inputs.m_star = 1.3;

    const ZoneDesign design = design_turns_ratio_and_inductance(inputs);
    CHECK(design.turns_ratio == Approx(2.6));
    CHECK(design.p_star == Approx(0.55461).margin(1e-9));
    CHECK(design.inductance == Approx(0.55461 * 400.0 * 400.0 / (2.0 * kPi * 100e3 * 3000.0)).epsilon(1e-9));
}

TEST_CASE("v1 waveform reports peak current and conduction loss", "[v1][waveform]") {
    ConverterParameters params = make_six_mode_params();
    params.r_series = 0.1;

    const DutyRatioPoint x(0.3, 0.1, 0.05);
    const WaveformMetrics wave = simulate_inductor_current(x, params);

    REQUIRE(wave.breakpoints.size() >= 5);
    CHECK(wave.breakpoints.front().time == 0.0);
    CHECK(wave.breakpoints.back().time == Approx(2.0 * params.half_period()));
    CHECK(wave.breakpoints.back().current == Approx(wave.breakpoints.front().current).margin(1e-9));

    Real peak = 0.0;
    for (const auto& s : wave.breakpoints) {
        peak = std::max(peak, std::abs(s.current));
    }
    CHECK(wave.peak_current == Approx(peak));
    CHECK(wave.peak_current >= wave.irms);
    CHECK(wave.conduction_loss == Approx(wave.irms * wave.irms * 0.1));
    CHECK(wave.efficiency == Approx(wave.power / (wave.power + wave.conduction_loss)));
}
