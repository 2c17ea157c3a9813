#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dabtps/v1/candidate_pool.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace dabtps::v1;
using Catch::Approx;

namespace {

ConverterParameters make_reference_params() {
    return ConverterParameters::from_half_period(200.0, 50.0, 1e-5, 20e-6);
}

/// Emits a fixed list of points, for pools with known content
class FixedPoints final : public CandidateSource {
public:
    explicit FixedPoints(std::vector<DutyRatioPoint> points) : points_(std::move(points)) {}

    [[nodiscard]] const char* name() const override { return "fixed_points"; }

    void generate(const AnalyticalModel&, const ConverterParameters&, const PoolOptions&,
                  CandidateSink& sink) const override {
        for (const auto& x : points_) {
            sink.add(x);
        }
    }

private:
    std::vector<DutyRatioPoint> points_;
};

CandidatePool make_fixed_pool(const AnalyticalModel& model, const ConverterParameters& params,
                              std::vector<DutyRatioPoint> points) {
    CandidateSources sources;
    sources.push_back(std::make_unique<FixedPoints>(std::move(points)));
    return CandidatePool::build(model, params, PoolOptions{}, sources);
}

}  // namespace

TEST_CASE("v1 candidate pool is classified and sorted by power", "[v1][grid][pool]") {
    SixModeModel model;
    const ConverterParameters params = make_reference_params();
    const CandidatePool pool = CandidatePool::build(model, params);

    REQUIRE_FALSE(pool.empty());
    CHECK(pool.source_counts().at("volumetric_grid") > 0);
    CHECK(pool.source_counts().at("mode_boundary_faces") > 0);

    const auto& cands = pool.candidates();
    for (std::size_t i = 0; i < cands.size(); ++i) {
        CHECK(cands[i].mode != OperatingMode::Undefined);
        CHECK(cands[i].power > 0.0);
        if (i > 0) {
            CHECK(cands[i - 1].power <= cands[i].power);
        }
    }
    CHECK(pool.diagnostics().significant_count == 0);
}

TEST_CASE("v1 candidate sink drops infeasible and non-positive points", "[v1][grid][pool]") {
    SixModeModel model;
    const ConverterParameters params = make_reference_params();
    const Real nan = std::nan("");

    const CandidatePool pool = make_fixed_pool(model, params,
                                               {{0.3, 0.1, 0.1},      // Mode1, positive power
                                                {nan, 0.1, 0.1},      // Non-finite
                                                {0.0, 0.0, 0.0},      // Zero power
                                                {0.5, 0.2, 0.3}});    // Mode1, positive power
    CHECK(pool.size() == 2);
    CHECK(pool.source_counts().at("fixed_points") == 2);
}

TEST_CASE("v1 grid optimizer picks the lowest current inside the window", "[v1][grid]") {
    SixModeModel model;
    const ConverterParameters params = make_reference_params();
    const CandidatePool pool = CandidatePool::build(model, params);
    const GridOptimizer grid(pool, GridOptions{});

    const OptimizationResult result = grid.optimize(500.0);
    REQUIRE(result.status == ResultStatus::Success);
    CHECK(std::abs(result.power_error) <= 2.0);
    CHECK(result.irms == Approx(11.37).margin(0.1));
    CHECK(result.mode == model.classify(result.duties, params));

    const auto [first, last] = pool.power_window(498.0, 502.0);
    REQUIRE(first < last);
    for (std::size_t i = first; i < last; ++i) {
        CHECK(result.irms <= pool.candidates()[i].irms);
    }
}

TEST_CASE("v1 grid optimizer applies the fallback policy", "[v1][grid][fallback]") {
    SixModeModel model;
    const ConverterParameters params = make_reference_params();
    const CandidatePool pool = make_fixed_pool(model, params, {{0.1, 0.05, 0.05}, {0.4, 0.05, 0.05}});
    REQUIRE(pool.size() == 2);

    const Real low = pool.candidates().front().power;
    const Real high = pool.candidates().back().power;
    const Real target = low + 0.3 * (high - low);
    const Real nearest = target - low;

    SECTION("no candidate and no fallback") {
        const OptimizationResult result = GridOptimizer(pool, GridOptions{}).optimize(target);
        CHECK(result.status == ResultStatus::NoSolution);
        CHECK(result.message.find("nearest error") != std::string::npos);
        CHECK(result.achieved_power == Approx(low));
    }

    SECTION("nearest candidate within the fallback range") {
        GridOptions options;
        options.fallback_max_error_w = nearest + 1.0;
        const OptimizationResult result = GridOptimizer(pool, options).optimize(target);
        CHECK(result.status == ResultStatus::Fallback);
        CHECK(result.success());
        CHECK(result.achieved_power == Approx(low));
        CHECK(result.power_error == Approx(-nearest));
    }

    SECTION("nearest candidate beyond the fallback range") {
        GridOptions options;
        options.fallback_max_error_w = nearest - 1.0;
        const OptimizationResult result = GridOptimizer(pool, options).optimize(target);
        CHECK(result.status == ResultStatus::NoSolution);
    }
}

TEST_CASE("v1 grid optimizer on an empty pool", "[v1][grid][failure]") {
    const CandidatePool pool;
    const OptimizationResult result = GridOptimizer(pool).optimize(500.0);
    CHECK(result.status == ResultStatus::NoSolution);
    CHECK(result.message.find("empty") != std::string::npos);
}

TEST_CASE("v1 zone pool includes the analytical boundary paths", "[v1][grid][zone]") {
    ZoneModel model;
    ConverterParameters params;
    params.v1 = 200.0;
    params.v2 = 260.0;
    params.fs = 50e3;
    params.inductance = 20e-6;

    const CandidatePool pool = CandidatePool::build(model, params);
    REQUIRE_FALSE(pool.empty());
    CHECK(pool.source_counts().at("critical_power_path") > 0);
    CHECK(pool.source_counts().at("fixed_d1_sweep") > 0);
    CHECK(pool.source_counts().at("zone_v_boundary") > 0);
    for (const auto& c : pool.candidates()) {
        CHECK((c.mode == OperatingMode::ZoneI || c.mode == OperatingMode::ZoneV));
    }
}
