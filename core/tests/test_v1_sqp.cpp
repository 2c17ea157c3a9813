#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dabtps/v1/sqp.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace dabtps::v1;
using Catch::Approx;

namespace {

Vector vec2(Real a, Real b) {
    Vector v(2);
    v << a, b;
    return v;
}

/// min (x-2)^2 + (y-1)^2  s.t.  x^2 + y^2 = 1, -2 <= x, y <= 2
SqpProblem make_circle_problem() {
    SqpProblem problem;
    problem.objective = [](const Vector& v) { return (v[0] - 2.0) * (v[0] - 2.0) + (v[1] - 1.0) * (v[1] - 1.0); };
    problem.equality = [](const Vector& v) { return v[0] * v[0] + v[1] * v[1] - 1.0; };
    problem.inequality_matrix = Matrix(0, 2);
    problem.inequality_offset = Vector(0);
    problem.lower = Vector::Constant(2, -2.0);
    problem.upper = Vector::Constant(2, 2.0);
    return problem;
}

}  // namespace

TEST_CASE("v1 active-set QP honours inequality constraints", "[v1][sqp][qp]") {
    const Matrix B = Matrix::Identity(2, 2);
    const Vector g = vec2(-2.0, -2.0);
    const Matrix A(0, 2);
    const Vector b(0);

    SECTION("unconstrained minimum") {
        const auto qp = solve_active_set_qp(B, g, A, b, Matrix(0, 2), Vector(0));
        REQUIRE(qp.has_value());
        CHECK(qp->step[0] == Approx(2.0));
        CHECK(qp->step[1] == Approx(2.0));
    }

    SECTION("one active bound") {
        Matrix G(1, 2);
        G << 1.0, 0.0;
        const Vector h = Vector::Constant(1, 1.0);
        const auto qp = solve_active_set_qp(B, g, A, b, G, h);
        REQUIRE(qp.has_value());
        CHECK(qp->step[0] == Approx(1.0));
        CHECK(qp->step[1] == Approx(2.0));
        CHECK(qp->objective == Approx(0.5 * 5.0 - 6.0));
    }

    SECTION("inconsistent constraints") {
        Matrix G(2, 2);
        G << 1.0, 0.0,
            -1.0, 0.0;
        const Vector h = vec2(-1.0, -1.0);   // p0 <= -1 and p0 >= 1
        CHECK_FALSE(solve_active_set_qp(B, g, A, b, G, h).has_value());
    }
}

TEST_CASE("v1 active-set QP with an equality row", "[v1][sqp][qp]") {
    const Matrix B = Matrix::Identity(2, 2);
    const Vector g = Vector::Zero(2);
    Matrix A(1, 2);
    A << 1.0, 1.0;
    const Vector b = Vector::Constant(1, 1.0);

    const auto qp = solve_active_set_qp(B, g, A, b, Matrix(0, 2), Vector(0));
    REQUIRE(qp.has_value());
    CHECK(qp->step[0] == Approx(0.5));
    CHECK(qp->step[1] == Approx(0.5));
    REQUIRE(qp->equality_multipliers.size() == 1);
}

TEST_CASE("v1 SQP solves a nonlinear equality-constrained problem", "[v1][sqp]") {
    SqpOptions options;
    options.track_history = true;
    const SqpSolver solver(options);

    const SqpResult result = solver.solve(make_circle_problem(), vec2(0.5, 0.5));
    INFO(result.message);
    REQUIRE(result.success());
    CHECK(result.x[0] == Approx(2.0 / std::sqrt(5.0)).margin(1e-6));
    CHECK(result.x[1] == Approx(1.0 / std::sqrt(5.0)).margin(1e-6));
    CHECK(result.constraint_violation < 1e-9);
    CHECK(result.objective == Approx(std::pow(std::sqrt(5.0) - 1.0, 2)).margin(1e-8));
    CHECK_FALSE(result.history.empty());
    CHECK(result.history.size() <= static_cast<std::size_t>(result.iterations));
}

TEST_CASE("v1 SQP respects linear inequality rows", "[v1][sqp]") {
    SqpProblem problem;
    problem.objective = [](const Vector& v) { return (v[0] - 2.0) * (v[0] - 2.0) + (v[1] - 2.0) * (v[1] - 2.0); };
    problem.inequality_matrix = Matrix(1, 2);
    problem.inequality_matrix << 1.0, 1.0;
    problem.inequality_offset = Vector::Constant(1, -1.0);   // x + y <= 1
    problem.lower = Vector::Zero(2);
    problem.upper = Vector::Constant(2, 10.0);

    const SqpResult result = SqpSolver{}.solve(problem, vec2(0.1, 0.1));
    INFO(result.message);
    REQUIRE(result.success());
    CHECK(result.x[0] == Approx(0.5).margin(1e-6));
    CHECK(result.x[1] == Approx(0.5).margin(1e-6));
}

TEST_CASE("v1 SQP reports failures through its status", "[v1][sqp][failure]") {
    SECTION("iteration cap") {
        SqpOptions options;
        options.max_iterations = 1;
        const SqpResult result = SqpSolver(options).solve(make_circle_problem(), vec2(0.5, 0.5));
        CHECK(result.status == SqpStatus::MaxIterationsReached);
        CHECK(result.message.find("did not converge") != std::string::npos);
        CHECK_FALSE(result.success());
    }

    SECTION("time budget") {
        SqpOptions options;
        options.time_budget_ms = 1e-9;
        const SqpResult result = SqpSolver(options).solve(make_circle_problem(), vec2(0.5, 0.5));
        CHECK(result.status == SqpStatus::TimeBudgetExceeded);
        CHECK(result.message.find("time budget") != std::string::npos);
    }

    SECTION("non-finite objective") {
        SqpProblem problem = make_circle_problem();
        problem.objective = [](const Vector&) { return std::numeric_limits<Real>::quiet_NaN(); };
        const SqpResult result = SqpSolver{}.solve(problem, vec2(0.5, 0.5));
        CHECK(result.status == SqpStatus::NumericalError);
        CHECK(std::string(to_string(result.status)) == "NumericalError");
    }
}
