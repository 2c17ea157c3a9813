#pragma once

// =============================================================================
// dabtps v1 - Sequential Quadratic Programming
// =============================================================================
// Small dense SQP for problems of the form
//
//     minimize    f(x)
//     subject to  h(x) = 0            (at most one smooth equality)
//                 G x + g <= 0        (linear inequalities)
//                 lower <= x <= upper
//
// Quasi-Newton (damped BFGS) Hessian of the Lagrangian, active-set QP
// subproblem, L1 merit line search. Gradients by central differences.
// =============================================================================

#include "dabtps/v1/numeric_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dabtps::v1 {

enum class SqpStatus : std::uint8_t {
    Success,
    MaxIterationsReached,
    QpInfeasible,
    NumericalError,
    TimeBudgetExceeded
};

[[nodiscard]] constexpr const char* to_string(SqpStatus status) noexcept {
    switch (status) {
        case SqpStatus::Success: return "Success";
        case SqpStatus::MaxIterationsReached: return "MaxIterationsReached";
        case SqpStatus::QpInfeasible: return "QpInfeasible";
        case SqpStatus::NumericalError: return "NumericalError";
        case SqpStatus::TimeBudgetExceeded: return "TimeBudgetExceeded";
        default: return "Unknown";
    }
}

struct SqpOptions {
    int max_iterations = 100;
    Real step_tolerance = 1e-10;        // ||p||_inf for convergence
    Real constraint_tolerance = 1e-9;   // |h(x)| for convergence
    Real fd_step = 1e-7;                // Central-difference step
    Real armijo = 1e-4;
    Real min_step_length = 1e-10;
    Real elastic_penalty = 1e3;         // Quadratic penalty when the QP is infeasible
    Real time_budget_ms = 0.0;          // Wall-clock budget per solve, 0 disables
    bool track_history = false;
};

struct SqpIterationRecord {
    int iteration = 0;
    Real objective = 0.0;
    Real constraint_violation = 0.0;
    Real step_norm = 0.0;
    Real step_length = 1.0;
    bool elastic = false;
};

struct SqpProblem {
    std::function<Real(const Vector&)> objective;
    std::function<Real(const Vector&)> equality;    // Empty for unconstrained
    Matrix inequality_matrix;                       // Rows of G
    Vector inequality_offset;                       // g
    Vector lower;
    Vector upper;
};

struct SqpResult {
    Vector x;
    Real objective = 0.0;
    Real constraint_violation = 0.0;
    Real multiplier = 0.0;
    int iterations = 0;
    SqpStatus status = SqpStatus::MaxIterationsReached;
    std::string message;
    std::vector<SqpIterationRecord> history;

    [[nodiscard]] bool success() const { return status == SqpStatus::Success; }
};

/// Solution of one quadratic subproblem
struct QpSolution {
    Vector step;
    Vector equality_multipliers;
    Real objective = 0.0;
};

/// min 1/2 p'Bp + g'p  s.t.  A p = b,  G p <= h.
/// Enumerates working sets of size <= n - rows(A); exact for the small
/// problems solved here. Returns nullopt when no KKT point is feasible.
[[nodiscard]] std::optional<QpSolution> solve_active_set_qp(const Matrix& B, const Vector& g,
                                                            const Matrix& A, const Vector& b,
                                                            const Matrix& G, const Vector& h);

class SqpSolver {
public:
    explicit SqpSolver(SqpOptions options = {});

    [[nodiscard]] SqpResult solve(const SqpProblem& problem, const Vector& x0) const;

    [[nodiscard]] const SqpOptions& options() const { return options_; }

private:
    SqpOptions options_;

    [[nodiscard]] Vector gradient(const std::function<Real(const Vector&)>& fn, const Vector& x) const;
};

}  // namespace dabtps::v1
