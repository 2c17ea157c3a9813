#pragma once

// =============================================================================
// dabtps v1 - Single-Point Optimization
// =============================================================================

#include "dabtps/v1/analytical_model.hpp"
#include "dabtps/v1/diagnostics.hpp"
#include "dabtps/v1/sqp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dabtps::v1 {

enum class ResultStatus : std::uint8_t {
    Success,        // Within tolerance of the target
    Fallback,       // Nearest candidate accepted by the fallback policy
    NoSolution,     // Nothing within tolerance or fallback range
    SolverFailed    // Nonlinear search did not converge after retries
};

[[nodiscard]] constexpr const char* to_string(ResultStatus status) noexcept {
    switch (status) {
        case ResultStatus::Success: return "OK";
        case ResultStatus::Fallback: return "FALLBACK";
        case ResultStatus::NoSolution: return "NO_SOLUTION";
        case ResultStatus::SolverFailed: return "SOLVER_FAILED";
        default: return "UNKNOWN";
    }
}

/// Outcome of one target-power optimization. Immutable once returned.
struct OptimizationResult {
    Real target_power = 0.0;        // [W]
    DutyRatioPoint duties;
    OperatingMode mode = OperatingMode::Undefined;
    Real achieved_power = 0.0;      // [W]
    Real irms = 0.0;                // [A]
    Real power_error = 0.0;         // achieved - target [W]
    Real relative_error = 0.0;      // |power_error| / target
    ResultStatus status = ResultStatus::NoSolution;
    std::string message;
    int iterations = 0;
    int attempts = 0;

    [[nodiscard]] bool success() const {
        return status == ResultStatus::Success || status == ResultStatus::Fallback;
    }
};

struct OptimizerOptions {
    SqpOptions sqp;
    Real lower_bound = 0.01;
    Real upper_bound = 0.99;
    DutyRatioPoint initial_guess{0.65, 0.32, 0.20};
    int retries = 1;                        // Alternate initial guesses after a failed attempt
    Real power_tolerance_w = 1e-3;          // Accepted |achieved - target|
    std::optional<OperatingMode> mode_scope;    // Empty searches every mode of the model
};

/// Strategy (a): constrained nonlinear search, per mode, keeping the best mode.
/// Stateless after construction; safe to share between threads.
class NlpOptimizer {
public:
    NlpOptimizer(const AnalyticalModel& model, ConverterParameters params, OptimizerOptions options = {});

    [[nodiscard]] OptimizationResult optimize(Real target_power, EvaluationDiagnostics& diag) const;

    /// Restricts the search to one mode
    [[nodiscard]] OptimizationResult optimize(Real target_power, OperatingMode mode,
                                              EvaluationDiagnostics& diag) const;

    [[nodiscard]] const ConverterParameters& parameters() const { return params_; }
    [[nodiscard]] const OptimizerOptions& options() const { return options_; }

private:
    const AnalyticalModel& model_;
    ConverterParameters params_;
    OptimizerOptions options_;
    SqpSolver solver_;

    [[nodiscard]] SqpProblem build_problem(Real target_power, OperatingMode mode) const;
};

/// Single-phase-shift reference (both inner shifts at their plain-phase-shift
/// value) evaluated on the reconstructed waveform
[[nodiscard]] OptimizationResult sps_baseline(const AnalyticalModel& model, Real target_power,
                                              const ConverterParameters& params);

/// Solves power(mode, x) = target for one free duty ratio (index 0, 1 or 2),
/// holding the other two at the values in x. Scans [lo, hi] for a sign change
/// and bisects it.
[[nodiscard]] std::optional<DutyRatioPoint> solve_duty(const AnalyticalModel& model, OperatingMode mode,
                                                       const DutyRatioPoint& x, int free_index, Real target_power,
                                                       const ConverterParameters& params, Real lo = 0.0,
                                                       Real hi = 1.0);

}  // namespace dabtps::v1
