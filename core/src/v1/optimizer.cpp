#include "dabtps/v1/optimizer.hpp"
#include "dabtps/v1/waveform.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace dabtps::v1 {

namespace {

/// Interior search resolution used to seed retries and detect empty regions
constexpr Real kInteriorStep = 0.05;

Vector to_vector(const DutyRatioPoint& x) {
    Vector v(3);
    v << x.d0, x.d1, x.d2;
    return v;
}

/// Fills achieved power, current and errors for a point solved in `mode`.
/// Returns false when Irms^2 is rejected by the degeneracy check.
bool evaluate_point(const AnalyticalModel& model, const ConverterParameters& params, OperatingMode mode,
                    const DutyRatioPoint& x, OptimizationResult& result, EvaluationDiagnostics& diag) {
    const Real m = params.voltage_ratio();
    OperatingMode reported = model.classify(x, params);
    if (reported == OperatingMode::Undefined) {
        reported = mode;
    }
    result.duties = x;
    result.mode = reported;
    result.achieved_power = model.power_scale(params) * model.scaled_power(reported, x, m);
    result.power_error = result.achieved_power - result.target_power;
    result.relative_error = result.target_power != 0.0 ? std::abs(result.power_error / result.target_power) : 0.0;

    const auto rms = clamped_rms(model.scaled_irms_squared(reported, x, m), 1.0, diag);
    if (!rms) {
        result.irms = 0.0;
        return false;
    }
    result.irms = model.current_scale(params) * *rms;
    return true;
}

}  // namespace

NlpOptimizer::NlpOptimizer(const AnalyticalModel& model, ConverterParameters params, OptimizerOptions options)
    : model_(model),
      params_(params),
      options_(options),
      solver_(options.sqp) {}

SqpProblem NlpOptimizer::build_problem(Real target_power, OperatingMode mode) const {
    const Real m = params_.voltage_ratio();
    const Real target_scaled = target_power / model_.power_scale(params_);
    const AnalyticalModel& model = model_;

    SqpProblem problem;
    problem.objective = [&model, mode, m](const Vector& v) {
        return model.scaled_irms_squared(mode, DutyRatioPoint(v[0], v[1], v[2]), m);
    };
    problem.equality = [&model, mode, m, target_scaled](const Vector& v) {
        return model.scaled_power(mode, DutyRatioPoint(v[0], v[1], v[2]), m) - target_scaled;
    };

    const Region region = model_.region(mode, m);
    problem.inequality_matrix = Matrix(static_cast<Eigen::Index>(region.size()), 3);
    problem.inequality_offset = Vector(static_cast<Eigen::Index>(region.size()));
    for (std::size_t i = 0; i < region.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        problem.inequality_matrix.row(row) = region[i].a.transpose();
        problem.inequality_offset[row] = region[i].b;
    }
    problem.lower = Vector::Constant(3, options_.lower_bound);
    problem.upper = Vector::Constant(3, options_.upper_bound);
    return problem;
}

OptimizationResult NlpOptimizer::optimize(Real target_power, OperatingMode mode, EvaluationDiagnostics& diag) const {
    OptimizationResult result;
    result.target_power = target_power;
    result.mode = mode;

    if (!model_.has_mode(mode)) {
        result.status = ResultStatus::SolverFailed;
        result.message = std::string("Mode ") + to_string(mode) + " is not part of the " +
                         to_string(model_.kind()) + " model";
        return result;
    }
    if (!std::isfinite(target_power) || target_power <= 0.0) {
        result.status = ResultStatus::NoSolution;
        result.message = "Target power must be positive and finite";
        return result;
    }

    const Real lo = options_.lower_bound;
    const Real hi = options_.upper_bound;
    const InteriorPoint interior =
        find_interior_point(model_.region(mode, params_.voltage_ratio()), lo, hi, kInteriorStep);
    if (interior.margin < 0.0) {
        result.status = ResultStatus::NoSolution;
        result.message = std::string(to_string(mode)) + " region is empty inside the duty envelope";
        return result;
    }

    // First attempt from the configured guess when it lies in the mode, then alternates
    std::vector<DutyRatioPoint> guesses;
    const DutyRatioPoint& configured = options_.initial_guess;
    if (configured.within(lo, hi) && model_.is_feasible(mode, configured, params_)) {
        guesses.push_back(configured);
    }
    const DutyRatioPoint seed = model_.seed(mode, params_);
    if (std::find(guesses.begin(), guesses.end(), seed) == guesses.end()) {
        guesses.push_back(seed);
    }
    if (std::find(guesses.begin(), guesses.end(), interior.point) == guesses.end()) {
        guesses.push_back(interior.point);
    }
    const std::size_t max_attempts = std::min<std::size_t>(guesses.size(),
                                                           static_cast<std::size_t>(1 + std::max(0, options_.retries)));

    const SqpProblem problem = build_problem(target_power, mode);
    Real best_violation = kInfinity;
    std::string last_message;

    for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
        const SqpResult sqp = solver_.solve(problem, to_vector(guesses[attempt]));
        result.attempts += 1;
        result.iterations += sqp.iterations;
        const DutyRatioPoint x(sqp.x[0], sqp.x[1], sqp.x[2]);

        if (sqp.success()) {
            OptimizationResult candidate = result;
            if (!evaluate_point(model_, params_, mode, x, candidate, diag)) {
                last_message = "Irms^2 significantly negative at converged point";
            } else if (std::abs(candidate.power_error) > options_.power_tolerance_w) {
                last_message = "Converged point misses target by " + std::to_string(candidate.power_error) + " W";
            } else if (!model_.is_feasible(mode, x, params_, 1e-7)) {
                last_message = "Converged point left the mode region";
            } else {
                candidate.status = ResultStatus::Success;
                candidate.message = sqp.message;
                return candidate;
            }
        } else {
            last_message = sqp.message;
        }

        if (sqp.constraint_violation < best_violation) {
            best_violation = sqp.constraint_violation;
            // Keep the least-violating point as best effort
            OptimizationResult best_effort = result;
            static_cast<void>(evaluate_point(model_, params_, mode, x, best_effort, diag));
            result = best_effort;
        }
    }

    result.status = ResultStatus::SolverFailed;
    result.message = last_message;
    return result;
}

OptimizationResult NlpOptimizer::optimize(Real target_power, EvaluationDiagnostics& diag) const {
    if (options_.mode_scope) {
        return optimize(target_power, *options_.mode_scope, diag);
    }

    std::optional<OptimizationResult> best;
    std::optional<OptimizationResult> closest_failure;
    std::string failures;
    int attempts = 0;
    int iterations = 0;

    for (const auto mode : model_.modes()) {
        OptimizationResult r = optimize(target_power, mode, diag);
        attempts += r.attempts;
        iterations += r.iterations;
        if (r.success()) {
            if (!best || r.irms < best->irms) {
                best = std::move(r);
            }
            continue;
        }
        if (!failures.empty()) failures += "; ";
        failures += std::string(to_string(mode)) + ": " + r.message;
        const bool better = !closest_failure ||
                            (r.status == ResultStatus::SolverFailed &&
                             closest_failure->status != ResultStatus::SolverFailed) ||
                            (r.status == closest_failure->status &&
                             std::abs(r.power_error) < std::abs(closest_failure->power_error));
        if (better) {
            closest_failure = std::move(r);
        }
    }

    if (!best && !closest_failure) {
        OptimizationResult empty;
        empty.target_power = target_power;
        empty.status = ResultStatus::SolverFailed;
        empty.message = "Model has no operating modes";
        return empty;
    }
    OptimizationResult out = best ? *best : *closest_failure;
    if (!best) {
        out.message = failures;
    }
    out.attempts = attempts;
    out.iterations = iterations;
    return out;
}

OptimizationResult sps_baseline(const AnalyticalModel& model, Real target_power, const ConverterParameters& params) {
    OptimizationResult result;
    result.target_power = target_power;
    result.attempts = 1;

    const auto point = model.sps_point(target_power, params);
    if (!point) {
        result.status = ResultStatus::NoSolution;
        result.message = "Target power exceeds single-phase-shift capability";
        return result;
    }

    const WaveformMetrics wave = simulate_inductor_current(model, *point, params);
    result.duties = *point;
    result.mode = model.classify(*point, params);
    result.achieved_power = wave.power;
    result.irms = wave.irms;
    result.power_error = wave.power - target_power;
    result.relative_error = target_power != 0.0 ? std::abs(result.power_error / target_power) : 0.0;
    result.status = ResultStatus::Success;
    return result;
}

std::optional<DutyRatioPoint> solve_duty(const AnalyticalModel& model, OperatingMode mode, const DutyRatioPoint& x,
                                         int free_index, Real target_power, const ConverterParameters& params,
                                         Real lo, Real hi) {
    if (free_index < 0 || free_index > 2 || !(hi > lo)) {
        return std::nullopt;
    }

    auto at = [&](Real t) {
        DutyRatioPoint p = x;
        if (free_index == 0) p.d0 = t;
        else if (free_index == 1) p.d1 = t;
        else p.d2 = t;
        return p;
    };
    auto residual = [&](Real t) { return model.power(mode, at(t), params) - target_power; };

    constexpr int kScanIntervals = 200;
    Real a = lo;
    Real fa = residual(a);
    for (int i = 1; i <= kScanIntervals; ++i) {
        const Real b = lo + (hi - lo) * static_cast<Real>(i) / kScanIntervals;
        const Real fb = residual(b);
        if (fa == 0.0) {
            return at(a);
        }
        if ((fa < 0.0) != (fb < 0.0)) {
            Real left = a;
            Real right = b;
            Real f_left = fa;
            for (int iter = 0; iter < 100 && right - left > 1e-14; ++iter) {
                const Real mid = 0.5 * (left + right);
                const Real fm = residual(mid);
                if ((fm < 0.0) == (f_left < 0.0)) {
                    left = mid;
                    f_left = fm;
                } else {
                    right = mid;
                }
            }
            return at(0.5 * (left + right));
        }
        a = b;
        fa = fb;
    }
    return std::nullopt;
}

}  // namespace dabtps::v1
