#include "dabtps/v1/sweep.hpp"
#include "dabtps/v1/waveform.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace dabtps::v1 {

namespace {

constexpr const char* kDiagEmptyRange = "DABTPS_CFG_E_RANGE_EMPTY";
constexpr const char* kDiagInvalidParameter = "DABTPS_CFG_E_PARAM_INVALID";
constexpr const char* kDiagModeScope = "DABTPS_CFG_E_MODE_SCOPE";
constexpr const char* kDiagRatioNearUnity = "DABTPS_CFG_W_RATIO_NEAR_UNITY";
constexpr const char* kDiagDesignModel = "DABTPS_CFG_W_DESIGN_UNUSED";
constexpr const char* kDiagDegeneracyRate = "DABTPS_DIAG_W_DEGENERACY_RATE";
constexpr const char* kDiagIrmsNegative = "DABTPS_DIAG_W_IRMS_NEGATIVE";
constexpr const char* kDiagNoSolution = "DABTPS_DIAG_W_NO_SOLUTION";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string format_real(Real value, int precision = 6) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << value;
    return oss.str();
}

bool positive_finite(Real value) {
    return std::isfinite(value) && value > 0.0;
}

std::vector<Real> secondary_voltages(const SweepConfig& config) {
    if (config.v2_values.empty()) {
        return {config.converter.v2};
    }
    return config.v2_values;
}

/// Runs fn(index, worker) for every index on up to `threads` workers.
/// Indices are claimed from an atomic counter; the first worker exception is rethrown.
template <typename Fn>
void parallel_for(std::size_t count, int threads, Fn&& fn) {
    std::size_t workers = threads > 0 ? static_cast<std::size_t>(threads)
                                      : std::max(1u, std::thread::hardware_concurrency());
    workers = std::max<std::size_t>(1, std::min(workers, count));
    if (workers == 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i, std::size_t{0});
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&, w] {
            try {
                for (;;) {
                    const std::size_t i = next.fetch_add(1);
                    if (i >= count) break;
                    fn(i, w);
                }
            } catch (...) {
                errors[w] = std::current_exception();
                next.store(count);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

std::size_t worker_count(int threads, std::size_t jobs) {
    const std::size_t wanted = threads > 0 ? static_cast<std::size_t>(threads)
                                           : std::max(1u, std::thread::hardware_concurrency());
    return std::max<std::size_t>(1, std::min(wanted, jobs));
}

}  // namespace

std::vector<Real> PowerRange::values() const {
    std::vector<Real> out;
    if (!(step > 0.0) || !std::isfinite(start) || !std::isfinite(stop) || stop < start) {
        return out;
    }
    const auto count = static_cast<std::size_t>(std::floor((stop - start) / step + 1e-9)) + 1;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(start + step * static_cast<Real>(i));
    }
    return out;
}

ConverterParameters resolved_converter(const SweepConfig& config) {
    ConverterParameters params = config.converter;
    if (config.design) {
        ZoneDesignInputs inputs = *config.design;
        inputs.v1 = params.v1;
        inputs.fs = params.fs;
        const ZoneDesign design = design_turns_ratio_and_inductance(inputs);
        params.turns_ratio = design.turns_ratio;
        params.inductance = design.inductance;
    }
    return params;
}

ValidationReport validate_config(const SweepConfig& config) {
    ValidationReport report;
    auto& errors = report.errors;
    auto& warnings = report.warnings;

    if (config.design) {
        const auto& d = *config.design;
        if (!positive_finite(d.v2_min)) push_error(errors, kDiagInvalidParameter, "design.v2_min must be positive");
        if (!positive_finite(d.p_max)) push_error(errors, kDiagInvalidParameter, "design.p_max must be positive");
        if (!positive_finite(d.m_star)) push_error(errors, kDiagInvalidParameter, "design.m_star must be positive");
        if (positive_finite(d.m_star) && !(optimal_scaled_power(d.m_star) > 0.0)) {
            push_error(errors, kDiagInvalidParameter,
                       "design.m_star = " + format_real(d.m_star) + " gives a non-positive optimal power");
        }
        if (config.model != ModelKind::Zone) {
            push_warning(warnings, kDiagDesignModel, "design section sizes the zone model but model is six_mode");
        }
    }

    const ConverterParameters params = resolved_converter(config);
    for (auto& e : params.validate()) {
        errors.push_back(std::move(e));
    }

    const auto& r = config.range;
    if (!std::isfinite(r.start) || !std::isfinite(r.stop) || !std::isfinite(r.step)) {
        push_error(errors, kDiagEmptyRange, "sweep range must be finite");
    } else if (!(r.step > 0.0)) {
        push_error(errors, kDiagEmptyRange, "sweep.step must be positive (got " + format_real(r.step) + ")");
    } else if (r.stop < r.start) {
        push_error(errors, kDiagEmptyRange,
                   "sweep.stop (" + format_real(r.stop) + ") is below sweep.start (" + format_real(r.start) + ")");
    } else if (!(r.start > 0.0)) {
        push_error(errors, kDiagEmptyRange, "sweep.start must be positive (got " + format_real(r.start) + ")");
    }

    const auto& opt = config.optimizer;
    if (!(opt.lower_bound >= 0.0 && opt.upper_bound <= 1.0 && opt.lower_bound < opt.upper_bound)) {
        push_error(errors, kDiagInvalidParameter, "optimizer bounds must satisfy 0 <= lower_bound < upper_bound <= 1");
    }
    if (opt.sqp.max_iterations <= 0) {
        push_error(errors, kDiagInvalidParameter, "optimizer.max_iterations must be positive");
    }
    if (!positive_finite(opt.sqp.constraint_tolerance) || !positive_finite(opt.sqp.step_tolerance)) {
        push_error(errors, kDiagInvalidParameter, "optimizer tolerances must be positive");
    }
    if (opt.retries < 0) {
        push_error(errors, kDiagInvalidParameter, "optimizer.retries must be non-negative");
    }
    if (!(opt.sqp.time_budget_ms >= 0.0)) {
        push_error(errors, kDiagInvalidParameter, "optimizer.time_budget_ms must be non-negative");
    }
    if (!positive_finite(opt.power_tolerance_w)) {
        push_error(errors, kDiagInvalidParameter, "optimizer.power_tolerance_w must be positive");
    }
    if (opt.mode_scope) {
        const auto model = make_model(config.model);
        if (!model->has_mode(*opt.mode_scope)) {
            push_error(errors, kDiagModeScope,
                       std::string("optimizer.mode ") + to_string(*opt.mode_scope) + " is not part of the " +
                           to_string(config.model) + " model");
        }
    }

    if (!(config.pool.grid_step > 0.0 && config.pool.grid_step <= 0.5)) {
        push_error(errors, kDiagInvalidParameter, "grid.step must lie in (0, 0.5]");
    }
    if (!(config.pool.fine_step > 0.0 && config.pool.fine_step <= 0.5)) {
        push_error(errors, kDiagInvalidParameter, "grid.fine_step must lie in (0, 0.5]");
    }
    if (config.pool.path_points < 0 || config.pool.boundary_points < 0) {
        push_error(errors, kDiagInvalidParameter, "grid.path_points must be non-negative");
    }
    if (!positive_finite(config.grid.tolerance_w)) {
        push_error(errors, kDiagInvalidParameter, "grid.tolerance_w must be positive");
    }
    if (config.grid.fallback_max_error_w && !(*config.grid.fallback_max_error_w >= 0.0)) {
        push_error(errors, kDiagInvalidParameter, "grid.fallback_max_error_w must be non-negative");
    }
    if (config.threads < 0) {
        push_error(errors, kDiagInvalidParameter, "sweep.threads must be non-negative");
    }

    for (const Real v2 : secondary_voltages(config)) {
        if (!positive_finite(v2)) {
            push_error(errors, kDiagInvalidParameter, "secondary voltage " + format_real(v2) + " must be positive");
            continue;
        }
        ConverterParameters p = params;
        p.v2 = v2;
        const Real m = p.voltage_ratio();
        if (std::isfinite(m) && std::abs(m - 1.0) < config.diagnostics.unity_ratio_margin) {
            push_warning(warnings, kDiagRatioNearUnity,
                         "voltage ratio m = " + format_real(m, 12) + " at V2 = " + format_real(v2) +
                             " lies within " + format_real(config.diagnostics.unity_ratio_margin) +
                             " of 1; Irms^2 formulas lose their sign guarantee there");
        }
    }

    return report;
}

// =============================================================================
// Lookup table
// =============================================================================

const std::vector<std::string>& LookupTable::column_names() {
    static const std::vector<std::string> names = {
        "target_power_w", "achieved_power_w", "power_error_w", "d0", "d1", "d2", "irms_a", "mode", "status",
        "v2_v", "turns_ratio", "inductance_h", "p_scaled", "i_scaled", "peak_current_a", "conduction_loss_w",
        "efficiency"};
    return names;
}

std::vector<std::string> LookupTable::cells(std::size_t index) const {
    const LookupRow& row = rows_.at(index);
    const OptimizationResult& r = row.result;
    auto num = [](Real v) { return format_real(v, 10); };
    return {num(r.target_power), num(r.achieved_power), num(r.power_error), num(r.duties.d0), num(r.duties.d1),
            num(r.duties.d2), num(r.irms), to_string(r.mode), to_string(r.status), num(row.v2),
            num(row.turns_ratio), num(row.inductance), num(row.p_scaled), num(row.i_scaled),
            num(row.peak_current), num(row.conduction_loss), num(row.efficiency)};
}

std::vector<LookupRow> LookupTable::rows_for_v2(Real v2) const {
    std::vector<LookupRow> out;
    std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(out),
                 [v2](const LookupRow& row) { return row.v2 == v2; });
    return out;
}

// =============================================================================
// Sweep
// =============================================================================

SweepOutcome run_sweep(const SweepConfig& config) {
    const ValidationReport report = validate_config(config);
    if (!report.ok()) {
        std::string message = "Invalid sweep configuration:";
        for (const auto& e : report.errors) {
            message += "\n  " + e;
        }
        throw std::invalid_argument(message);
    }

    const auto start_time = std::chrono::steady_clock::now();
    const auto model = make_model(config.model);
    const ConverterParameters base = resolved_converter(config);
    const std::vector<Real> powers = config.range.values();
    const std::vector<Real> v2s = secondary_voltages(config);

    std::vector<ConverterParameters> params_per_v2;
    for (const Real v2 : v2s) {
        ConverterParameters p = base;
        p.v2 = v2;
        params_per_v2.push_back(p);
    }

    SweepOutcome outcome;
    SweepSummary& summary = outcome.summary;
    summary.warnings = report.warnings;

    // Pools are built once per configuration and shared read-only by every worker
    std::vector<CandidatePool> pools;
    if (config.strategy == Strategy::Grid) {
        pools.reserve(params_per_v2.size());
        for (const auto& p : params_per_v2) {
            pools.push_back(CandidatePool::build(*model, p, config.pool));
            summary.diagnostics.merge(pools.back().diagnostics());
        }
        summary.pool_size = pools.empty() ? 0 : pools.front().size();
    }

    std::vector<GridOptimizer> grid_optimizers;
    std::vector<NlpOptimizer> nlp_optimizers;
    for (std::size_t k = 0; k < params_per_v2.size(); ++k) {
        if (config.strategy == Strategy::Grid) {
            grid_optimizers.emplace_back(pools[k], config.grid);
        } else {
            nlp_optimizers.emplace_back(*model, params_per_v2[k], config.optimizer);
        }
    }

    const std::size_t jobs = powers.size() * v2s.size();
    std::vector<OptimizationResult> results(jobs);
    std::vector<EvaluationDiagnostics> worker_diag(worker_count(config.threads, jobs));

    parallel_for(jobs, config.threads, [&](std::size_t job, std::size_t worker) {
        const std::size_t k = job / powers.size();
        const Real target = powers[job % powers.size()];
        results[job] = config.strategy == Strategy::Grid ? grid_optimizers[k].optimize(target)
                                                         : nlp_optimizers[k].optimize(target, worker_diag[worker]);
    });
    for (const auto& d : worker_diag) {
        summary.diagnostics.merge(d);
    }

    Real error_sum = 0.0;
    for (std::size_t job = 0; job < jobs; ++job) {
        const ConverterParameters& p = params_per_v2[job / powers.size()];
        LookupRow row;
        row.v2 = p.v2;
        row.turns_ratio = p.turns_ratio;
        row.inductance = p.inductance;
        row.result = std::move(results[job]);
        const OptimizationResult& r = row.result;

        if (r.success()) {
            row.p_scaled = r.achieved_power / model->power_scale(p);
            row.i_scaled = r.irms / model->current_scale(p);
            const WaveformMetrics wave = simulate_inductor_current(*model, r.duties, p);
            row.peak_current = wave.peak_current;
            row.conduction_loss = r.irms * r.irms * p.r_series;
            row.efficiency = r.achieved_power > 0.0 && row.conduction_loss > 0.0
                                 ? r.achieved_power / (r.achieved_power + row.conduction_loss)
                                 : 1.0;
            error_sum += std::abs(r.power_error);
            summary.max_abs_error_w = std::max(summary.max_abs_error_w, std::abs(r.power_error));
            summary.mode_counts[to_string(r.mode)] += 1;
        }

        switch (r.status) {
            case ResultStatus::Success: ++summary.succeeded; break;
            case ResultStatus::Fallback: ++summary.fallbacks; break;
            case ResultStatus::NoSolution: ++summary.no_solution; break;
            case ResultStatus::SolverFailed: ++summary.solver_failed; break;
        }
        outcome.table.add_row(std::move(row));
    }

    summary.rows = jobs;
    const std::size_t converged = summary.succeeded + summary.fallbacks;
    summary.mean_abs_error_w = converged > 0 ? error_sum / static_cast<Real>(converged) : 0.0;
    summary.convergence_rate = jobs > 0 ? static_cast<Real>(converged) / static_cast<Real>(jobs) : 0.0;

    const auto& diag = summary.diagnostics;
    if (diag.negative_rate() > config.diagnostics.degeneracy_warning_rate) {
        push_warning(summary.warnings, kDiagDegeneracyRate,
                     std::to_string(diag.negative_count) + " of " + std::to_string(diag.evaluations) +
                         " Irms^2 evaluations were negative (most negative " + format_real(diag.most_negative) +
                         "); move the voltage ratio away from 1");
    }
    if (diag.significant_count > 0) {
        push_warning(summary.warnings, kDiagIrmsNegative,
                     std::to_string(diag.significant_count) +
                         " evaluations were rejected as significantly negative or non-finite");
    }
    if (summary.no_solution + summary.solver_failed > 0) {
        push_warning(summary.warnings, kDiagNoSolution,
                     std::to_string(summary.no_solution) + " rows without a candidate, " +
                         std::to_string(summary.solver_failed) + " rows where the solver failed");
    }

    summary.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
    return outcome;
}

}  // namespace dabtps::v1
