// =============================================================================
// dabtps - Python Bindings
// =============================================================================
// Exposes the analytical models, single-point optimizers, the sweep driver
// and the lookup interpolator. The YAML parser is reachable through
// load_config() so Python callers share the CLI's configuration schema.
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "dabtps/v1/candidate_pool.hpp"
#include "dabtps/v1/optimizer.hpp"
#include "dabtps/v1/parser/config_parser.hpp"
#include "dabtps/v1/surrogate.hpp"
#include "dabtps/v1/sweep.hpp"
#include "dabtps/v1/waveform.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace py = pybind11;
using namespace dabtps::v1;

namespace {

// =============================================================================
// Helper: raise on parser errors
// =============================================================================

SweepConfig load_or_raise(parser::ConfigParser& parser, const SweepConfig& config) {
    if (!parser.errors().empty()) {
        std::string message = "Invalid configuration:";
        for (const auto& err : parser.errors()) {
            message += "\n  " + err;
        }
        throw std::invalid_argument(message);
    }
    return config;
}

}  // namespace

// =============================================================================
// Module Definition
// =============================================================================

void init_v1_module(py::module_& v1) {
    v1.doc() = R"pbdoc(
        dabtps v1 - Minimum-RMS-current TPS modulation for DAB converters

        Example:
            import dabtps

            params = dabtps.ConverterParameters.from_half_period(200.0, 50.0, 1e-5, 20e-6)
            model = dabtps.make_model(dabtps.ModelKind.SixMode)
            opt = dabtps.NlpOptimizer(model, params)
            result = opt.optimize(500.0)
            print(result.duties.d0, result.irms, result.mode)
    )pbdoc";

    // =========================================================================
    // Enums
    // =========================================================================

    py::enum_<OperatingMode>(v1, "OperatingMode", "Operating mode tag")
        .value("Undefined", OperatingMode::Undefined)
        .value("Mode1", OperatingMode::Mode1)
        .value("Mode2", OperatingMode::Mode2)
        .value("Mode3", OperatingMode::Mode3)
        .value("Mode4", OperatingMode::Mode4)
        .value("Mode5", OperatingMode::Mode5)
        .value("Mode6", OperatingMode::Mode6)
        .value("ZoneI", OperatingMode::ZoneI)
        .value("ZoneII", OperatingMode::ZoneII)
        .value("ZoneV", OperatingMode::ZoneV);

    py::enum_<ModelKind>(v1, "ModelKind", "Analytical equation set")
        .value("SixMode", ModelKind::SixMode)
        .value("Zone", ModelKind::Zone);

    py::enum_<ResultStatus>(v1, "ResultStatus", "Per-row optimization outcome")
        .value("Success", ResultStatus::Success)
        .value("Fallback", ResultStatus::Fallback)
        .value("NoSolution", ResultStatus::NoSolution)
        .value("SolverFailed", ResultStatus::SolverFailed);

    py::enum_<Strategy>(v1, "Strategy", "Sweep optimization strategy")
        .value("Nlp", Strategy::Nlp)
        .value("Grid", Strategy::Grid);

    v1.def("mode_name", [](OperatingMode mode) { return std::string(to_string(mode)); });
    v1.def("status_name", [](ResultStatus status) { return std::string(to_string(status)); });

    // =========================================================================
    // Converter and duty ratios
    // =========================================================================

    py::class_<ConverterParameters>(v1, "ConverterParameters", "Fixed DAB converter parameters")
        .def(py::init<>())
        .def_readwrite("v1", &ConverterParameters::v1, "Primary DC voltage (V)")
        .def_readwrite("v2", &ConverterParameters::v2, "Secondary DC voltage (V)")
        .def_readwrite("fs", &ConverterParameters::fs, "Switching frequency (Hz)")
        .def_readwrite("inductance", &ConverterParameters::inductance, "Series inductance (H)")
        .def_readwrite("turns_ratio", &ConverterParameters::turns_ratio)
        .def_readwrite("r_series", &ConverterParameters::r_series, "Conduction resistance (ohm)")
        .def_static("from_half_period", &ConverterParameters::from_half_period,
                    py::arg("v1"), py::arg("v2"), py::arg("half_period"), py::arg("inductance"),
                    py::arg("turns_ratio") = 1.0)
        .def("half_period", &ConverterParameters::half_period)
        .def("voltage_ratio", &ConverterParameters::voltage_ratio)
        .def("validate", &ConverterParameters::validate);

    py::class_<DutyRatioPoint>(v1, "DutyRatioPoint", "Normalized duty ratios (d0, d1, d2)")
        .def(py::init<>())
        .def(py::init<Real, Real, Real>(), py::arg("d0"), py::arg("d1"), py::arg("d2"))
        .def_readwrite("d0", &DutyRatioPoint::d0)
        .def_readwrite("d1", &DutyRatioPoint::d1)
        .def_readwrite("d2", &DutyRatioPoint::d2)
        .def("__repr__", [](const DutyRatioPoint& x) {
            return "DutyRatioPoint(" + std::to_string(x.d0) + ", " + std::to_string(x.d1) + ", " +
                   std::to_string(x.d2) + ")";
        });

    py::class_<ZoneDesignInputs>(v1, "ZoneDesignInputs")
        .def(py::init<>())
        .def_readwrite("v1", &ZoneDesignInputs::v1)
        .def_readwrite("v2_min", &ZoneDesignInputs::v2_min)
        .def_readwrite("fs", &ZoneDesignInputs::fs)
        .def_readwrite("p_max", &ZoneDesignInputs::p_max)
        .def_readwrite("m_star", &ZoneDesignInputs::m_star);

    py::class_<ZoneDesign>(v1, "ZoneDesign")
        .def(py::init<>())
        .def_readwrite("turns_ratio", &ZoneDesign::turns_ratio)
        .def_readwrite("inductance", &ZoneDesign::inductance)
        .def_readwrite("p_star", &ZoneDesign::p_star);

    v1.def("optimal_scaled_power", &optimal_scaled_power, py::arg("m"));
    v1.def("design_turns_ratio_and_inductance", &design_turns_ratio_and_inductance, py::arg("inputs"));

    // =========================================================================
    // Analytical models
    // =========================================================================

    py::class_<AnalyticalModel, std::shared_ptr<AnalyticalModel>>(v1, "AnalyticalModel",
        "Closed-form power and RMS-current model")
        .def("kind", &AnalyticalModel::kind)
        .def("modes", [](const AnalyticalModel& model) {
            return std::vector<OperatingMode>(model.modes().begin(), model.modes().end());
        })
        .def("power", &AnalyticalModel::power, py::arg("mode"), py::arg("x"), py::arg("params"))
        .def("irms_squared", &AnalyticalModel::irms_squared, py::arg("mode"), py::arg("x"), py::arg("params"))
        .def("classify", &AnalyticalModel::classify, py::arg("x"), py::arg("params"),
             py::arg("tolerance") = kFeasibilityTolerance)
        .def("is_feasible", &AnalyticalModel::is_feasible, py::arg("mode"), py::arg("x"), py::arg("params"),
             py::arg("tolerance") = kFeasibilityTolerance)
        .def("physical_constraints", &AnalyticalModel::physical_constraints);

    v1.def("make_model", [](ModelKind kind) {
        return std::shared_ptr<AnalyticalModel>(make_model(kind));
    }, py::arg("kind"));

    v1.def("critical_power_low", &ZoneModel::critical_power_low, py::arg("m"));
    v1.def("critical_power_high", &ZoneModel::critical_power_high, py::arg("m"));

    // =========================================================================
    // Waveform
    // =========================================================================

    py::class_<WaveformSample>(v1, "WaveformSample")
        .def_readonly("time", &WaveformSample::time)
        .def_readonly("current", &WaveformSample::current)
        .def_readonly("v_primary", &WaveformSample::v_primary)
        .def_readonly("v_secondary", &WaveformSample::v_secondary);

    py::class_<WaveformMetrics>(v1, "WaveformMetrics")
        .def_readonly("breakpoints", &WaveformMetrics::breakpoints)
        .def_readonly("power", &WaveformMetrics::power)
        .def_readonly("irms", &WaveformMetrics::irms)
        .def_readonly("peak_current", &WaveformMetrics::peak_current)
        .def_readonly("conduction_loss", &WaveformMetrics::conduction_loss)
        .def_readonly("efficiency", &WaveformMetrics::efficiency);

    v1.def("simulate_inductor_current",
           [](const std::shared_ptr<AnalyticalModel>& model, const DutyRatioPoint& x,
              const ConverterParameters& params) {
               return simulate_inductor_current(*model, x, params);
           },
           py::arg("model"), py::arg("x"), py::arg("params"));

    // =========================================================================
    // Optimizers
    // =========================================================================

    py::class_<EvaluationDiagnostics>(v1, "EvaluationDiagnostics")
        .def(py::init<>())
        .def_readonly("evaluations", &EvaluationDiagnostics::evaluations)
        .def_readonly("negative_count", &EvaluationDiagnostics::negative_count)
        .def_readonly("significant_count", &EvaluationDiagnostics::significant_count)
        .def_readonly("most_negative", &EvaluationDiagnostics::most_negative)
        .def("negative_rate", &EvaluationDiagnostics::negative_rate);

    py::class_<OptimizationResult>(v1, "OptimizationResult")
        .def(py::init<>())
        .def_readonly("target_power", &OptimizationResult::target_power)
        .def_readonly("duties", &OptimizationResult::duties)
        .def_readonly("mode", &OptimizationResult::mode)
        .def_readonly("achieved_power", &OptimizationResult::achieved_power)
        .def_readonly("irms", &OptimizationResult::irms)
        .def_readonly("power_error", &OptimizationResult::power_error)
        .def_readonly("relative_error", &OptimizationResult::relative_error)
        .def_readonly("status", &OptimizationResult::status)
        .def_readonly("message", &OptimizationResult::message)
        .def_readonly("iterations", &OptimizationResult::iterations)
        .def_readonly("attempts", &OptimizationResult::attempts)
        .def("success", &OptimizationResult::success);

    py::class_<SqpOptions>(v1, "SqpOptions")
        .def(py::init<>())
        .def_readwrite("max_iterations", &SqpOptions::max_iterations)
        .def_readwrite("step_tolerance", &SqpOptions::step_tolerance)
        .def_readwrite("constraint_tolerance", &SqpOptions::constraint_tolerance)
        .def_readwrite("time_budget_ms", &SqpOptions::time_budget_ms);

    py::class_<OptimizerOptions>(v1, "OptimizerOptions")
        .def(py::init<>())
        .def_readwrite("sqp", &OptimizerOptions::sqp)
        .def_readwrite("lower_bound", &OptimizerOptions::lower_bound)
        .def_readwrite("upper_bound", &OptimizerOptions::upper_bound)
        .def_readwrite("initial_guess", &OptimizerOptions::initial_guess)
        .def_readwrite("retries", &OptimizerOptions::retries)
        .def_readwrite("power_tolerance_w", &OptimizerOptions::power_tolerance_w)
        .def_readwrite("mode_scope", &OptimizerOptions::mode_scope);

    // Holds the model alive for as long as the optimizer
    struct PyNlpOptimizer {
        std::shared_ptr<AnalyticalModel> model;
        NlpOptimizer optimizer;
    };
    py::class_<PyNlpOptimizer>(v1, "NlpOptimizer", "Constrained nonlinear search per mode")
        .def(py::init([](std::shared_ptr<AnalyticalModel> model, const ConverterParameters& params,
                         const OptimizerOptions& options) {
                 const AnalyticalModel& ref = *model;
                 return PyNlpOptimizer{std::move(model), NlpOptimizer(ref, params, options)};
             }),
             py::arg("model"), py::arg("params"), py::arg("options") = OptimizerOptions{})
        .def("optimize", [](const PyNlpOptimizer& self, Real target) {
            EvaluationDiagnostics diag;
            return self.optimizer.optimize(target, diag);
        }, py::arg("target_power"))
        .def("optimize_mode", [](const PyNlpOptimizer& self, Real target, OperatingMode mode) {
            EvaluationDiagnostics diag;
            return self.optimizer.optimize(target, mode, diag);
        }, py::arg("target_power"), py::arg("mode"));

    v1.def("sps_baseline",
           [](const std::shared_ptr<AnalyticalModel>& model, Real target, const ConverterParameters& params) {
               return sps_baseline(*model, target, params);
           },
           py::arg("model"), py::arg("target_power"), py::arg("params"));

    v1.def("solve_duty",
           [](const std::shared_ptr<AnalyticalModel>& model, OperatingMode mode, const DutyRatioPoint& x,
              int free_index, Real target, const ConverterParameters& params) {
               return solve_duty(*model, mode, x, free_index, target, params);
           },
           py::arg("model"), py::arg("mode"), py::arg("x"), py::arg("free_index"), py::arg("target_power"),
           py::arg("params"));

    // =========================================================================
    // Sweep
    // =========================================================================

    py::class_<PowerRange>(v1, "PowerRange")
        .def(py::init<>())
        .def_readwrite("start", &PowerRange::start)
        .def_readwrite("stop", &PowerRange::stop)
        .def_readwrite("step", &PowerRange::step)
        .def("values", &PowerRange::values);

    py::class_<SweepConfig>(v1, "SweepConfig")
        .def(py::init<>())
        .def_readwrite("converter", &SweepConfig::converter)
        .def_readwrite("design", &SweepConfig::design)
        .def_readwrite("range", &SweepConfig::range)
        .def_readwrite("strategy", &SweepConfig::strategy)
        .def_readwrite("model", &SweepConfig::model)
        .def_readwrite("optimizer", &SweepConfig::optimizer)
        .def_readwrite("threads", &SweepConfig::threads)
        .def_readwrite("v2_values", &SweepConfig::v2_values);

    py::class_<LookupRow>(v1, "LookupRow")
        .def_readonly("v2", &LookupRow::v2)
        .def_readonly("turns_ratio", &LookupRow::turns_ratio)
        .def_readonly("inductance", &LookupRow::inductance)
        .def_readonly("result", &LookupRow::result)
        .def_readonly("p_scaled", &LookupRow::p_scaled)
        .def_readonly("i_scaled", &LookupRow::i_scaled)
        .def_readonly("peak_current", &LookupRow::peak_current)
        .def_readonly("conduction_loss", &LookupRow::conduction_loss)
        .def_readonly("efficiency", &LookupRow::efficiency);

    py::class_<LookupTable>(v1, "LookupTable")
        .def_static("column_names", &LookupTable::column_names)
        .def("rows", &LookupTable::rows)
        .def("cells", &LookupTable::cells)
        .def("__len__", &LookupTable::size);

    py::class_<SweepSummary>(v1, "SweepSummary")
        .def_readonly("rows", &SweepSummary::rows)
        .def_readonly("succeeded", &SweepSummary::succeeded)
        .def_readonly("fallbacks", &SweepSummary::fallbacks)
        .def_readonly("no_solution", &SweepSummary::no_solution)
        .def_readonly("solver_failed", &SweepSummary::solver_failed)
        .def_readonly("mode_counts", &SweepSummary::mode_counts)
        .def_readonly("max_abs_error_w", &SweepSummary::max_abs_error_w)
        .def_readonly("convergence_rate", &SweepSummary::convergence_rate)
        .def_readonly("diagnostics", &SweepSummary::diagnostics)
        .def_readonly("warnings", &SweepSummary::warnings);

    py::class_<SweepOutcome>(v1, "SweepOutcome")
        .def_readonly("table", &SweepOutcome::table)
        .def_readonly("summary", &SweepOutcome::summary);

    v1.def("run_sweep", &run_sweep, py::arg("config"), py::call_guard<py::gil_scoped_release>());

    v1.def("load_config", [](const std::string& path) {
        parser::ConfigParser parser;
        const SweepConfig config = parser.load(path);
        return load_or_raise(parser, config);
    }, py::arg("path"));

    v1.def("load_config_string", [](const std::string& content) {
        parser::ConfigParser parser;
        const SweepConfig config = parser.load_string(content);
        return load_or_raise(parser, config);
    }, py::arg("content"));

    // =========================================================================
    // Surrogate
    // =========================================================================

    py::class_<SurrogatePrediction>(v1, "SurrogatePrediction")
        .def_readonly("duties", &SurrogatePrediction::duties)
        .def_readonly("irms", &SurrogatePrediction::irms)
        .def_readonly("mode", &SurrogatePrediction::mode);

    py::class_<LookupInterpolator>(v1, "LookupInterpolator", "Piecewise-linear surrogate over a lookup table")
        .def(py::init<>())
        .def(py::init<Real>(), py::arg("v2"))
        .def("train", &LookupInterpolator::train)
        .def("predict", &LookupInterpolator::predict)
        .def("__len__", &LookupInterpolator::size);

    // Version info
    v1.attr("__version__") = "0.1.0";
}

// =============================================================================
// Module Registration
// =============================================================================

PYBIND11_MODULE(_dabtps, m) {
    m.doc() = "dabtps TPS modulation optimizer (C++ extension)";
    init_v1_module(m);
}
