#pragma once

// =============================================================================
// dabtps v1 - Power Sweep Driver
// =============================================================================
// Runs one optimizer per target power (optionally per secondary voltage) on a
// worker pool and assembles the lookup table. Rows are independent: a failed
// row is recorded in place and never aborts the sweep.
// =============================================================================

#include "dabtps/v1/candidate_pool.hpp"
#include "dabtps/v1/optimizer.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dabtps::v1 {

enum class Strategy : std::uint8_t {
    Nlp,    // Constrained nonlinear search per target
    Grid    // Precomputed candidate pool, filter + argmin per target
};

[[nodiscard]] constexpr const char* to_string(Strategy strategy) noexcept {
    switch (strategy) {
        case Strategy::Nlp: return "nlp";
        case Strategy::Grid: return "grid";
        default: return "unknown";
    }
}

/// Inclusive arithmetic range of target powers [W]
struct PowerRange {
    Real start = 0.0;
    Real stop = 0.0;
    Real step = 0.0;

    /// start + i*step for every i with start + i*step <= stop (up to round-off)
    [[nodiscard]] std::vector<Real> values() const;
};

struct DiagnosticsOptions {
    Real degeneracy_warning_rate = 1e-3;    // Negative Irms^2 share that raises a warning
    Real unity_ratio_margin = 0.02;         // |m - 1| below this raises a warning
};

struct SweepConfig {
    ConverterParameters converter;
    std::optional<ZoneDesignInputs> design;     // Overrides turns ratio and inductance
    PowerRange range;
    Strategy strategy = Strategy::Grid;
    ModelKind model = ModelKind::SixMode;
    OptimizerOptions optimizer;
    PoolOptions pool;
    GridOptions grid;
    DiagnosticsOptions diagnostics;
    int threads = 0;                            // 0 uses hardware concurrency
    std::vector<Real> v2_values;                // Empty sweeps converter.v2 only
};

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/// Converter parameters after applying the zone design, if any
[[nodiscard]] ConverterParameters resolved_converter(const SweepConfig& config);

/// Checks every field that would invalidate the whole sweep
[[nodiscard]] ValidationReport validate_config(const SweepConfig& config);

struct LookupRow {
    Real v2 = 0.0;                  // [V]
    Real turns_ratio = 1.0;
    Real inductance = 0.0;          // [H]
    OptimizationResult result;
    Real p_scaled = 0.0;            // Achieved power in model units
    Real i_scaled = 0.0;            // RMS current in model units
    Real peak_current = 0.0;        // [A]
    Real conduction_loss = 0.0;     // [W]
    Real efficiency = 1.0;
};

/// Ordered rows with a stable column schema
class LookupTable {
public:
    /// Column names in output order
    [[nodiscard]] static const std::vector<std::string>& column_names();

    void add_row(LookupRow row) { rows_.push_back(std::move(row)); }

    [[nodiscard]] const std::vector<LookupRow>& rows() const { return rows_; }
    [[nodiscard]] std::size_t size() const { return rows_.size(); }
    [[nodiscard]] bool empty() const { return rows_.empty(); }

    /// Cells of one row in column_names() order, formatted for text output
    [[nodiscard]] std::vector<std::string> cells(std::size_t index) const;

    /// Rows for one secondary voltage, in power order
    [[nodiscard]] std::vector<LookupRow> rows_for_v2(Real v2) const;

private:
    std::vector<LookupRow> rows_;
};

struct SweepSummary {
    std::size_t rows = 0;
    std::size_t succeeded = 0;
    std::size_t fallbacks = 0;
    std::size_t no_solution = 0;
    std::size_t solver_failed = 0;
    std::map<std::string, std::size_t> mode_counts;
    Real mean_abs_error_w = 0.0;    // Over succeeded and fallback rows
    Real max_abs_error_w = 0.0;
    Real convergence_rate = 0.0;    // (succeeded + fallbacks) / rows
    std::size_t pool_size = 0;      // Candidates per configuration (grid strategy)
    double elapsed_ms = 0.0;
    EvaluationDiagnostics diagnostics;
    std::vector<std::string> warnings;
};

struct SweepOutcome {
    LookupTable table;
    SweepSummary summary;
};

/// Validates, then runs the sweep. Throws std::invalid_argument carrying every
/// coded validation error when the configuration is malformed.
[[nodiscard]] SweepOutcome run_sweep(const SweepConfig& config);

}  // namespace dabtps::v1
