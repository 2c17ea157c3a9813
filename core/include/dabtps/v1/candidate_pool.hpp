#pragma once

// =============================================================================
// dabtps v1 - Candidate Pool and Grid Search (strategy b)
// =============================================================================
// A pool of classified, evaluated duty points built once per converter
// configuration. Several sampling sources feed the same pool:
//   - a volumetric grid over the duty cube
//   - boundary manifolds where optima concentrate (mode faces, the zone I/II
//     critical path, the zone V entry boundary, the d1 = 1 plane)
// The pool is sorted by power so each target becomes a window query.
// =============================================================================

#include "dabtps/v1/analytical_model.hpp"
#include "dabtps/v1/diagnostics.hpp"
#include "dabtps/v1/optimizer.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dabtps::v1 {

struct Candidate {
    DutyRatioPoint duties;
    OperatingMode mode = OperatingMode::Undefined;
    Real power = 0.0;   // [W]
    Real irms = 0.0;    // [A], clamped
};

struct PoolOptions {
    Real grid_step = 0.02;          // Volumetric grid spacing
    Real fine_step = 0.005;         // Spacing of the d1 = 1 plane sweep
    int path_points = 1000;         // Points along each analytical path
    int boundary_points = 500;      // d2 samples along the zone V entry boundary
    Real max_power_w = kInfinity;   // Upper clip for path generation
};

/// Classifies and evaluates points emitted by a source, dropping infeasible,
/// non-positive-power and degenerate ones
class CandidateSink {
public:
    CandidateSink(const AnalyticalModel& model, const ConverterParameters& params, EvaluationDiagnostics& diag,
                  std::vector<Candidate>& out);

    bool add(const DutyRatioPoint& x);

    [[nodiscard]] std::size_t accepted() const { return accepted_; }

private:
    const AnalyticalModel& model_;
    const ConverterParameters& params_;
    EvaluationDiagnostics& diag_;
    std::vector<Candidate>& out_;
    Real power_scale_;
    Real current_scale_;
    std::size_t accepted_ = 0;
};

class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    virtual void generate(const AnalyticalModel& model, const ConverterParameters& params,
                          const PoolOptions& options, CandidateSink& sink) const = 0;
};

/// Cell-centred grid: (i + 1/2) * step along every axis
class VolumetricGrid final : public CandidateSource {
public:
    [[nodiscard]] const char* name() const override { return "volumetric_grid"; }
    void generate(const AnalyticalModel& model, const ConverterParameters& params, const PoolOptions& options,
                  CandidateSink& sink) const override;
};

/// Planes separating the six TPS modes, sampled on the grid
class ModeBoundaryFaces final : public CandidateSource {
public:
    [[nodiscard]] const char* name() const override { return "mode_boundary_faces"; }
    void generate(const AnalyticalModel& model, const ConverterParameters& params, const PoolOptions& options,
                  CandidateSink& sink) const override;
};

/// Closed-form optimal path of the zone model: the zone I/II boundary below
/// the low critical power and plain phase shift above the high one
class CriticalPowerPath final : public CandidateSource {
public:
    [[nodiscard]] const char* name() const override { return "critical_power_path"; }
    void generate(const AnalyticalModel& model, const ConverterParameters& params, const PoolOptions& options,
                  CandidateSink& sink) const override;
};

/// Fine (d2, delta) sweep on the d1 = 1 plane
class FixedD1Sweep final : public CandidateSource {
public:
    [[nodiscard]] const char* name() const override { return "fixed_d1_sweep"; }
    void generate(const AnalyticalModel& model, const ConverterParameters& params, const PoolOptions& options,
                  CandidateSink& sink) const override;
};

/// Minimum-delta points of zone V at d1 = 1
class ZoneVBoundary final : public CandidateSource {
public:
    [[nodiscard]] const char* name() const override { return "zone_v_boundary"; }
    void generate(const AnalyticalModel& model, const ConverterParameters& params, const PoolOptions& options,
                  CandidateSink& sink) const override;
};

using CandidateSources = std::vector<std::unique_ptr<CandidateSource>>;

/// Grid plus the boundary sources that belong to the model
[[nodiscard]] CandidateSources default_sources(ModelKind kind);

class CandidatePool {
public:
    CandidatePool() = default;

    [[nodiscard]] static CandidatePool build(const AnalyticalModel& model, const ConverterParameters& params,
                                             const PoolOptions& options, const CandidateSources& sources);

    [[nodiscard]] static CandidatePool build(const AnalyticalModel& model, const ConverterParameters& params,
                                             const PoolOptions& options = {}) {
        return build(model, params, options, default_sources(model.kind()));
    }

    /// Sorted by ascending power
    [[nodiscard]] const std::vector<Candidate>& candidates() const { return candidates_; }
    [[nodiscard]] std::size_t size() const { return candidates_.size(); }
    [[nodiscard]] bool empty() const { return candidates_.empty(); }

    [[nodiscard]] const EvaluationDiagnostics& diagnostics() const { return diagnostics_; }

    /// Accepted candidates per source name
    [[nodiscard]] const std::map<std::string, std::size_t>& source_counts() const { return source_counts_; }

    /// Index range [first, last) of candidates with power in [lo, hi]
    [[nodiscard]] std::pair<std::size_t, std::size_t> power_window(Real lo, Real hi) const;

private:
    std::vector<Candidate> candidates_;
    EvaluationDiagnostics diagnostics_;
    std::map<std::string, std::size_t> source_counts_;
};

struct GridOptions {
    Real tolerance_w = 2.0;
    std::optional<Real> fallback_max_error_w;   // Empty disables the nearest-candidate fallback
};

/// Filter-and-argmin over a shared pool. Read-only, safe across threads.
class GridOptimizer {
public:
    explicit GridOptimizer(const CandidatePool& pool, GridOptions options = {});

    [[nodiscard]] OptimizationResult optimize(Real target_power) const;

    [[nodiscard]] const GridOptions& options() const { return options_; }

private:
    const CandidatePool& pool_;
    GridOptions options_;
};

}  // namespace dabtps::v1
