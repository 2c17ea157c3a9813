#include "dabtps/v1/candidate_pool.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace dabtps::v1 {

namespace {

/// n evenly spaced values over [a, b], endpoints included
std::vector<Real> linspace(Real a, Real b, int n) {
    std::vector<Real> out;
    if (n <= 0) return out;
    if (n == 1) {
        out.push_back(a);
        return out;
    }
    out.reserve(static_cast<std::size_t>(n));
    const Real step = (b - a) / static_cast<Real>(n - 1);
    for (int i = 0; i < n; ++i) {
        out.push_back(i == n - 1 ? b : a + step * static_cast<Real>(i));
    }
    return out;
}

std::vector<Real> cell_centres(Real step) {
    const int count = static_cast<int>(std::floor(1.0 / step + 1e-9));
    std::vector<Real> out;
    out.reserve(static_cast<std::size_t>(std::max(count, 0)));
    for (int i = 0; i < count; ++i) {
        out.push_back((static_cast<Real>(i) + 0.5) * step);
    }
    return out;
}

bool strictly_inside_unit_cube(const DutyRatioPoint& x) {
    return x.d0 > 0.0 && x.d0 < 1.0 && x.d1 > 0.0 && x.d1 < 1.0 && x.d2 > 0.0 && x.d2 < 1.0;
}

std::string format_watts(Real value) {
    std::ostringstream oss;
    oss.precision(4);
    oss << value << " W";
    return oss.str();
}

void fill_from_candidate(OptimizationResult& result, const Candidate& c) {
    result.duties = c.duties;
    result.mode = c.mode;
    result.achieved_power = c.power;
    result.irms = c.irms;
    result.power_error = c.power - result.target_power;
    result.relative_error = result.target_power != 0.0 ? std::abs(result.power_error / result.target_power) : 0.0;
}

}  // namespace

// =============================================================================
// Sink
// =============================================================================

CandidateSink::CandidateSink(const AnalyticalModel& model, const ConverterParameters& params,
                             EvaluationDiagnostics& diag, std::vector<Candidate>& out)
    : model_(model),
      params_(params),
      diag_(diag),
      out_(out),
      power_scale_(model.power_scale(params)),
      current_scale_(model.current_scale(params)) {}

bool CandidateSink::add(const DutyRatioPoint& x) {
    const OperatingMode mode = model_.classify(x, params_);
    if (mode == OperatingMode::Undefined) {
        return false;
    }
    const Real m = params_.voltage_ratio();
    const Real power = power_scale_ * model_.scaled_power(mode, x, m);
    if (!(power > 0.0)) {
        return false;
    }
    const auto rms = clamped_rms(model_.scaled_irms_squared(mode, x, m), 1.0, diag_);
    if (!rms) {
        return false;
    }
    out_.push_back({x, mode, power, current_scale_ * *rms});
    ++accepted_;
    return true;
}

// =============================================================================
// Sources
// =============================================================================

void VolumetricGrid::generate(const AnalyticalModel& /*model*/, const ConverterParameters& /*params*/,
                              const PoolOptions& options, CandidateSink& sink) const {
    const auto values = cell_centres(options.grid_step);
    for (const Real a : values) {
        for (const Real b : values) {
            for (const Real c : values) {
                sink.add(DutyRatioPoint(a, b, c));
            }
        }
    }
}

void ModeBoundaryFaces::generate(const AnalyticalModel& model, const ConverterParameters& /*params*/,
                                 const PoolOptions& options, CandidateSink& sink) const {
    if (model.kind() != ModelKind::SixMode) {
        return;
    }
    const auto values = cell_centres(options.grid_step);
    for (const Real a : values) {
        for (const Real b : values) {
            const DutyRatioPoint faces[] = {
                {a, b, 1.0 - a},        // d0 + d2 = 1
                {a, b, b - a},          // d0 + d2 = d1
                {a, b, 1.0 + b - a},    // d0 + d2 = 1 + d1
                {a, a, b},              // d0 = d1
            };
            for (const auto& x : faces) {
                if (strictly_inside_unit_cube(x)) {
                    sink.add(x);
                }
            }
        }
    }
}

void CriticalPowerPath::generate(const AnalyticalModel& model, const ConverterParameters& params,
                                 const PoolOptions& options, CandidateSink& sink) const {
    if (model.kind() != ModelKind::Zone || options.path_points <= 0) {
        return;
    }
    const Real m = params.voltage_ratio();
    const Real p_limit = std::min(options.max_power_w / model.power_scale(params), ZoneModel::max_scaled_power(m));

    // Zone I/II boundary, scaled power in (0, pc1]
    const Real r1_max = std::min(ZoneModel::critical_power_low(m), p_limit);
    if (r1_max > 0.0) {
        for (const Real p : linspace(r1_max * 1e-6, r1_max, options.path_points)) {
            Real d1 = 0.0;
            Real d2 = 0.0;
            Real delta = 0.0;
            if (m > 1.0) {
                d2 = std::sqrt(2.0 * p / (kPi * m * (m - 1.0)));
                d1 = m * d2;
                delta = (m - 1.0) * d2;
            } else {
                d1 = std::sqrt(2.0 * p / ((1.0 - m) * kPi));
                d2 = d1 / m;
                delta = (1.0 - m) * d2;
            }
            if (d1 <= 1.0 && d2 <= 1.0 && delta <= 1.0 && d1 > 0.0) {
                sink.add(DutyRatioPoint(delta, d1, d2));
            }
        }
    }

    // Plain phase shift, scaled power in [pc2, p_limit]
    const Real pc2 = ZoneModel::critical_power_high(m);
    if (pc2 < p_limit) {
        for (const Real p : linspace(pc2, p_limit, options.path_points)) {
            const Real arg = 1.0 - 4.0 * p / (m * kPi);
            if (arg >= 0.0) {
                sink.add(DutyRatioPoint(1.0 - std::sqrt(arg), 1.0, 1.0));
            }
        }
    }
}

void FixedD1Sweep::generate(const AnalyticalModel& model, const ConverterParameters& /*params*/,
                            const PoolOptions& options, CandidateSink& sink) const {
    if (model.kind() != ModelKind::Zone) {
        return;
    }
    const int count = static_cast<int>(std::floor(1.0 / options.fine_step + 1e-9));
    for (int i = 1; i <= count; ++i) {
        const Real d2 = std::min(1.0, options.fine_step * static_cast<Real>(i));
        for (int j = 1; j <= count; ++j) {
            const Real delta = std::min(1.0, options.fine_step * static_cast<Real>(j));
            sink.add(DutyRatioPoint(delta, 1.0, d2));
        }
    }
}

void ZoneVBoundary::generate(const AnalyticalModel& model, const ConverterParameters& params,
                             const PoolOptions& options, CandidateSink& sink) const {
    if (model.kind() != ModelKind::Zone || options.boundary_points <= 0) {
        return;
    }
    constexpr int kDeltaSamples = 15;
    constexpr Real kDeltaSpan = 0.03;
    const Real m = params.voltage_ratio();
    const Real d2_low = std::max(1.0 / m, 0.01);
    if (d2_low > 1.0) {
        return;
    }
    for (const Real d2 : linspace(d2_low, 1.0, options.boundary_points)) {
        // Smallest delta meeting every zone V inequality with d1 = 1
        const Real delta_min = std::max({(m - 1.0) / m, 2.0 - (1.0 + m) * d2, 0.001});
        for (const Real delta : linspace(delta_min, std::min(delta_min + kDeltaSpan, 1.0), kDeltaSamples)) {
            sink.add(DutyRatioPoint(delta, 1.0, d2));
        }
    }
}

CandidateSources default_sources(ModelKind kind) {
    CandidateSources sources;
    sources.push_back(std::make_unique<VolumetricGrid>());
    if (kind == ModelKind::SixMode) {
        sources.push_back(std::make_unique<ModeBoundaryFaces>());
    } else {
        sources.push_back(std::make_unique<CriticalPowerPath>());
        sources.push_back(std::make_unique<FixedD1Sweep>());
        sources.push_back(std::make_unique<ZoneVBoundary>());
    }
    return sources;
}

// =============================================================================
// Pool
// =============================================================================

CandidatePool CandidatePool::build(const AnalyticalModel& model, const ConverterParameters& params,
                                   const PoolOptions& options, const CandidateSources& sources) {
    CandidatePool pool;
    for (const auto& source : sources) {
        CandidateSink sink(model, params, pool.diagnostics_, pool.candidates_);
        source->generate(model, params, options, sink);
        pool.source_counts_[source->name()] += sink.accepted();
    }
    std::sort(pool.candidates_.begin(), pool.candidates_.end(), [](const Candidate& a, const Candidate& b) {
        if (a.power != b.power) return a.power < b.power;
        return a.irms < b.irms;
    });
    return pool;
}

std::pair<std::size_t, std::size_t> CandidatePool::power_window(Real lo, Real hi) const {
    const auto first = std::lower_bound(candidates_.begin(), candidates_.end(), lo,
                                        [](const Candidate& c, Real value) { return c.power < value; });
    const auto last = std::upper_bound(first, candidates_.end(), hi,
                                       [](Real value, const Candidate& c) { return value < c.power; });
    return {static_cast<std::size_t>(first - candidates_.begin()),
            static_cast<std::size_t>(last - candidates_.begin())};
}

// =============================================================================
// Grid optimizer
// =============================================================================

GridOptimizer::GridOptimizer(const CandidatePool& pool, GridOptions options)
    : pool_(pool),
      options_(options) {}

OptimizationResult GridOptimizer::optimize(Real target_power) const {
    OptimizationResult result;
    result.target_power = target_power;
    result.attempts = 1;

    const auto& cands = pool_.candidates();
    if (cands.empty()) {
        result.status = ResultStatus::NoSolution;
        result.message = "Candidate pool is empty";
        return result;
    }

    const auto [first, last] =
        pool_.power_window(target_power - options_.tolerance_w, target_power + options_.tolerance_w);
    if (first < last) {
        const auto best = std::min_element(cands.begin() + static_cast<std::ptrdiff_t>(first),
                                           cands.begin() + static_cast<std::ptrdiff_t>(last),
                                           [](const Candidate& a, const Candidate& b) { return a.irms < b.irms; });
        fill_from_candidate(result, *best);
        result.status = ResultStatus::Success;
        return result;
    }

    // Nearest power, ties broken by lower current
    const std::size_t idx = pool_.power_window(target_power, kInfinity).first;
    Real nearest = kInfinity;
    if (idx < cands.size()) nearest = std::min(nearest, std::abs(cands[idx].power - target_power));
    if (idx > 0) nearest = std::min(nearest, std::abs(cands[idx - 1].power - target_power));

    constexpr Real kTie = 1e-12;
    const auto [lo, hi] = pool_.power_window(target_power - nearest - kTie, target_power + nearest + kTie);
    const Candidate* chosen = nullptr;
    for (std::size_t i = lo; i < hi; ++i) {
        const Real err = std::abs(cands[i].power - target_power);
        if (err > nearest + kTie) continue;
        if (chosen == nullptr || cands[i].irms < chosen->irms) {
            chosen = &cands[i];
        }
    }
    if (chosen != nullptr) {
        fill_from_candidate(result, *chosen);
    }

    if (options_.fallback_max_error_w && nearest <= *options_.fallback_max_error_w) {
        result.status = ResultStatus::Fallback;
        result.message = "Nearest candidate " + format_watts(nearest) + " from target";
    } else {
        result.status = ResultStatus::NoSolution;
        result.message = "No candidate within " + format_watts(options_.tolerance_w) + "; nearest error " +
                         format_watts(nearest);
    }
    return result;
}

}  // namespace dabtps::v1
