#include "dabtps/v1/waveform.hpp"

#include <algorithm>
#include <cmath>

namespace dabtps::v1 {

namespace {

/// Wraps t into [0, 2)
Real wrap(Real t) {
    Real r = std::fmod(t, 2.0);
    if (r < 0.0) r += 2.0;
    return r;
}

/// Three-level bridge voltage with a zero interval of width z at the start of each half period
Real bridge_voltage(Real t, Real z, Real amplitude) {
    const Real u = wrap(t);
    if (u < z) return 0.0;
    if (u < 1.0) return amplitude;
    if (u < 1.0 + z) return 0.0;
    return -amplitude;
}

}  // namespace

WaveformMetrics simulate_inductor_current(const DutyRatioPoint& waveform_duties, const ConverterParameters& params) {
    WaveformMetrics metrics;
    const Real shift = waveform_duties.d0;
    const Real z1 = waveform_duties.d1;
    const Real z2 = waveform_duties.d2;
    const Real v1 = params.v1;
    const Real v2 = params.reflected_v2();
    const Real T = params.half_period();
    const Real slope_scale = T / params.inductance;

    // Normalized time: one half period is 1.0
    std::vector<Real> edges = {0.0, z1, 1.0, 1.0 + z1, 2.0};
    for (const Real e : {shift, shift + z2, shift + 1.0, shift + 1.0 + z2}) {
        edges.push_back(wrap(e));
    }
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end(),
                            [](Real a, Real b) { return std::abs(a - b) < 1e-15; }),
                edges.end());

    struct Segment {
        Real start;
        Real length;
        Real vp;
        Real vs;
    };
    std::vector<Segment> segments;
    segments.reserve(edges.size());
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        const Real mid = 0.5 * (edges[i] + edges[i + 1]);
        segments.push_back({edges[i], edges[i + 1] - edges[i], bridge_voltage(mid, z1, v1),
                            bridge_voltage(mid - shift, z2, v2)});
    }

    // Half-wave symmetry: i(1) = -i(0), so i(0) = -(rise over the first half)/2
    Real rise_half = 0.0;
    for (const auto& s : segments) {
        if (s.start >= 1.0) break;
        rise_half += (s.vp - s.vs) * std::min(s.length, 1.0 - s.start) * slope_scale;
    }

    Real i = -0.5 * rise_half;
    Real energy = 0.0;
    Real square = 0.0;
    for (const auto& s : segments) {
        const Real ia = i;
        const Real ib = ia + (s.vp - s.vs) * s.length * slope_scale;
        metrics.breakpoints.push_back({s.start * T, ia, s.vp, s.vs});
        metrics.peak_current = std::max({metrics.peak_current, std::abs(ia), std::abs(ib)});
        energy += s.vp * 0.5 * (ia + ib) * s.length;
        square += (ia * ia + ia * ib + ib * ib) / 3.0 * s.length;
        i = ib;
    }
    metrics.breakpoints.push_back({2.0 * T, i, segments.empty() ? 0.0 : segments.front().vp,
                                   segments.empty() ? 0.0 : segments.front().vs});

    metrics.power = 0.5 * energy;
    metrics.irms = std::sqrt(std::max(0.0, 0.5 * square));
    metrics.conduction_loss = metrics.irms * metrics.irms * params.r_series;
    if (metrics.power > 0.0 && metrics.conduction_loss > 0.0) {
        metrics.efficiency = metrics.power / (metrics.power + metrics.conduction_loss);
    }
    return metrics;
}

}  // namespace dabtps::v1
