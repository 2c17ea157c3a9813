#include "dabtps/v1/analytical_model.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dabtps::v1 {

InteriorPoint find_interior_point(const Region& region, Real lo, Real hi, Real step) {
    InteriorPoint best;
    best.margin = -kInfinity;
    const int count = std::max(1, static_cast<int>(std::floor((hi - lo) / step + 1e-9)) + 1);

    for (int i = 0; i < count; ++i) {
        for (int j = 0; j < count; ++j) {
            for (int k = 0; k < count; ++k) {
                const DutyRatioPoint x(lo + i * step, lo + j * step, lo + k * step);
                Real margin = std::min({x.d0 - lo, hi - x.d0, x.d1 - lo, hi - x.d1, x.d2 - lo, hi - x.d2});
                for (const auto& hs : region) {
                    // Normalize by |a| so the margin is a Euclidean distance
                    const Real norm = hs.a.norm();
                    margin = std::min(margin, norm > 0.0 ? -hs.slack(x) / norm : -hs.slack(x));
                }
                if (margin > best.margin) {
                    best.margin = margin;
                    best.point = x;
                }
            }
        }
    }
    return best;
}

DutyRatioPoint AnalyticalModel::seed(OperatingMode mode, const ConverterParameters& params) const {
    return find_interior_point(region(mode, params.voltage_ratio()), 0.0, 1.0).point;
}

bool AnalyticalModel::has_mode(OperatingMode mode) const {
    const auto list = modes();
    return std::find(list.begin(), list.end(), mode) != list.end();
}

OperatingMode AnalyticalModel::classify(const DutyRatioPoint& x, const ConverterParameters& params,
                                        Real tolerance) const {
    if (!x.is_finite()) {
        return OperatingMode::Undefined;
    }
    for (const auto mode : modes()) {
        if (is_feasible(mode, x, params, tolerance)) {
            return mode;
        }
    }
    return OperatingMode::Undefined;
}

bool AnalyticalModel::is_feasible(OperatingMode mode, const DutyRatioPoint& x, const ConverterParameters& params,
                                  Real tolerance) const {
    if (!has_mode(mode) || !x.is_finite()) {
        return false;
    }
    const Region hs = region(mode, params.voltage_ratio());
    return std::all_of(hs.begin(), hs.end(), [&](const HalfSpace& h) { return h.slack(x) <= tolerance; });
}

std::vector<Real> AnalyticalModel::physical_constraints(OperatingMode mode, const DutyRatioPoint& x,
                                                        const ConverterParameters& params) const {
    std::vector<Real> slacks;
    if (!has_mode(mode)) {
        return slacks;
    }
    const Region hs = region(mode, params.voltage_ratio());
    slacks.reserve(hs.size());
    for (const auto& h : hs) {
        slacks.push_back(h.slack(x));
    }
    return slacks;
}

std::unique_ptr<AnalyticalModel> make_model(ModelKind kind) {
    switch (kind) {
        case ModelKind::SixMode: return std::make_unique<SixModeModel>();
        case ModelKind::Zone: return std::make_unique<ZoneModel>();
    }
    throw std::invalid_argument("Unknown analytical model kind");
}

}  // namespace dabtps::v1
