#include "dabtps/v1/analytical_model.hpp"

#include <array>
#include <cmath>

namespace dabtps::v1 {

namespace {

constexpr std::array<OperatingMode, 6> kSixModes = {
    OperatingMode::Mode1, OperatingMode::Mode2, OperatingMode::Mode3,
    OperatingMode::Mode4, OperatingMode::Mode5, OperatingMode::Mode6};

/// Integral kernel of a triangular current segment: 1/4 - 3/2 x^2 + x^3
Real g(Real x) {
    return 0.25 - 1.5 * x * x + x * x * x;
}

HalfSpace hs(Real a0, Real a1, Real a2, Real b) {
    HalfSpace h;
    h.a = Vector3(a0, a1, a2);
    h.b = b;
    return h;
}

}  // namespace

std::span<const OperatingMode> SixModeModel::modes() const {
    return kSixModes;
}

Real SixModeModel::scaled_power(OperatingMode mode, const DutyRatioPoint& x, Real m) const {
    const Real D0 = x.d0;
    const Real D1 = x.d1;
    const Real D2 = x.d2;
    Real f = 0.0;
    switch (mode) {
        case OperatingMode::Mode1:
            f = D0 - D0 * D0 - 0.5 * D1 + D0 * D1 - 0.5 * D1 * D1 + 0.5 * D2 - D0 * D2 + 0.5 * D1 * D2 -
                0.5 * D2 * D2;
            break;
        case OperatingMode::Mode2:
            f = 0.5 - 0.5 * D0 * D0 - 0.5 * D1 + D0 * D1 - 0.5 * D1 * D1 - 0.5 * D2 + 0.5 * D1 * D2;
            break;
        case OperatingMode::Mode3:
            f = 1.0 - D0 + 0.5 * D1 - 1.5 * D2 + D0 * D2 - 0.5 * D1 * D2 + 0.5 * D2 * D2;
            break;
        case OperatingMode::Mode4:
            f = D0 - 0.5 * D1 - D0 * D1 + 0.5 * D1 * D1 + 0.5 * D2 - 0.5 * D1 * D2;
            break;
        case OperatingMode::Mode5:
            f = D0 - 0.5 * D0 * D0 - 0.5 * D1 + 0.5 * D2 - D0 * D2 + 0.5 * D1 * D2 - 0.5 * D2 * D2;
            break;
        case OperatingMode::Mode6:
            f = 0.5 * (1.0 - D1) * (1.0 - D2);
            break;
        default:
            return std::nan("");
    }
    return m * f;
}

Real SixModeModel::scaled_irms_squared(OperatingMode mode, const DutyRatioPoint& x, Real m) const {
    const Real D0 = x.d0;
    const Real D1 = x.d1;
    const Real D2 = x.d2;
    const Real s = D0 + D2;

    Real t1 = 0.0;
    Real t2 = 0.0;
    Real t3 = 0.0;
    switch (mode) {
        case OperatingMode::Mode1: t1 = g(s); t2 = g(D0 - D1); t3 = g(s - D1); break;
        case OperatingMode::Mode2: t1 = g(2.0 - s); t2 = g(D0 - D1); t3 = g(s - D1); break;
        case OperatingMode::Mode3: t1 = g(2.0 - s); t2 = g(D0 - D1); t3 = g(2.0 - s + D1); break;
        case OperatingMode::Mode4: t1 = g(s); t2 = g(D1 - D0); t3 = g(D1 - s); break;
        case OperatingMode::Mode5: t1 = g(s); t2 = g(D1 - D0); t3 = g(s - D1); break;
        case OperatingMode::Mode6: t1 = g(2.0 - s); t2 = g(D1 - D0); t3 = g(s - D1); break;
        default:
            return std::nan("");
    }

    constexpr Real c = 1.0 / 6.0;
    constexpr Real a = 1.0 / 24.0;
    const Real base = a + a * m * m + c * g(D1) - c * g(D0) * m + c * g(D2) * m * m;
    return base - c * m * (t1 + t2 + t3);
}

Region SixModeModel::region(OperatingMode mode, Real /*m*/) const {
    switch (mode) {
        case OperatingMode::Mode1:
            return {hs(-1, 1, 0, 0), hs(-1, 1, -1, 0), hs(1, 0, 1, -1)};
        case OperatingMode::Mode2:
            return {hs(-1, 1, 0, 0), hs(-1, 0, -1, 1), hs(1, -1, 1, -1)};
        case OperatingMode::Mode3:
            return {hs(-1, 1, 0, 0), hs(-1, 1, -1, 1), hs(1, 0, 1, -2)};
        case OperatingMode::Mode4:
            return {hs(1, -1, 0, 0), hs(-1, 0, -1, 0), hs(1, -1, 1, 0)};
        case OperatingMode::Mode5:
            return {hs(1, -1, 0, 0), hs(-1, 1, -1, 0), hs(1, 0, 1, -1)};
        case OperatingMode::Mode6:
            return {hs(1, -1, 0, 0), hs(-1, 0, -1, 1), hs(1, -1, 1, -1)};
        default:
            return {};
    }
}

Real SixModeModel::power_scale(const ConverterParameters& params) const {
    return params.power_base();
}

Real SixModeModel::current_scale(const ConverterParameters& params) const {
    return params.current_base();
}

std::optional<DutyRatioPoint> SixModeModel::sps_point(Real target_power, const ConverterParameters& params) const {
    // Mode 1 with d1 = d2 = 0 reduces to m*d0*(1 - d0)
    const Real m = params.voltage_ratio();
    const Real p = target_power / power_scale(params);
    const Real disc = 1.0 - 4.0 * p / m;
    if (!std::isfinite(disc) || disc < 0.0 || p < 0.0) {
        return std::nullopt;
    }
    return DutyRatioPoint(0.5 * (1.0 - std::sqrt(disc)), 0.0, 0.0);
}

DutyRatioPoint SixModeModel::seed(OperatingMode mode, const ConverterParameters& params) const {
    switch (mode) {
        case OperatingMode::Mode1: return {0.65, 0.32, 0.20};
        case OperatingMode::Mode2: return {0.70, 0.40, 0.50};
        case OperatingMode::Mode3: return {0.80, 0.20, 0.60};
        case OperatingMode::Mode4: return {0.20, 0.70, 0.30};
        case OperatingMode::Mode5: return {0.20, 0.50, 0.50};
        case OperatingMode::Mode6: return {0.30, 0.60, 0.90};
        default: return AnalyticalModel::seed(mode, params);
    }
}

}  // namespace dabtps::v1
