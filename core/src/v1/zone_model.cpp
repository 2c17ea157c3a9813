#include "dabtps/v1/analytical_model.hpp"

#include <array>
#include <cmath>

namespace dabtps::v1 {

namespace {

constexpr std::array<OperatingMode, 3> kZones = {
    OperatingMode::ZoneI, OperatingMode::ZoneII, OperatingMode::ZoneV};

/// |m - 1| below which the critical power formulas collapse to zero
constexpr Real kUnityRatioGuard = 1e-15;

HalfSpace hs(Real a0, Real a1, Real a2, Real b) {
    HalfSpace h;
    h.a = Vector3(a0, a1, a2);
    h.b = b;
    return h;
}

}  // namespace

std::span<const OperatingMode> ZoneModel::modes() const {
    return kZones;
}

Real ZoneModel::scaled_power(OperatingMode mode, const DutyRatioPoint& x, Real m) const {
    const Real delta = x.d0;
    const Real d1 = x.d1;
    const Real d2 = x.d2;
    switch (mode) {
        case OperatingMode::ZoneI:
            return 0.5 * m * kPi * delta * d2;
        case OperatingMode::ZoneII:
            return 0.5 * m * kPi * delta * d1;
        case OperatingMode::ZoneV:
            return 0.25 * m * kPi *
                   (1.0 - (1.0 - d1) * (1.0 - d1) - (1.0 - d2) * (1.0 - d2) - (1.0 - delta) * (1.0 - delta));
        default:
            return std::nan("");
    }
}

Real ZoneModel::scaled_irms_squared(OperatingMode mode, const DutyRatioPoint& x, Real m) const {
    const Real d0 = x.d0;
    const Real d1 = x.d1;
    const Real d2 = x.d2;
    const Real k = kPi * kPi / 12.0;
    switch (mode) {
        case OperatingMode::ZoneI:
            return k * (-2 * d1 * d1 * d1 + 3 * d1 * d1 * d2 * m + 3 * d1 * d1 - 6 * d1 * d2 * m -
                        2 * d2 * d2 * d2 * m * m + d2 * d2 * d2 * m + 3 * d2 * d2 * m * m + 3 * d2 * d0 * d0 * m);
        case OperatingMode::ZoneII:
            return k * (d1 * d1 * d1 * m - 2 * d1 * d1 * d1 + 3 * d1 * d1 + 3 * d1 * d2 * d2 * m -
                        6 * d1 * d2 * m + 3 * d1 * d0 * d0 * m - 2 * d2 * d2 * d2 * m * m + 3 * d2 * d2 * m * m);
        case OperatingMode::ZoneV:
            return k * (-2 * d1 * d1 * d1 - 3 * d1 * d1 * d0 * m + 3 * d1 * d1 * m + 3 * d1 * d1 +
                        6 * d1 * d0 * m - 6 * d1 * m - 2 * d2 * d2 * d2 * m * m - 3 * d2 * d2 * d0 * m +
                        3 * d2 * d2 * m * m + 3 * d2 * d2 * m + 6 * d2 * d0 * m - 6 * d2 * m -
                        d0 * d0 * d0 * m + 3 * d0 * d0 * m - 6 * d0 * m + 4 * m);
        default:
            return std::nan("");
    }
}

Region ZoneModel::region(OperatingMode mode, Real m) const {
    // Soft-switching inequalities rewritten as a.(delta, d1, d2) + b <= 0
    switch (mode) {
        case OperatingMode::ZoneI:
            return {hs(0, -1, m, 0),            // d1 >= m*d2
                    hs(-1, 0, 1 - m, 0),        // delta >= (1 - m)*d2
                    hs(1, 0, 1 - m, 0)};        // delta <= (m - 1)*d2
        case OperatingMode::ZoneII:
            return {hs(0, 1, -m, 0),            // d1 <= m*d2
                    hs(m, m - 1, 0, 0),         // m*delta <= (1 - m)*d1
                    hs(-m, m - 1, 0, 0)};       // m*delta >= (m - 1)*d1
        case OperatingMode::ZoneV:
            return {hs(-m, -(1 + m), 0, 2 * m),
                    hs(-1, 0, -(1 + m), 2),
                    hs(-1, 0, 1 - m, 0),
                    hs(-m, m - 1, 0, 0)};
        default:
            return {};
    }
}

Real ZoneModel::power_scale(const ConverterParameters& params) const {
    return params.v1 * params.v1 / (2.0 * kPi * params.fs * params.inductance);
}

Real ZoneModel::current_scale(const ConverterParameters& params) const {
    return params.v1 / (2.0 * kPi * params.fs * params.inductance);
}

std::optional<DutyRatioPoint> ZoneModel::sps_point(Real target_power, const ConverterParameters& params) const {
    const Real m = params.voltage_ratio();
    const Real p = target_power / power_scale(params);
    const Real arg = 1.0 - 4.0 * p / (m * kPi);
    if (!std::isfinite(arg) || arg < 0.0 || p < 0.0) {
        return std::nullopt;
    }
    return DutyRatioPoint(1.0 - std::sqrt(arg), 1.0, 1.0);
}

DutyRatioPoint ZoneModel::to_waveform_duties(const DutyRatioPoint& x) const {
    return DutyRatioPoint(0.5 * (x.d0 + x.d2 - x.d1), 1.0 - x.d1, 1.0 - x.d2);
}

Real ZoneModel::critical_power_low(Real m) {
    if (std::abs(m - 1.0) <= kUnityRatioGuard) {
        return 0.0;
    }
    if (m > 1.0) {
        return kPi * (m - 1.0) / (2.0 * m);
    }
    return kPi * m * m * (1.0 - m) / 2.0;
}

Real ZoneModel::critical_power_high(Real m) {
    if (std::abs(m - 1.0) <= kUnityRatioGuard) {
        return 0.0;
    }
    if (m > 1.0) {
        return m * kPi / 2.0 * (1.0 - m * m + m * std::sqrt(m * m - 1.0));
    }
    return (1.0 - m * m) * kPi / (2.0 * m) * (-1.0 + 1.0 / std::sqrt(1.0 - m * m));
}

}  // namespace dabtps::v1
