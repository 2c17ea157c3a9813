#pragma once

// =============================================================================
// dabtps v1 - Converter Parameters and Duty-Ratio Points
// =============================================================================

#include "dabtps/v1/numeric_types.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace dabtps::v1 {

/// Fixed electrical parameters of one dual-active-bridge converter.
/// Immutable for the duration of a sweep; copied into every worker.
struct ConverterParameters {
    Real v1 = 0.0;              // Primary DC voltage [V]
    Real v2 = 0.0;              // Secondary DC voltage [V]
    Real fs = 0.0;              // Switching frequency [Hz]
    Real inductance = 0.0;      // Series inductance [H]
    Real turns_ratio = 1.0;     // n, secondary reflected by n*v2
    Real r_series = 0.0;        // Lumped conduction resistance [ohm]

    /// Build from half switching period instead of frequency
    [[nodiscard]] static ConverterParameters from_half_period(Real v1, Real v2, Real half_period,
                                                              Real inductance, Real turns_ratio = 1.0) {
        ConverterParameters p;
        p.v1 = v1;
        p.v2 = v2;
        p.fs = half_period > 0.0 ? 1.0 / (2.0 * half_period) : 0.0;
        p.inductance = inductance;
        p.turns_ratio = turns_ratio;
        return p;
    }

    [[nodiscard]] Real half_period() const { return fs > 0.0 ? 1.0 / (2.0 * fs) : 0.0; }

    /// m = n*V2/V1
    [[nodiscard]] Real voltage_ratio() const { return turns_ratio * v2 / v1; }

    /// Reflected secondary voltage n*V2
    [[nodiscard]] Real reflected_v2() const { return turns_ratio * v2; }

    /// V1^2*T/L, the unit in which normalized power formulas are expressed
    [[nodiscard]] Real power_base() const { return v1 * v1 * half_period() / inductance; }

    /// V1*T/L, the unit in which normalized currents are expressed
    [[nodiscard]] Real current_base() const { return v1 * half_period() / inductance; }

    /// Returns coded errors for every invalid field. Empty means valid.
    [[nodiscard]] std::vector<std::string> validate() const;
};

/// Three normalized duty ratios. Interpretation depends on the analytical model:
/// six-mode model uses (outer shift, primary inner shift, secondary inner shift),
/// the zone model uses (phase delta, primary pulse width, secondary pulse width).
struct DutyRatioPoint {
    Real d0 = 0.0;
    Real d1 = 0.0;
    Real d2 = 0.0;

    DutyRatioPoint() = default;
    DutyRatioPoint(Real a, Real b, Real c) : d0(a), d1(b), d2(c) {}
    explicit DutyRatioPoint(const Vector3& v) : d0(v[0]), d1(v[1]), d2(v[2]) {}

    [[nodiscard]] Vector3 as_vector() const { return Vector3(d0, d1, d2); }

    [[nodiscard]] Real operator[](int i) const { return i == 0 ? d0 : (i == 1 ? d1 : d2); }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(d0) && std::isfinite(d1) && std::isfinite(d2);
    }

    [[nodiscard]] bool within(Real lo, Real hi) const {
        return d0 >= lo && d0 <= hi && d1 >= lo && d1 <= hi && d2 >= lo && d2 <= hi;
    }

    bool operator==(const DutyRatioPoint& other) const = default;
};

// =============================================================================
// Zone-model design (turns ratio and inductance from a target voltage gain)
// =============================================================================

/// Design inputs for sizing n and L around an optimal voltage gain m*
struct ZoneDesignInputs {
    Real v1 = 0.0;
    Real v2_min = 0.0;
    Real fs = 0.0;
    Real p_max = 0.0;
    Real m_star = 1.3;
};

struct ZoneDesign {
    Real turns_ratio = 1.0;
    Real inductance = 0.0;
    Real p_star = 0.0;      // Scaled power at which m* is optimal
};

/// Polynomial fit of the optimal scaled power p*(m)
[[nodiscard]] Real optimal_scaled_power(Real m);

/// n = m*V1/V2min, L = p*(m*)V1^2/(2 pi fs Pmax)
[[nodiscard]] ZoneDesign design_turns_ratio_and_inductance(const ZoneDesignInputs& inputs);

}  // namespace dabtps::v1
