#pragma once

// =============================================================================
// dabtps v1 - Analytical Power / RMS-Current Models
// =============================================================================
// Each model is a closed set of operating modes. Every mode binds three things:
//   - a feasibility region, an intersection of half-spaces a.x + b <= 0
//   - a closed-form scaled power polynomial
//   - a closed-form scaled Irms^2 polynomial
// Formulas are evaluated in the model's own dimensionless units and converted
// to watts and amperes through power_scale() and current_scale().
// =============================================================================

#include "dabtps/v1/converter.hpp"
#include "dabtps/v1/operating_mode.hpp"

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace dabtps::v1 {

/// Linear inequality a.x + b <= 0 over (d0, d1, d2)
struct HalfSpace {
    Vector3 a = Vector3::Zero();
    Real b = 0.0;

    [[nodiscard]] Real slack(const DutyRatioPoint& x) const {
        return a[0] * x.d0 + a[1] * x.d1 + a[2] * x.d2 + b;
    }
};

using Region = std::vector<HalfSpace>;

/// Point of a region with the largest minimum slack inside [lo, hi]^3
struct InteriorPoint {
    DutyRatioPoint point;
    Real margin = 0.0;      // > 0 means strictly inside every half-space and bound
};

[[nodiscard]] InteriorPoint find_interior_point(const Region& region, Real lo, Real hi, Real step = 0.025);

class AnalyticalModel {
public:
    virtual ~AnalyticalModel() = default;

    [[nodiscard]] virtual ModelKind kind() const = 0;

    /// Modes in classification priority order
    [[nodiscard]] virtual std::span<const OperatingMode> modes() const = 0;

    /// Dimensionless power for voltage ratio m
    [[nodiscard]] virtual Real scaled_power(OperatingMode mode, const DutyRatioPoint& x, Real m) const = 0;

    /// Dimensionless Irms^2 for voltage ratio m (may be slightly negative from cancellation)
    [[nodiscard]] virtual Real scaled_irms_squared(OperatingMode mode, const DutyRatioPoint& x, Real m) const = 0;

    /// Feasibility region of a mode for voltage ratio m
    [[nodiscard]] virtual Region region(OperatingMode mode, Real m) const = 0;

    /// Watts per unit of scaled power
    [[nodiscard]] virtual Real power_scale(const ConverterParameters& params) const = 0;

    /// Amperes per unit of scaled RMS current
    [[nodiscard]] virtual Real current_scale(const ConverterParameters& params) const = 0;

    /// Single-phase-shift point delivering target_power, if reachable
    [[nodiscard]] virtual std::optional<DutyRatioPoint> sps_point(Real target_power,
                                                                  const ConverterParameters& params) const = 0;

    /// Maps model duties to (outer shift, primary inner shift, secondary inner shift)
    /// as used by the waveform reconstruction
    [[nodiscard]] virtual DutyRatioPoint to_waveform_duties(const DutyRatioPoint& x) const = 0;

    /// Starting point for the nonlinear search in a mode
    [[nodiscard]] virtual DutyRatioPoint seed(OperatingMode mode, const ConverterParameters& params) const;

    // =========================================================================
    // SI evaluation
    // =========================================================================

    [[nodiscard]] Real power(OperatingMode mode, const DutyRatioPoint& x, const ConverterParameters& params) const {
        return power_scale(params) * scaled_power(mode, x, params.voltage_ratio());
    }

    [[nodiscard]] Real irms_squared(OperatingMode mode, const DutyRatioPoint& x,
                                    const ConverterParameters& params) const {
        const Real scale = current_scale(params);
        return scale * scale * scaled_irms_squared(mode, x, params.voltage_ratio());
    }

    // =========================================================================
    // Classification and feasibility
    // =========================================================================

    [[nodiscard]] bool has_mode(OperatingMode mode) const;

    /// First mode in priority order whose non-strict inequalities hold.
    /// Returns Undefined for non-finite input or a point outside every region.
    [[nodiscard]] OperatingMode classify(const DutyRatioPoint& x, const ConverterParameters& params,
                                         Real tolerance = kFeasibilityTolerance) const;

    [[nodiscard]] bool is_feasible(OperatingMode mode, const DutyRatioPoint& x, const ConverterParameters& params,
                                   Real tolerance = kFeasibilityTolerance) const;

    /// Signed slack values of the mode's region, negative means satisfied
    [[nodiscard]] std::vector<Real> physical_constraints(OperatingMode mode, const DutyRatioPoint& x,
                                                         const ConverterParameters& params) const;
};

// =============================================================================
// Six-mode TPS model
// =============================================================================
// Duties are normalized to half a switching period: d0 outer shift between the
// bridges, d1 and d2 zero-voltage widths of the primary and secondary bridge.
// Regions cover the whole unit cube. Power is in units of V1^2*T/L and current
// in units of V1*T/L.

class SixModeModel final : public AnalyticalModel {
public:
    [[nodiscard]] ModelKind kind() const override { return ModelKind::SixMode; }
    [[nodiscard]] std::span<const OperatingMode> modes() const override;
    [[nodiscard]] Real scaled_power(OperatingMode mode, const DutyRatioPoint& x, Real m) const override;
    [[nodiscard]] Real scaled_irms_squared(OperatingMode mode, const DutyRatioPoint& x, Real m) const override;
    [[nodiscard]] Region region(OperatingMode mode, Real m) const override;
    [[nodiscard]] Real power_scale(const ConverterParameters& params) const override;
    [[nodiscard]] Real current_scale(const ConverterParameters& params) const override;
    [[nodiscard]] std::optional<DutyRatioPoint> sps_point(Real target_power,
                                                          const ConverterParameters& params) const override;
    [[nodiscard]] DutyRatioPoint to_waveform_duties(const DutyRatioPoint& x) const override { return x; }
    [[nodiscard]] DutyRatioPoint seed(OperatingMode mode, const ConverterParameters& params) const override;
};

// =============================================================================
// ZVS zone model
// =============================================================================
// Duties are (delta, d1, d2): phase shift and bridge pulse widths, each in
// [0, 1]. Zones carry the soft-switching inequalities of the design, so most
// of the cube is infeasible. Power is in units of V1^2/(2 pi fs L) and current
// in units of V1/(2 pi fs L).

class ZoneModel final : public AnalyticalModel {
public:
    [[nodiscard]] ModelKind kind() const override { return ModelKind::Zone; }
    [[nodiscard]] std::span<const OperatingMode> modes() const override;
    [[nodiscard]] Real scaled_power(OperatingMode mode, const DutyRatioPoint& x, Real m) const override;
    [[nodiscard]] Real scaled_irms_squared(OperatingMode mode, const DutyRatioPoint& x, Real m) const override;
    [[nodiscard]] Region region(OperatingMode mode, Real m) const override;
    [[nodiscard]] Real power_scale(const ConverterParameters& params) const override;
    [[nodiscard]] Real current_scale(const ConverterParameters& params) const override;
    [[nodiscard]] std::optional<DutyRatioPoint> sps_point(Real target_power,
                                                          const ConverterParameters& params) const override;
    [[nodiscard]] DutyRatioPoint to_waveform_duties(const DutyRatioPoint& x) const override;

    /// Scaled power below which the optimum lies on the Zone I/II boundary
    [[nodiscard]] static Real critical_power_low(Real m);

    /// Scaled power above which the optimum is plain phase shift (d1 = d2 = 1)
    [[nodiscard]] static Real critical_power_high(Real m);

    /// Largest scaled power the model can deliver
    [[nodiscard]] static Real max_scaled_power(Real m) { return m * kPi / 4.0; }
};

[[nodiscard]] std::unique_ptr<AnalyticalModel> make_model(ModelKind kind);

}  // namespace dabtps::v1
