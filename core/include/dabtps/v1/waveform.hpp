#pragma once

// =============================================================================
// dabtps v1 - Inductor Current Waveform Reconstruction
// =============================================================================
// Piecewise-linear integration of the inductor current from the two bridge
// voltages. Independent of any mode table, so it serves as ground truth for
// the closed-form formulas and as the source of peak current and loss figures.
// =============================================================================

#include "dabtps/v1/analytical_model.hpp"

#include <vector>

namespace dabtps::v1 {

struct WaveformSample {
    Real time = 0.0;        // [s], from the primary rising edge
    Real current = 0.0;     // [A]
    Real v_primary = 0.0;   // Bridge voltage on the segment starting here [V]
    Real v_secondary = 0.0; // Reflected secondary bridge voltage [V]
};

struct WaveformMetrics {
    std::vector<WaveformSample> breakpoints;    // One full period, last point closes it
    Real power = 0.0;           // Average primary power [W]
    Real irms = 0.0;            // [A]
    Real peak_current = 0.0;    // max |iL| [A]
    Real conduction_loss = 0.0; // Irms^2 * r_series [W]
    Real efficiency = 1.0;      // P / (P + loss), 1 when there is no loss
};

/// Integrates the inductor current for duties given as (outer shift, primary
/// inner shift, secondary inner shift), each normalized to half a period.
[[nodiscard]] WaveformMetrics simulate_inductor_current(const DutyRatioPoint& waveform_duties,
                                                        const ConverterParameters& params);

/// Same, converting the duties of an analytical model first
[[nodiscard]] inline WaveformMetrics simulate_inductor_current(const AnalyticalModel& model,
                                                               const DutyRatioPoint& x,
                                                               const ConverterParameters& params) {
    return simulate_inductor_current(model.to_waveform_duties(x), params);
}

}  // namespace dabtps::v1
