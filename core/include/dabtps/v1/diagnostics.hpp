#pragma once

// =============================================================================
// dabtps v1 - Evaluation Diagnostics
// =============================================================================
// Counters for negative RMS-squared evaluations. One accumulator is owned by
// each pool build or worker and merged at the end of a sweep; nothing here is
// shared between threads.
// =============================================================================

#include "dabtps/v1/numeric_types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

namespace dabtps::v1 {

struct EvaluationDiagnostics {
    std::uint64_t evaluations = 0;
    std::uint64_t negative_count = 0;       // Irms^2 < 0, clamped to zero
    std::uint64_t significant_count = 0;    // Irms^2 below -epsilon, point rejected
    Real most_negative = 0.0;               // In the model's scaled units

    void merge(const EvaluationDiagnostics& other) {
        evaluations += other.evaluations;
        negative_count += other.negative_count;
        significant_count += other.significant_count;
        most_negative = std::min(most_negative, other.most_negative);
    }

    [[nodiscard]] Real negative_rate() const {
        return evaluations == 0 ? 0.0
                                : static_cast<Real>(negative_count) / static_cast<Real>(evaluations);
    }
};

/// Relative epsilon separating round-off from a modeling error
inline constexpr Real kDegeneracyEpsilon = 1e-9;

/// Records one Irms^2 evaluation and returns sqrt(max(0, value)).
/// Returns nullopt when the value is negative beyond epsilon*scale or non-finite.
[[nodiscard]] std::optional<Real> clamped_rms(Real value, Real scale, EvaluationDiagnostics& diag,
                                              Real epsilon = kDegeneracyEpsilon);

}  // namespace dabtps::v1
