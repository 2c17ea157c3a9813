#include "dabtps/v1/diagnostics.hpp"

#include <cmath>

namespace dabtps::v1 {

std::optional<Real> clamped_rms(Real value, Real scale, EvaluationDiagnostics& diag, Real epsilon) {
    ++diag.evaluations;
    if (!std::isfinite(value)) {
        ++diag.significant_count;
        return std::nullopt;
    }
    if (value >= 0.0) {
        return std::sqrt(value);
    }

    ++diag.negative_count;
    const Real scaled = scale > 0.0 ? value / scale : value;
    diag.most_negative = std::min(diag.most_negative, scaled);
    if (scaled < -epsilon) {
        ++diag.significant_count;
        return std::nullopt;
    }
    return 0.0;
}

}  // namespace dabtps::v1
