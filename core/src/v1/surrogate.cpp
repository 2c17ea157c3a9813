#include "dabtps/v1/surrogate.hpp"

#include <algorithm>

namespace dabtps::v1 {

bool LookupInterpolator::train(const LookupTable& table) {
    knots_.clear();
    for (const auto& row : table.rows()) {
        if (!row.result.success()) continue;
        if (v2_ && row.v2 != *v2_) continue;
        knots_.push_back({row.result.achieved_power, {row.result.duties, row.result.irms, row.result.mode}});
    }
    std::sort(knots_.begin(), knots_.end(), [](const Knot& a, const Knot& b) { return a.power < b.power; });
    return !knots_.empty();
}

std::optional<SurrogatePrediction> LookupInterpolator::predict(Real power) const {
    if (knots_.empty() || power < knots_.front().power || power > knots_.back().power) {
        return std::nullopt;
    }
    const auto upper = std::lower_bound(knots_.begin(), knots_.end(), power,
                                        [](const Knot& k, Real value) { return k.power < value; });
    if (upper == knots_.begin() || upper->power == power) {
        return upper->value;
    }
    const Knot& a = *(upper - 1);
    const Knot& b = *upper;
    const Real span = b.power - a.power;
    const Real t = span > 0.0 ? (power - a.power) / span : 0.0;
    auto lerp = [t](Real x, Real y) { return x + t * (y - x); };

    SurrogatePrediction out;
    out.duties = DutyRatioPoint(lerp(a.value.duties.d0, b.value.duties.d0), lerp(a.value.duties.d1, b.value.duties.d1),
                                lerp(a.value.duties.d2, b.value.duties.d2));
    out.irms = lerp(a.value.irms, b.value.irms);
    out.mode = t < 0.5 ? a.value.mode : b.value.mode;
    return out;
}

}  // namespace dabtps::v1
