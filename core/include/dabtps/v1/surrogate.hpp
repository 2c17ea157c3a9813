#pragma once

// =============================================================================
// dabtps v1 - Surrogate Models Over a Lookup Table
// =============================================================================
// Consumers that need duties for an arbitrary power train a surrogate on the
// sweep output and query it. LookupInterpolator is the deterministic
// reference implementation: piecewise-linear in achieved power.
// =============================================================================

#include "dabtps/v1/sweep.hpp"

#include <optional>
#include <vector>

namespace dabtps::v1 {

struct SurrogatePrediction {
    DutyRatioPoint duties;
    Real irms = 0.0;
    OperatingMode mode = OperatingMode::Undefined;
};

class SurrogateModel {
public:
    virtual ~SurrogateModel() = default;

    /// Fits to the successful rows of a table. Returns false when nothing usable remains.
    virtual bool train(const LookupTable& table) = 0;

    /// Prediction at a power inside the trained range, nullopt outside it
    [[nodiscard]] virtual std::optional<SurrogatePrediction> predict(Real power) const = 0;
};

class LookupInterpolator final : public SurrogateModel {
public:
    LookupInterpolator() = default;

    /// Restricts training to rows at one secondary voltage
    explicit LookupInterpolator(Real v2) : v2_(v2) {}

    bool train(const LookupTable& table) override;

    [[nodiscard]] std::optional<SurrogatePrediction> predict(Real power) const override;

    [[nodiscard]] std::size_t size() const { return knots_.size(); }

private:
    struct Knot {
        Real power;
        SurrogatePrediction value;
    };

    std::optional<Real> v2_;
    std::vector<Knot> knots_;
};

}  // namespace dabtps::v1
