#include "dabtps/v1/converter.hpp"

#include <cmath>

namespace dabtps::v1 {

namespace {

constexpr const char* kDiagInvalidParameter = "DABTPS_CFG_E_PARAM_INVALID";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void require_positive(std::vector<std::string>& errors, const char* name, Real value) {
    if (!std::isfinite(value) || value <= 0.0) {
        errors.push_back(with_diag_code(kDiagInvalidParameter,
                                        std::string("converter.") + name + " must be positive and finite (got " +
                                            std::to_string(value) + ")"));
    }
}

}  // namespace

std::vector<std::string> ConverterParameters::validate() const {
    std::vector<std::string> errors;
    require_positive(errors, "v1", v1);
    require_positive(errors, "v2", v2);
    require_positive(errors, "fs", fs);
    require_positive(errors, "inductance", inductance);
    require_positive(errors, "turns_ratio", turns_ratio);
    if (!std::isfinite(r_series) || r_series < 0.0) {
        errors.push_back(with_diag_code(kDiagInvalidParameter,
                                        "converter.r_series must be non-negative (got " +
                                            std::to_string(r_series) + ")"));
    }
    return errors;
}

Real optimal_scaled_power(Real m) {
    return -1.9 * m * m * m * m + 12.6 * m * m * m - 30.9 * m * m + 34.3 * m - 14.07;
}

ZoneDesign design_turns_ratio_and_inductance(const ZoneDesignInputs& inputs) {
    ZoneDesign design;
    design.turns_ratio = inputs.m_star * inputs.v1 / inputs.v2_min;
    design.p_star = optimal_scaled_power(inputs.m_star);
    design.inductance = design.p_star * inputs.v1 * inputs.v1 / (2.0 * kPi * inputs.fs * inputs.p_max);
    return design;
}

}  // namespace dabtps::v1
