#pragma once

// =============================================================================
// dabtps v1 - Numeric Types
// =============================================================================

#include <Eigen/Core>

#include <cstdint>
#include <limits>

namespace dabtps::v1 {

using Real = double;
using Index = std::int32_t;

/// Dense vectors and matrices used by the SQP solver
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using Vector3 = Eigen::Vector3d;

inline constexpr Real kPi = 3.14159265358979323846;

/// Default tolerance for non-strict region membership tests
inline constexpr Real kFeasibilityTolerance = 1e-9;

inline constexpr Real kInfinity = std::numeric_limits<Real>::infinity();

}  // namespace dabtps::v1
