#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dabtps::v1 {

/// Operating-mode tag. Mode1..Mode6 belong to the six-mode TPS model,
/// ZoneI/ZoneII/ZoneV to the ZVS zone model. Undefined marks an infeasible point.
enum class OperatingMode : std::uint8_t {
    Undefined,
    Mode1,
    Mode2,
    Mode3,
    Mode4,
    Mode5,
    Mode6,
    ZoneI,
    ZoneII,
    ZoneV
};

[[nodiscard]] constexpr const char* to_string(OperatingMode mode) noexcept {
    switch (mode) {
        case OperatingMode::Undefined: return "UNDEFINED";
        case OperatingMode::Mode1: return "MODE_1";
        case OperatingMode::Mode2: return "MODE_2";
        case OperatingMode::Mode3: return "MODE_3";
        case OperatingMode::Mode4: return "MODE_4";
        case OperatingMode::Mode5: return "MODE_5";
        case OperatingMode::Mode6: return "MODE_6";
        case OperatingMode::ZoneI: return "ZONE_I";
        case OperatingMode::ZoneII: return "ZONE_II";
        case OperatingMode::ZoneV: return "ZONE_V";
        default: return "UNKNOWN";
    }
}

inline constexpr std::array<OperatingMode, 10> kAllModeTags = {
    OperatingMode::Undefined, OperatingMode::Mode1, OperatingMode::Mode2, OperatingMode::Mode3,
    OperatingMode::Mode4, OperatingMode::Mode5, OperatingMode::Mode6, OperatingMode::ZoneI,
    OperatingMode::ZoneII, OperatingMode::ZoneV};

[[nodiscard]] inline std::optional<OperatingMode> parse_operating_mode(std::string_view text) {
    for (const auto mode : kAllModeTags) {
        if (text == to_string(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

/// Selects the analytical equation set
enum class ModelKind : std::uint8_t {
    SixMode,    // Piecewise TPS model, six regions covering the duty cube
    Zone        // ZVS zone model (zones I, II and V)
};

[[nodiscard]] constexpr const char* to_string(ModelKind kind) noexcept {
    switch (kind) {
        case ModelKind::SixMode: return "six_mode";
        case ModelKind::Zone: return "zone";
        default: return "unknown";
    }
}

}  // namespace dabtps::v1
