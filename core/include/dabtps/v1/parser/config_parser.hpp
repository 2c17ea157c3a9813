#pragma once

#include "dabtps/v1/sweep.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dabtps::v1::parser {

struct ConfigParserOptions {
    bool strict = true;             // Fail on unknown fields
    bool validate = true;           // Run validate_config() after a clean parse
};

/// Reads a dabtps-v1 YAML sweep configuration. Problems are collected as
/// coded messages ("[CODE] text") instead of thrown.
class ConfigParser {
public:
    explicit ConfigParser(ConfigParserOptions options = {});

    // Parse from file
    SweepConfig load(const std::filesystem::path& path);

    // Parse from string
    SweepConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ConfigParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, SweepConfig& config);
};

/// Parses a number with an optional SI suffix ("20u", "50k", "3.5meg")
[[nodiscard]] Real parse_real_string(const std::string& raw);

}  // namespace dabtps::v1::parser
