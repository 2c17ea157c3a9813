#include "dabtps/v1/parser/config_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace dabtps::v1::parser {

namespace {

constexpr const char* kSchemaId = "dabtps-v1";
constexpr const char* kDiagSchema = "DABTPS_CFG_E_SCHEMA";
constexpr const char* kDiagMissingField = "DABTPS_CFG_E_MISSING_FIELD";
constexpr const char* kDiagUnknownField = "DABTPS_CFG_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "DABTPS_CFG_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidEnum = "DABTPS_CFG_E_ENUM_INVALID";
constexpr const char* kDiagFieldOverridden = "DABTPS_CFG_W_FIELD_OVERRIDDEN";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(errors, kDiagTypeMismatch,
               "Type mismatch at '" + path + "' (expected " + expected + ", got " + yaml_node_class(received) + ")");
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!strict || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            push_error(errors, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
        }
    }
}

std::optional<Real> parse_real(const YAML::Node& node, const std::string& path, std::vector<std::string>& errors) {
    if (!node || !node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    try {
        return parse_real_string(node.as<std::string>());
    } catch (const std::exception&) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
}

std::optional<int> parse_int_scalar(const YAML::Node& node, const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node || !node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node, const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node || !node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    return node.as<std::string>();
}

std::optional<std::vector<Real>> parse_real_sequence(const YAML::Node& node, const std::string& path,
                                                     std::vector<std::string>& errors) {
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence", node);
        return std::nullopt;
    }
    std::vector<Real> values;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto value = parse_real(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

void read_real(const YAML::Node& parent, const char* key, const std::string& context, Real& target,
               std::vector<std::string>& errors) {
    if (const YAML::Node node = parent[key]) {
        if (const auto value = parse_real(node, context + "." + key, errors)) {
            target = *value;
        }
    }
}

void read_int(const YAML::Node& parent, const char* key, const std::string& context, int& target,
              std::vector<std::string>& errors) {
    if (const YAML::Node node = parent[key]) {
        if (const auto value = parse_int_scalar(node, context + "." + key, errors)) {
            target = *value;
        }
    }
}

}  // namespace

Real parse_real_string(const std::string& raw) {
    if (raw.empty()) {
        throw std::invalid_argument("empty numeric value");
    }

    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) {
        throw std::invalid_argument("invalid numeric value");
    }

    std::string suffix = raw.substr(static_cast<std::size_t>(end - raw.c_str()));
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.front()))) {
        suffix.erase(suffix.begin());
    }
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.back()))) {
        suffix.pop_back();
    }
    if (suffix.empty()) return base;

    const std::string lower = to_lower(suffix);
    auto starts_with = [&](const std::string& prefix) {
        return lower.rfind(prefix, 0) == 0;
    };

    // Unit letters after the prefix are ignored: "20uH", "50kHz", "3.5kW"
    double multiplier = 1.0;
    if (starts_with("meg") || suffix.front() == 'M') {
        multiplier = 1e6;
    } else if (starts_with("g")) {
        multiplier = 1e9;
    } else if (starts_with("k")) {
        multiplier = 1e3;
    } else if (starts_with("m")) {
        multiplier = 1e-3;
    } else if (starts_with("u")) {
        multiplier = 1e-6;
    } else if (starts_with("n")) {
        multiplier = 1e-9;
    } else if (starts_with("p")) {
        multiplier = 1e-12;
    } else if (!(starts_with("v") || starts_with("w") || starts_with("a") || starts_with("h") ||
                 starts_with("s") || starts_with("ohm"))) {
        throw std::invalid_argument("unknown unit suffix '" + suffix + "'");
    }

    return base * multiplier;
}

ConfigParser::ConfigParser(ConfigParserOptions options)
    : options_(options) {}

SweepConfig ConfigParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return SweepConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

SweepConfig ConfigParser::load_string(const std::string& content) {
    SweepConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);

    if (options_.validate && errors_.empty()) {
        ValidationReport report = validate_config(config);
        errors_.insert(errors_.end(), report.errors.begin(), report.errors.end());
        warnings_.insert(warnings_.end(), report.warnings.begin(), report.warnings.end());
    }
    return config;
}

void ConfigParser::parse_yaml(const std::string& content, SweepConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }
    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "converter", "design", "sweep", "optimizer", "grid", "diagnostics"},
                  "root", errors_, options_.strict);

    if (!root["schema"]) {
        push_error(errors_, kDiagMissingField, "Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        push_error(errors_, kDiagMissingField, "Missing required field 'version'");
        return;
    }
    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        push_error(errors_, kDiagSchema, "Unsupported schema: " + *schema);
        return;
    }
    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        push_error(errors_, kDiagSchema, "Unsupported schema version: " + std::to_string(*version));
        return;
    }

    // Converter
    const YAML::Node conv = root["converter"];
    if (!conv) {
        push_error(errors_, kDiagMissingField, "Missing required section 'converter'");
        return;
    }
    if (!conv.IsMap()) {
        push_type_mismatch_error(errors_, "converter", "map", conv);
        return;
    }
    validate_keys(conv, {"v1", "v2", "fs", "half_period", "inductance", "turns_ratio", "r_series"}, "converter",
                  errors_, options_.strict);
    for (const char* required : {"v1", "v2"}) {
        if (!conv[required]) {
            push_error(errors_, kDiagMissingField, std::string("Missing required field 'converter.") + required + "'");
        }
    }
    if (!conv["fs"] && !conv["half_period"]) {
        push_error(errors_, kDiagMissingField, "Missing 'converter.fs' or 'converter.half_period'");
    }
    if (!conv["inductance"] && !root["design"]) {
        push_error(errors_, kDiagMissingField, "Missing 'converter.inductance' (or a 'design' section)");
    }
    read_real(conv, "v1", "converter", config.converter.v1, errors_);
    read_real(conv, "v2", "converter", config.converter.v2, errors_);
    read_real(conv, "fs", "converter", config.converter.fs, errors_);
    if (conv["half_period"]) {
        if (conv["fs"]) {
            push_warning(warnings_, kDiagFieldOverridden, "converter.half_period overrides converter.fs");
        }
        Real half_period = 0.0;
        read_real(conv, "half_period", "converter", half_period, errors_);
        config.converter.fs = half_period > 0.0 ? 1.0 / (2.0 * half_period) : 0.0;
    }
    read_real(conv, "inductance", "converter", config.converter.inductance, errors_);
    read_real(conv, "turns_ratio", "converter", config.converter.turns_ratio, errors_);
    read_real(conv, "r_series", "converter", config.converter.r_series, errors_);

    // Design
    if (const YAML::Node design = root["design"]) {
        if (!design.IsMap()) {
            push_type_mismatch_error(errors_, "design", "map", design);
        } else {
            validate_keys(design, {"m_star", "v2_min", "p_max"}, "design", errors_, options_.strict);
            ZoneDesignInputs inputs;
            inputs.v2_min = config.converter.v2;
            read_real(design, "m_star", "design", inputs.m_star, errors_);
            read_real(design, "v2_min", "design", inputs.v2_min, errors_);
            if (!design["p_max"]) {
                push_error(errors_, kDiagMissingField, "Missing required field 'design.p_max'");
            }
            read_real(design, "p_max", "design", inputs.p_max, errors_);
            config.design = inputs;
            if (conv["inductance"] || conv["turns_ratio"]) {
                push_warning(warnings_, kDiagFieldOverridden,
                             "design section overrides converter.inductance and converter.turns_ratio");
            }
        }
    }

    // Sweep
    const YAML::Node sweep = root["sweep"];
    if (!sweep) {
        push_error(errors_, kDiagMissingField, "Missing required section 'sweep'");
        return;
    }
    if (!sweep.IsMap()) {
        push_type_mismatch_error(errors_, "sweep", "map", sweep);
        return;
    }
    validate_keys(sweep, {"start", "stop", "step", "strategy", "model", "threads", "v2_values"}, "sweep", errors_,
                  options_.strict);
    for (const char* required : {"start", "stop", "step"}) {
        if (!sweep[required]) {
            push_error(errors_, kDiagMissingField, std::string("Missing required field 'sweep.") + required + "'");
        }
    }
    read_real(sweep, "start", "sweep", config.range.start, errors_);
    read_real(sweep, "stop", "sweep", config.range.stop, errors_);
    read_real(sweep, "step", "sweep", config.range.step, errors_);
    read_int(sweep, "threads", "sweep", config.threads, errors_);
    if (sweep["strategy"]) {
        if (const auto s = parse_string_scalar(sweep["strategy"], "sweep.strategy", errors_)) {
            const std::string v = to_lower(*s);
            if (v == "nlp" || v == "sqp") {
                config.strategy = Strategy::Nlp;
            } else if (v == "grid") {
                config.strategy = Strategy::Grid;
            } else {
                push_error(errors_, kDiagInvalidEnum, "Unknown sweep.strategy '" + *s + "' (expected nlp or grid)");
            }
        }
    }
    if (sweep["model"]) {
        if (const auto s = parse_string_scalar(sweep["model"], "sweep.model", errors_)) {
            const std::string v = to_lower(*s);
            if (v == "six_mode") {
                config.model = ModelKind::SixMode;
            } else if (v == "zone") {
                config.model = ModelKind::Zone;
            } else {
                push_error(errors_, kDiagInvalidEnum, "Unknown sweep.model '" + *s + "' (expected six_mode or zone)");
            }
        }
    }
    if (sweep["v2_values"]) {
        if (auto values = parse_real_sequence(sweep["v2_values"], "sweep.v2_values", errors_)) {
            config.v2_values = std::move(*values);
        }
    }

    // Optimizer
    if (const YAML::Node opt = root["optimizer"]) {
        validate_keys(opt, {"max_iterations", "tolerance", "constraint_tolerance", "time_budget_ms", "lower_bound",
                            "upper_bound", "retries", "power_tolerance_w", "initial_guess", "mode"},
                      "optimizer", errors_, options_.strict);
        auto& o = config.optimizer;
        read_int(opt, "max_iterations", "optimizer", o.sqp.max_iterations, errors_);
        read_real(opt, "tolerance", "optimizer", o.sqp.step_tolerance, errors_);
        read_real(opt, "constraint_tolerance", "optimizer", o.sqp.constraint_tolerance, errors_);
        read_real(opt, "time_budget_ms", "optimizer", o.sqp.time_budget_ms, errors_);
        read_real(opt, "lower_bound", "optimizer", o.lower_bound, errors_);
        read_real(opt, "upper_bound", "optimizer", o.upper_bound, errors_);
        read_int(opt, "retries", "optimizer", o.retries, errors_);
        read_real(opt, "power_tolerance_w", "optimizer", o.power_tolerance_w, errors_);
        if (opt["initial_guess"]) {
            const auto guess = parse_real_sequence(opt["initial_guess"], "optimizer.initial_guess", errors_);
            if (guess && guess->size() == 3) {
                o.initial_guess = DutyRatioPoint((*guess)[0], (*guess)[1], (*guess)[2]);
            } else if (guess) {
                push_error(errors_, kDiagTypeMismatch, "optimizer.initial_guess must hold exactly 3 values");
            }
        }
        if (opt["mode"]) {
            if (const auto s = parse_string_scalar(opt["mode"], "optimizer.mode", errors_)) {
                const auto mode = parse_operating_mode(*s);
                if (!mode || *mode == OperatingMode::Undefined) {
                    push_error(errors_, kDiagInvalidEnum, "Unknown optimizer.mode '" + *s + "'");
                } else {
                    o.mode_scope = *mode;
                }
            }
        }
    }

    // Grid search
    if (const YAML::Node grid = root["grid"]) {
        validate_keys(grid, {"step", "fine_step", "tolerance_w", "fallback_max_error_w", "path_points",
                             "boundary_points", "max_power_w"},
                      "grid", errors_, options_.strict);
        read_real(grid, "step", "grid", config.pool.grid_step, errors_);
        read_real(grid, "fine_step", "grid", config.pool.fine_step, errors_);
        read_int(grid, "path_points", "grid", config.pool.path_points, errors_);
        read_int(grid, "boundary_points", "grid", config.pool.boundary_points, errors_);
        read_real(grid, "max_power_w", "grid", config.pool.max_power_w, errors_);
        read_real(grid, "tolerance_w", "grid", config.grid.tolerance_w, errors_);
        if (grid["fallback_max_error_w"]) {
            Real fallback = 0.0;
            read_real(grid, "fallback_max_error_w", "grid", fallback, errors_);
            config.grid.fallback_max_error_w = fallback;
        }
    }

    // Diagnostics thresholds
    if (const YAML::Node diag = root["diagnostics"]) {
        validate_keys(diag, {"degeneracy_warning_rate", "unity_ratio_margin"}, "diagnostics", errors_,
                      options_.strict);
        read_real(diag, "degeneracy_warning_rate", "diagnostics", config.diagnostics.degeneracy_warning_rate,
                  errors_);
        read_real(diag, "unity_ratio_margin", "diagnostics", config.diagnostics.unity_ratio_margin, errors_);
    }
}

}  // namespace dabtps::v1::parser
