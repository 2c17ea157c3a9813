#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "dabtps/v1/candidate_pool.hpp"
#include "dabtps/v1/optimizer.hpp"
#include "dabtps/v1/parser/config_parser.hpp"
#include "dabtps/v1/sweep.hpp"
#include "dabtps/v1/waveform.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>

using namespace dabtps::v1;
using json = nlohmann::json;

namespace {

void write_csv(const LookupTable& table, std::ostream& out) {
    const auto& columns = LookupTable::column_names();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) out << ",";
        out << columns[c];
    }
    out << "\n";

    for (std::size_t i = 0; i < table.size(); ++i) {
        const auto cells = table.cells(i);
        for (std::size_t c = 0; c < cells.size(); ++c) {
            if (c > 0) out << ",";
            out << cells[c];
        }
        out << "\n";
    }
}

void write_csv(const LookupTable& table, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    write_csv(table, file);
}

json result_to_json(const OptimizationResult& r) {
    return json{
        {"target_power_w", r.target_power},
        {"achieved_power_w", r.achieved_power},
        {"power_error_w", r.power_error},
        {"d0", r.duties.d0},
        {"d1", r.duties.d1},
        {"d2", r.duties.d2},
        {"irms_a", r.irms},
        {"mode", to_string(r.mode)},
        {"status", to_string(r.status)},
        {"message", r.message},
        {"iterations", r.iterations},
        {"attempts", r.attempts},
    };
}

json summary_to_json(const SweepConfig& config, const SweepSummary& summary) {
    json modes = json::object();
    for (const auto& [tag, count] : summary.mode_counts) {
        modes[tag] = count;
    }
    return json{
        {"strategy", to_string(config.strategy)},
        {"model", to_string(config.model)},
        {"rows", summary.rows},
        {"succeeded", summary.succeeded},
        {"fallbacks", summary.fallbacks},
        {"no_solution", summary.no_solution},
        {"solver_failed", summary.solver_failed},
        {"convergence_rate", summary.convergence_rate},
        {"mean_abs_error_w", summary.mean_abs_error_w},
        {"max_abs_error_w", summary.max_abs_error_w},
        {"pool_size", summary.pool_size},
        {"elapsed_ms", summary.elapsed_ms},
        {"mode_counts", modes},
        {"diagnostics",
         {{"evaluations", summary.diagnostics.evaluations},
          {"negative_count", summary.diagnostics.negative_count},
          {"significant_count", summary.diagnostics.significant_count},
          {"most_negative", summary.diagnostics.most_negative},
          {"negative_rate", summary.diagnostics.negative_rate()}}},
        {"warnings", summary.warnings},
    };
}

void print_diagnostics(const parser::ConfigParser& parser, bool quiet) {
    for (const auto& err : parser.errors()) {
        std::cerr << "Error: " << err << std::endl;
    }
    if (!quiet) {
        for (const auto& warn : parser.warnings()) {
            std::cerr << "Warning: " << warn << std::endl;
        }
    }
}

std::optional<SweepConfig> load_config(const std::string& config_file, bool quiet) {
    if (!quiet) {
        std::cerr << "Reading configuration: " << config_file << std::endl;
    }
    parser::ConfigParser parser;
    SweepConfig config = parser.load(config_file);
    print_diagnostics(parser, quiet);
    if (!parser.errors().empty()) {
        return std::nullopt;
    }
    return config;
}

int cmd_sweep(const std::string& config_file, const std::string& output_file, const std::string& summary_file,
              const std::string& cli_strategy, int cli_threads, bool verbose, bool quiet) {
    try {
        auto loaded = load_config(config_file, quiet);
        if (!loaded) {
            return 1;
        }
        SweepConfig config = *loaded;

        // CLI overrides only when explicitly provided
        if (cli_strategy == "nlp") config.strategy = Strategy::Nlp;
        if (cli_strategy == "grid") config.strategy = Strategy::Grid;
        if (cli_threads > 0) config.threads = cli_threads;

        const ConverterParameters params = resolved_converter(config);
        if (!quiet) {
            std::cerr << "Running power sweep..." << std::endl;
            std::cerr << "  model: " << to_string(config.model) << std::endl;
            std::cerr << "  strategy: " << to_string(config.strategy) << std::endl;
            std::cerr << "  range: " << config.range.start << " .. " << config.range.stop << " W, step "
                      << config.range.step << " W" << std::endl;
            std::cerr << "  m: " << params.voltage_ratio() << std::endl;
        }
        if (verbose) {
            std::cerr << "  n: " << params.turns_ratio << std::endl;
            std::cerr << "  L: " << params.inductance << " H" << std::endl;
            std::cerr << "  fs: " << params.fs << " Hz" << std::endl;
        }

        const SweepOutcome outcome = run_sweep(config);
        const SweepSummary& summary = outcome.summary;

        if (!quiet) {
            std::cerr << "Sweep completed:" << std::endl;
            std::cerr << "  Rows: " << summary.rows << " (" << summary.succeeded << " ok, " << summary.fallbacks
                      << " fallback, " << summary.no_solution << " no solution, " << summary.solver_failed
                      << " failed)" << std::endl;
            std::cerr << "  Max |error|: " << summary.max_abs_error_w << " W" << std::endl;
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(3) << summary.elapsed_ms / 1000.0 << "s"
                      << std::endl;
            for (const auto& warn : summary.warnings) {
                std::cerr << "Warning: " << warn << std::endl;
            }
        }
        if (verbose) {
            for (const auto& [tag, count] : summary.mode_counts) {
                std::cerr << "  " << tag << ": " << count << std::endl;
            }
        }

        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing table to: " << output_file << std::endl;
            }
            write_csv(outcome.table, output_file);
        } else {
            write_csv(outcome.table, std::cout);
        }

        if (!summary_file.empty()) {
            std::ofstream file(summary_file);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open summary file: " + summary_file);
            }
            file << summary_to_json(config, summary).dump(2) << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_point(const std::string& config_file, double power, const std::string& mode_tag, bool quiet) {
    try {
        auto loaded = load_config(config_file, quiet);
        if (!loaded) {
            return 1;
        }
        const SweepConfig& config = *loaded;
        const ConverterParameters params = resolved_converter(config);
        const auto model = make_model(config.model);

        OptimizerOptions options = config.optimizer;
        if (!mode_tag.empty()) {
            const auto mode = parse_operating_mode(mode_tag);
            if (!mode || !model->has_mode(*mode)) {
                std::cerr << "Error: unknown mode '" << mode_tag << "' for the " << to_string(config.model)
                          << " model" << std::endl;
                return 1;
            }
            options.mode_scope = *mode;
        }

        EvaluationDiagnostics diag;
        OptimizationResult result;
        if (config.strategy == Strategy::Nlp || options.mode_scope) {
            const NlpOptimizer optimizer(*model, params, options);
            result = optimizer.optimize(power, diag);
        } else {
            const CandidatePool pool = CandidatePool::build(*model, params, config.pool);
            result = GridOptimizer(pool, config.grid).optimize(power);
        }

        json out = result_to_json(result);
        if (result.success()) {
            const WaveformMetrics wave = simulate_inductor_current(*model, result.duties, params);
            out["peak_current_a"] = wave.peak_current;
            out["conduction_loss_w"] = wave.conduction_loss;
            out["efficiency"] = wave.efficiency;
        }
        const OptimizationResult sps = sps_baseline(*model, power, params);
        out["sps_baseline"] = result_to_json(sps);

        std::cout << out.dump(2) << std::endl;
        return result.success() ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& config_file, bool verbose) {
    try {
        parser::ConfigParser parser;
        const SweepConfig config = parser.load(config_file);
        print_diagnostics(parser, false);
        if (!parser.errors().empty()) {
            std::cerr << "Validation failed: " << parser.errors().size() << " error(s)" << std::endl;
            return 2;
        }

        if (verbose) {
            const ConverterParameters params = resolved_converter(config);
            std::cout << "Configuration is valid." << std::endl;
            std::cout << "  Model: " << to_string(config.model) << std::endl;
            std::cout << "  Strategy: " << to_string(config.strategy) << std::endl;
            std::cout << "  Targets: " << config.range.values().size() << std::endl;
            std::cout << "  V2 values: " << (config.v2_values.empty() ? 1 : config.v2_values.size()) << std::endl;
            std::cout << "  Voltage ratio m: " << params.voltage_ratio() << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_design(const std::string& config_file, bool quiet) {
    try {
        auto loaded = load_config(config_file, quiet);
        if (!loaded) {
            return 1;
        }
        const SweepConfig& config = *loaded;
        if (!config.design) {
            std::cerr << "Error: configuration has no 'design' section" << std::endl;
            return 1;
        }

        ZoneDesignInputs inputs = *config.design;
        inputs.v1 = config.converter.v1;
        inputs.fs = config.converter.fs;
        const ZoneDesign design = design_turns_ratio_and_inductance(inputs);

        const Real m = inputs.m_star;
        json out{
            {"m_star", m},
            {"p_star", design.p_star},
            {"turns_ratio", design.turns_ratio},
            {"inductance_h", design.inductance},
            {"critical_power_low", ZoneModel::critical_power_low(m)},
            {"critical_power_high", ZoneModel::critical_power_high(m)},
            {"max_scaled_power", ZoneModel::max_scaled_power(m)},
        };
        std::cout << out.dump(2) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"dabtps - Minimum-RMS-current triple-phase-shift modulation for DAB converters"};
    app.set_version_flag("-V,--version", "dabtps 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Sweep command
    auto* sweep_cmd = app.add_subcommand("sweep", "Build a lookup table over a power range");
    std::string sweep_file;
    std::string output_file;
    std::string summary_file;
    std::string cli_strategy;
    int cli_threads = 0;
    sweep_cmd->add_option("config", sweep_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    sweep_cmd->add_option("-o,--output", output_file, "Output table (CSV), stdout when omitted");
    sweep_cmd->add_option("--summary", summary_file, "Summary file (JSON)");
    sweep_cmd->add_option("--strategy", cli_strategy, "Override sweep.strategy")
        ->check(CLI::IsMember({"nlp", "grid"}));
    sweep_cmd->add_option("--threads", cli_threads, "Override sweep.threads");
    sweep_cmd->callback([&]() {
        std::exit(cmd_sweep(sweep_file, output_file, summary_file, cli_strategy, cli_threads, verbose, quiet));
    });

    // Point command
    auto* point_cmd = app.add_subcommand("point", "Optimize a single target power");
    std::string point_file;
    double point_power = 0.0;
    std::string point_mode;
    point_cmd->add_option("config", point_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    point_cmd->add_option("-p,--power", point_power, "Target power [W]")->required();
    point_cmd->add_option("--mode", point_mode, "Restrict to one mode (e.g. MODE_1, ZONE_II)");
    point_cmd->callback([&]() {
        std::exit(cmd_point(point_file, point_power, point_mode, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate configuration file");
    std::string validate_file;
    validate_cmd->add_option("config", validate_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose));
    });

    // Design command
    auto* design_cmd = app.add_subcommand("design", "Size turns ratio and inductance for the zone model");
    std::string design_file;
    design_cmd->add_option("config", design_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    design_cmd->callback([&]() {
        std::exit(cmd_design(design_file, quiet));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
