#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dabtps/v1/parser/config_parser.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace dabtps::v1;
using Catch::Approx;

namespace {

bool has_code(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& msg) { return msg.find(code) != std::string::npos; });
}

std::string dump(const parser::ConfigParser& parser) {
    std::ostringstream out;
    out << "YAML errors count=" << parser.errors().size();
    for (const auto& err : parser.errors()) {
        out << "\n" << err;
    }
    return out.str();
}

const std::string kReferenceYaml = R"(schema: dabtps-v1
version: 1
converter:
  v1: 200
  v2: 50
  half_period: 10u
  inductance: 20uH
sweep:
  start: 100
  stop: 1k
  step: 10
  strategy: nlp
  model: six_mode
  threads: 2
optimizer:
  max_iterations: 80
  retries: 2
  initial_guess: [0.6, 0.3, 0.2]
grid:
  step: 0.025
  tolerance_w: 1.5
  fallback_max_error_w: 5
diagnostics:
  unity_ratio_margin: 0.05
)";

}  // namespace

TEST_CASE("v1 parser reads a complete sweep configuration", "[v1][yaml][config]") {
    parser::ConfigParser parser;
    const SweepConfig config = parser.load_string(kReferenceYaml);
    INFO(dump(parser));
    REQUIRE(parser.errors().empty());
    CHECK(parser.warnings().empty());

    CHECK(config.converter.v1 == Approx(200.0));
    CHECK(config.converter.v2 == Approx(50.0));
    CHECK(config.converter.half_period() == Approx(1e-5));
    CHECK(config.converter.inductance == Approx(20e-6));
    CHECK(config.range.stop == Approx(1000.0));
    CHECK(config.range.values().size() == 91);
    CHECK(config.strategy == Strategy::Nlp);
    CHECK(config.model == ModelKind::SixMode);
    CHECK(config.threads == 2);
    CHECK(config.optimizer.sqp.max_iterations == 80);
    CHECK(config.optimizer.retries == 2);
    CHECK(config.optimizer.initial_guess == DutyRatioPoint(0.6, 0.3, 0.2));
    CHECK(config.pool.grid_step == Approx(0.025));
    CHECK(config.grid.tolerance_w == Approx(1.5));
    REQUIRE(config.grid.fallback_max_error_w.has_value());
    CHECK(*config.grid.fallback_max_error_w == Approx(5.0));
    CHECK(config.diagnostics.unity_ratio_margin == Approx(0.05));
}

TEST_CASE("v1 parser accepts SI suffixes", "[v1][yaml][units]") {
    CHECK(parser::parse_real_string("20u") == Approx(20e-6));
    CHECK(parser::parse_real_string("20uH") == Approx(20e-6));
    CHECK(parser::parse_real_string("50kHz") == Approx(50e3));
    CHECK(parser::parse_real_string("3.5meg") == Approx(3.5e6));
    CHECK(parser::parse_real_string("2MHz") == Approx(2e6));
    CHECK(parser::parse_real_string("10m") == Approx(1e-2));
    CHECK(parser::parse_real_string("400 V") == Approx(400.0));
    CHECK(parser::parse_real_string("1e-3") == Approx(1e-3));
    CHECK_THROWS_AS(parser::parse_real_string("abc"), std::invalid_argument);
    CHECK_THROWS_AS(parser::parse_real_string("12 furlongs"), std::invalid_argument);
    CHECK_THROWS_AS(parser::parse_real_string(""), std::invalid_argument);
}

TEST_CASE("v1 parser rejects wrong schema and version", "[v1][yaml][validation]") {
    parser::ConfigParser parser;

    parser.load_string("schema: pulsar-v9\nversion: 1\n");
    CHECK(has_code(parser.errors(), "DABTPS_CFG_E_SCHEMA"));

    parser.load_string("schema: dabtps-v1\nversion: 2\n");
    CHECK(has_code(parser.errors(), "DABTPS_CFG_E_SCHEMA"));

    parser.load_string("version: 1\n");
    CHECK(has_code(parser.errors(), "DABTPS_CFG_E_MISSING_FIELD"));

    parser.load_string("schema: dabtps-v1\nversion: 1\nconverter: [1, 2\n");
    REQUIRE_FALSE(parser.errors().empty());
    CHECK(parser.errors().front().find("YAML parse error") != std::string::npos);
}

TEST_CASE("v1 parser flags malformed fields with coded diagnostics", "[v1][yaml][validation]") {
    parser::ConfigParser parser;

    SECTION("unknown field in strict mode") {
        std::string yaml = kReferenceYaml;
        yaml.replace(yaml.find("  threads: 2"), 12, "  thread_count: 2");
        parser.load_string(yaml);
        CHECK(has_code(parser.errors(), "DABTPS_CFG_E_UNKNOWN_FIELD"));
        CHECK(parser.errors().front().find("sweep.thread_count") != std::string::npos);

        parser::ConfigParser lenient(parser::ConfigParserOptions{false, true});
        lenient.load_string(yaml);
        CHECK(lenient.errors().empty());
    }

    SECTION("type mismatch") {
        std::string yaml = kReferenceYaml;
        yaml.replace(yaml.find("  v2: 50"), 8, "  v2: [50]");
        parser.load_string(yaml);
        CHECK(has_code(parser.errors(), "DABTPS_CFG_E_TYPE_MISMATCH"));
    }

    SECTION("invalid enum") {
        std::string yaml = kReferenceYaml;
        yaml.replace(yaml.find("strategy: nlp"), 13, "strategy: magic");
        parser.load_string(yaml);
        CHECK(has_code(parser.errors(), "DABTPS_CFG_E_ENUM_INVALID"));
    }

    SECTION("missing range") {
        std::string yaml = kReferenceYaml;
        yaml.replace(yaml.find("  step: 10\n"), 11, "");
        parser.load_string(yaml);
        CHECK(has_code(parser.errors(), "DABTPS_CFG_E_MISSING_FIELD"));
    }

    SECTION("semantic validation after parsing") {
        std::string yaml = kReferenceYaml;
        yaml.replace(yaml.find("  stop: 1k"), 10, "  stop: 50");
        parser.load_string(yaml);
        CHECK(has_code(parser.errors(), "DABTPS_CFG_E_RANGE_EMPTY"));
    }
}

TEST_CASE("v1 parser warns about overridden fields", "[v1][yaml][validation]") {
    std::string yaml = kReferenceYaml;
    yaml.replace(yaml.find("  half_period: 10u"), 18, "  half_period: 10u\n  fs: 40k");

    parser::ConfigParser parser;
    const SweepConfig config = parser.load_string(yaml);
    INFO(dump(parser));
    REQUIRE(parser.errors().empty());
    CHECK(has_code(parser.warnings(), "DABTPS_CFG_W_FIELD_OVERRIDDEN"));
    CHECK(config.converter.fs == Approx(50e3));
}

TEST_CASE("v1 parser reads a zone design configuration", "[v1][yaml][design]") {
    const std::string yaml = R"(schema: dabtps-v1
version: 1
converter:
  v1: 400
  v2: 200
  fs: 100k
design:
  m_star: 1.3
  v2_min: 200
  p_max: 3k
sweep:
  start: 200
  stop: 3k
  step: 200
  model: zone
  v2_values: [200, 250, 300]
)";

    parser::ConfigParser parser;
    const SweepConfig config = parser.load_string(yaml);
    INFO(dump(parser));
    REQUIRE(parser.errors().empty());
    CHECK(config.model == ModelKind::Zone);
    REQUIRE(config.design.has_value());
    CHECK(config.design->p_max == Approx(3000.0));
    CHECK(config.v2_values.size() == 3);

    const ConverterParameters params = resolved_converter(config);
    CHECK(params.turns_ratio == Approx(2.6));
    CHECK(params.inductance > 0.0);
}

TEST_CASE("v1 parser reports unreadable files", "[v1][yaml]") {
    parser::ConfigParser parser;
    parser.load("/nonexistent/dabtps/config.yaml");
    REQUIRE(parser.errors().size() == 1);
    CHECK(parser.errors().front().find("Cannot open file") != std::string::npos);
}
