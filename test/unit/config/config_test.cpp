#include "common/pipeline_test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <epoch_pipeline/config/engine_config.h>
#include <epoch_pipeline/config/pipeline_config.h>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/loader/csv_loader.h>
#include <epoch_pipeline/runtime/engine.h>
#include <epoch_pipeline/terms/builtins.h>
#include <epoch_pipeline/terms/dataset.h>

#include <filesystem>

using namespace epoch_pipeline;
using namespace epoch_pipeline::config;
using epoch_pipeline::test::Day;
using epoch_pipeline::test::RequireValues;

namespace {
const std::filesystem::path DATA_DIR{EPOCH_PIPELINE_TEST_DATA_DIR};

runtime::Pipeline Compile(std::string const &yaml) {
  return LoadPipelineConfig(YAML::Load(yaml));
}

term::TermPtr Output(runtime::Pipeline const &pipeline, std::string const &name) {
  for (auto const &[outputName, term] : pipeline.GetOutputs()) {
    if (outputName == name) {
      return term;
    }
  }
  FAIL("no output named " << name);
  return nullptr;
}
} // namespace

TEST_CASE("EngineConfig - yaml", "[config][engine]") {
  SECTION("Defaults for a missing document") {
    REQUIRE(LoadEngineConfig(YAML::Node{}) == EngineConfig{});
  }

  SECTION("Partial documents keep defaults") {
    const auto config = LoadEngineConfig(YAML::Load("chunk_size: 20\nlog_level: debug"));
    REQUIRE(config.parallel);
    REQUIRE(config.chunkSize == 20);
    REQUIRE(config.logLevel == "debug");
  }

  SECTION("File") {
    const auto config = LoadEngineConfig(DATA_DIR / "engine.yaml");
    REQUIRE_FALSE(config.parallel);
    REQUIRE(config.maxConcurrency == 2);
    REQUIRE(config.strictLookback);
    REQUIRE(config.chunkSize == 5);
    REQUIRE(config.logLevel == "warn");

    const YAML::Node encoded{config};
    REQUIRE(encoded["max_concurrency"].as<size_t>() == 2);
    REQUIRE(encoded.as<EngineConfig>() == config);
  }

  SECTION("Errors") {
    REQUIRE_THROWS_AS(LoadEngineConfig(YAML::Load("log_level: chatty")), ConfigurationError);
    REQUIRE_THROWS_AS(LoadEngineConfig(DATA_DIR / "missing.yaml"), ConfigurationError);
  }

  SECTION("Log levels") {
    REQUIRE(ParseLogLevel("warn") == spdlog::level::warn);
    REQUIRE(ParseLogLevel("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(ParseLogLevel("loud"), ConfigurationError);
  }
}

TEST_CASE("PipelineSpec - parsing", "[config][pipeline]") {
  const auto spec = LoadPipelineSpec(YAML::Load(R"(
terms:
  - id: close
    column: EquityPricing.close
  - id: sma
    type: simple_moving_average
    inputs: close
    window_length: 3
  - id: label
    type: scalar_compare
    inputs: [sma]
    params:
      op: "gt"
      scalar: 2.5
outputs: [sma]
)"));

  REQUIRE(spec.terms.size() == 3);
  REQUIRE(spec.terms[0].type == COLUMN_COMPUTE_ID);
  REQUIRE(spec.terms[0].params.at("dataset").GetString() == "EquityPricing");
  REQUIRE(spec.terms[0].params.at("column").GetString() == "close");
  REQUIRE(spec.terms[1].inputs == std::vector<std::string>{"close"});
  REQUIRE(spec.terms[1].windowLength == 3);
  REQUIRE(spec.terms[2].params.at("op").GetString() == "gt");
  REQUIRE(spec.terms[2].params.at("scalar").GetDecimal() == 2.5);
  REQUIRE(spec.outputs == std::vector<std::pair<std::string, std::string>>{{"sma", "sma"}});
  REQUIRE_FALSE(spec.screen.has_value());
}

TEST_CASE("PipelineSpec - parameter inference", "[config][pipeline]") {
  const auto node = YAML::Load(R"({a: 3, b: 0.5, c: true, d: average, e: "7"})");
  REQUIRE(node["a"].as<term::ParamValue>() == term::ParamValue{int64_t{3}});
  REQUIRE(node["b"].as<term::ParamValue>() == term::ParamValue{0.5});
  REQUIRE(node["c"].as<term::ParamValue>() == term::ParamValue{true});
  REQUIRE(node["d"].as<term::ParamValue>() == term::ParamValue{"average"});
  REQUIRE(node["e"].as<term::ParamValue>() == term::ParamValue{"7"});
}

TEST_CASE("PipelineSpec - malformed documents", "[config][pipeline]") {
  using Catch::Matchers::ContainsSubstring;

  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load("outputs: [a]")), PipelineDefinitionError);
  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load(R"(
terms:
  - column: EquityPricing.close
outputs: [close]
)")),
                    PipelineDefinitionError);
  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load(R"(
terms:
  - id: close
    column: close
outputs: [close]
)")),
                    PipelineDefinitionError);
  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load(R"(
terms:
  - id: close
outputs: [close]
)")),
                    PipelineDefinitionError);
  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load(R"(
terms:
  - id: close
    column: EquityPricing.close
)")),
                    PipelineDefinitionError);
  REQUIRE_THROWS_AS(LoadPipelineSpec(YAML::Load(R"(
terms:
  - id: sma
    type: simple_moving_average
    window_length: 2.5
outputs: [sma]
)")),
                    InvalidWindowLength);
  REQUIRE_THROWS_WITH(LoadPipelineSpec(DATA_DIR / "pipelines" / "missing.yaml"),
                      ContainsSubstring("failed to read pipeline"));
}

TEST_CASE("CompilePipeline - builds terms by id", "[config][pipeline]") {
  const auto pipeline = LoadPipelineConfig(DATA_DIR / "pipelines" / "momentum.yaml");
  const auto close = term::EquityPricing::Close();

  REQUIRE(pipeline.GetOutputs().size() == 3);
  REQUIRE(pipeline.GetOutputs()[0].first == "momentum");
  REQUIRE(term::SameTerm(Output(pipeline, "momentum"), term::Returns(5, close)));
  REQUIRE(term::SameTerm(Output(pipeline, "sma_10"), term::SimpleMovingAverage(close, 10)));

  const auto &rank = Output(pipeline, "momentum_rank");
  REQUIRE(rank->GetComputeId() == "rank");
  REQUIRE(rank->GetParam("ascending") == term::ParamValue{false});
  REQUIRE(term::SameTerm(rank->GetMask(), pipeline.GetScreen()));
  REQUIRE(pipeline.GetScreen()->IsFilter());
}

TEST_CASE("CompilePipeline - reference errors", "[config][pipeline]") {
  SECTION("Unknown id") {
    REQUIRE_THROWS_WITH(Compile(R"(
terms:
  - id: sma
    type: simple_moving_average
    inputs: [price]
    window_length: 3
outputs: [sma]
)"),
                        Catch::Matchers::ContainsSubstring("unknown term id 'price'"));
  }

  SECTION("Duplicate id") {
    REQUIRE_THROWS_AS(Compile(R"(
terms:
  - id: close
    column: EquityPricing.close
  - id: close
    column: EquityPricing.open
outputs: [close]
)"),
                      PipelineDefinitionError);
  }

  SECTION("Cycle") {
    try {
      Compile(R"(
terms:
  - id: a
    type: simple_moving_average
    inputs: [b]
    window_length: 3
  - id: b
    type: latest
    inputs: [a]
outputs: [a]
)");
      FAIL("expected a cycle");
    } catch (const CyclicDependency &e) {
      REQUIRE(e.GetChain() == std::vector<std::string>{"a", "b", "a"});
    }
  }

  SECTION("Construction errors surface unchanged") {
    REQUIRE_THROWS_AS(Compile(R"(
terms:
  - id: close
    column: EquityPricing.close
  - id: sma
    type: simple_moving_average
    inputs: [close]
    window_length: 0
outputs: [sma]
)"),
                      InvalidWindowLength);
  }
}

TEST_CASE("CompilePipeline - runs against csv data", "[config][pipeline][engine]") {
  const auto calendar = TradingCalendar::BusinessDays(Day(2024, 1, 1), Day(2024, 1, 31));
  auto loader = std::make_shared<loader::CsvDirectoryLoader>(DATA_DIR / "equity", calendar);
  runtime::PipelineEngine engine(loader, calendar);

  const auto pipeline = LoadPipelineConfig(DATA_DIR / "pipelines" / "momentum.yaml");
  const auto result =
      engine.Run(pipeline, Day(2024, 1, 15), Day(2024, 1, 16), {"AAPL", "MSFT", "SPY"});

  // MSFT has no close on the 15th, so it fails the liquidity screen that day.
  REQUIRE(result.num_rows() == 5);
  REQUIRE_FALSE(result.FindRow(Day(2024, 1, 15), "MSFT"));

  const auto aapl = result.FindRow(Day(2024, 1, 16), "AAPL");
  const auto msft = result.FindRow(Day(2024, 1, 16), "MSFT");
  const auto spy = result.FindRow(Day(2024, 1, 16), "SPY");
  REQUIRE(aapl);
  REQUIRE(msft);
  REQUIRE(spy);

  RequireValues(std::vector{result.GetValue("momentum", *aapl),
                            result.GetValue("momentum", *msft),
                            result.GetValue("momentum", *spy)},
                {198.75 / 192.75 - 1.0, 364.5 / 365.5 - 1.0, 478.25 / 474.25 - 1.0});
  RequireValues(std::vector{result.GetValue("momentum_rank", *aapl),
                            result.GetValue("momentum_rank", *msft),
                            result.GetValue("momentum_rank", *spy)},
                {1, 3, 2});
  // The ten session average of MSFT skips the missing close.
  RequireValues(std::vector{result.GetValue("sma_10", *msft)}, {3306.5 / 9.0});
}
