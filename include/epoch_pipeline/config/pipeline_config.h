#pragma once
#include <epoch_pipeline/runtime/pipeline.h>
#include <epoch_pipeline/terms/param_value.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace epoch_pipeline::config {

// One named term of a pipeline file. Inputs and the mask refer to other
// terms by id.
struct TermNodeSpec {
  std::string id;
  std::string type;
  std::vector<std::string> inputs{};
  std::optional<int64_t> windowLength{std::nullopt};
  std::optional<std::string> mask{std::nullopt};
  term::ParamMap params{};
  std::optional<epoch_core::TermKind> kind{std::nullopt};
};

// Declarative pipeline definition:
//
//   terms:
//     - id: close
//       column: EquityPricing.close
//     - id: sma
//       type: simple_moving_average
//       inputs: [close]
//       window_length: 10
//   outputs:
//     sma_10: sma
//   screen: liquid
//
// `outputs` is either a map from output name to term id or a list of term
// ids used as their own names.
struct PipelineSpec {
  std::vector<TermNodeSpec> terms;
  std::vector<std::pair<std::string, std::string>> outputs;
  std::optional<std::string> screen{std::nullopt};
};

// Throws PipelineDefinitionError for malformed documents and
// InvalidWindowLength for non-integer window lengths.
PipelineSpec LoadPipelineSpec(YAML::Node const &node);
PipelineSpec LoadPipelineSpec(std::filesystem::path const &path);

// Builds the terms of a PipelineSpec. Throws CyclicDependency when terms refer to
// each other in a loop, PipelineDefinitionError for unknown ids and any
// error raised by term construction.
runtime::Pipeline CompilePipeline(PipelineSpec const &spec);

runtime::Pipeline LoadPipelineConfig(YAML::Node const &node);
runtime::Pipeline LoadPipelineConfig(std::filesystem::path const &path);

} // namespace epoch_pipeline::config

namespace YAML {
template <> struct convert<epoch_pipeline::term::ParamValue> {
  static Node encode(epoch_pipeline::term::ParamValue const &value);
  static bool decode(Node const &node, epoch_pipeline::term::ParamValue &value);
};

template <> struct convert<epoch_pipeline::config::TermNodeSpec> {
  static bool decode(Node const &node, epoch_pipeline::config::TermNodeSpec &spec);
};

template <> struct convert<epoch_pipeline::config::PipelineSpec> {
  static bool decode(Node const &node, epoch_pipeline::config::PipelineSpec &spec);
};
} // namespace YAML
