#include <epoch_pipeline/config/pipeline_config.h>

#include <algorithm>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/term.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <unordered_set>

using epoch_pipeline::config::PipelineSpec;
using epoch_pipeline::config::TermNodeSpec;
using epoch_pipeline::term::ParamValue;

namespace YAML {

Node convert<ParamValue>::encode(ParamValue const &value) {
  return std::visit([](auto const &v) { return Node(v); }, value.GetVariant());
}

bool convert<ParamValue>::decode(Node const &node, ParamValue &value) {
  if (!node.IsScalar()) {
    return false;
  }
  // Quoted scalars are always strings.
  if (node.Tag() == "!") {
    value = node.Scalar();
    return true;
  }
  if (int64_t integer{}; convert<int64_t>::decode(node, integer)) {
    value = integer;
    return true;
  }
  if (double decimal{}; convert<double>::decode(node, decimal)) {
    value = decimal;
    return true;
  }
  if (bool boolean{}; convert<bool>::decode(node, boolean)) {
    value = boolean;
    return true;
  }
  value = node.Scalar();
  return true;
}

bool convert<TermNodeSpec>::decode(Node const &node, TermNodeSpec &spec) {
  if (!node.IsMap()) {
    return false;
  }
  spec.id = node["id"].as<std::string>("");
  if (spec.id.empty()) {
    throw epoch_pipeline::PipelineDefinitionError(
        fmt::format("pipeline term without an id: {}", YAML::Dump(node)));
  }

  if (auto column = node["column"]) {
    const auto qualified = column.as<std::string>();
    const auto dot = qualified.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == qualified.size()) {
      throw epoch_pipeline::PipelineDefinitionError(fmt::format(
          "term '{}': column must be written as dataset.column, got '{}'", spec.id,
          qualified));
    }
    spec.type = epoch_pipeline::COLUMN_COMPUTE_ID;
    spec.params.insert_or_assign("dataset", ParamValue{qualified.substr(0, dot)});
    spec.params.insert_or_assign("column", ParamValue{qualified.substr(dot + 1)});
  } else {
    spec.type = node["type"].as<std::string>("");
  }
  if (spec.type.empty()) {
    throw epoch_pipeline::PipelineDefinitionError(
        fmt::format("term '{}' has neither a type nor a column", spec.id));
  }

  if (auto inputs = node["inputs"]) {
    spec.inputs = inputs.IsScalar() ? std::vector{inputs.as<std::string>()}
                                    : inputs.as<std::vector<std::string>>();
  }

  if (auto window = node["window_length"]) {
    int64_t windowLength{};
    if (!window.IsScalar() || !convert<int64_t>::decode(window, windowLength)) {
      throw epoch_pipeline::InvalidWindowLength(
          fmt::format("term '{}': window_length must be an integer, got '{}'", spec.id,
                      YAML::Dump(window)));
    }
    spec.windowLength = windowLength;
  }

  if (auto mask = node["mask"]) {
    spec.mask = mask.as<std::string>();
  }

  if (auto params = node["params"]) {
    if (!params.IsMap()) {
      throw epoch_pipeline::PipelineDefinitionError(
          fmt::format("term '{}': params must be a map", spec.id));
    }
    for (auto const &param : params) {
      const auto name = param.first.as<std::string>();
      ParamValue value{int64_t{0}};
      if (!convert<ParamValue>::decode(param.second, value)) {
        throw epoch_pipeline::InvalidParameter(fmt::format(
            "term '{}': parameter '{}' must be a scalar", spec.id, name));
      }
      spec.params.insert_or_assign(name, std::move(value));
    }
  }

  if (auto kind = node["kind"]) {
    spec.kind = epoch_core::TermKindWrapper::FromString(kind.as<std::string>());
  }
  return true;
}

bool convert<PipelineSpec>::decode(Node const &node, PipelineSpec &spec) {
  if (!node.IsMap()) {
    return false;
  }
  auto terms = node["terms"];
  if (!terms || !terms.IsSequence()) {
    throw epoch_pipeline::PipelineDefinitionError("pipeline requires a 'terms' list");
  }
  spec.terms = terms.as<std::vector<TermNodeSpec>>();

  auto outputs = node["outputs"];
  if (outputs && outputs.IsMap()) {
    for (auto const &output : outputs) {
      spec.outputs.emplace_back(output.first.as<std::string>(),
                                output.second.as<std::string>());
    }
  } else if (outputs && outputs.IsSequence()) {
    for (auto const &output : outputs) {
      auto id = output.as<std::string>();
      spec.outputs.emplace_back(id, id);
    }
  }
  if (spec.outputs.empty()) {
    throw epoch_pipeline::PipelineDefinitionError("pipeline defines no outputs");
  }

  if (auto screen = node["screen"]; screen && !screen.IsNull()) {
    spec.screen = screen.as<std::string>();
  }
  return true;
}

} // namespace YAML

namespace epoch_pipeline::config {

namespace {
// Depth-first construction of the terms a spec declares. Terms are built
// after their inputs and mask; a term reached again while it is still being
// built closes a cycle.
class PipelineCompiler {
public:
  explicit PipelineCompiler(PipelineSpec const &spec) {
    for (auto const &node : spec.terms) {
      if (!m_nodes.emplace(node.id, &node).second) {
        throw PipelineDefinitionError(
            fmt::format("term id '{}' is defined more than once", node.id));
      }
    }
  }

  term::TermPtr Compile(std::string const &id) {
    if (auto it = m_compiled.find(id); it != m_compiled.end()) {
      return it->second;
    }
    if (m_onPath.contains(id)) {
      auto start = std::ranges::find(m_path, id);
      std::vector<std::string> chain(start, m_path.end());
      chain.push_back(id);
      throw CyclicDependency(std::move(chain));
    }
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
      throw PipelineDefinitionError(fmt::format("unknown term id '{}'", id));
    }
    auto const &node = *it->second;

    m_path.push_back(id);
    m_onPath.insert(id);

    term::TermSpec spec{.compute = node.type,
                        .inputs = {},
                        .windowLength = node.windowLength,
                        .mask = nullptr,
                        .params = node.params,
                        .kind = node.kind};
    for (auto const &input : node.inputs) {
      spec.inputs.push_back(Compile(input));
    }
    if (node.mask) {
      spec.mask = Compile(*node.mask);
    }
    auto term = term::MakeTerm(std::move(spec));

    m_onPath.erase(id);
    m_path.pop_back();
    SPDLOG_DEBUG("Compiled term '{}' as {}", id, term->ToString());
    return m_compiled.emplace(id, std::move(term)).first->second;
  }

private:
  std::unordered_map<std::string, const TermNodeSpec *> m_nodes;
  std::unordered_map<std::string, term::TermPtr> m_compiled;
  std::vector<std::string> m_path;
  std::unordered_set<std::string> m_onPath;
};
} // namespace

PipelineSpec LoadPipelineSpec(YAML::Node const &node) {
  try {
    return node.as<PipelineSpec>();
  } catch (YAML::Exception const &e) {
    throw PipelineDefinitionError(fmt::format("invalid pipeline definition: {}", e.what()));
  }
}

PipelineSpec LoadPipelineSpec(std::filesystem::path const &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path.string());
  } catch (YAML::Exception const &e) {
    throw PipelineDefinitionError(
        fmt::format("failed to read pipeline {}: {}", path.string(), e.what()));
  }
  return LoadPipelineSpec(node);
}

runtime::Pipeline CompilePipeline(PipelineSpec const &spec) {
  PipelineCompiler compiler(spec);
  for (auto const &node : spec.terms) {
    compiler.Compile(node.id);
  }

  runtime::Pipeline pipeline;
  for (auto const &[name, id] : spec.outputs) {
    pipeline.Add(name, compiler.Compile(id));
  }
  if (spec.screen) {
    pipeline.SetScreen(compiler.Compile(*spec.screen));
  }
  return pipeline;
}

runtime::Pipeline LoadPipelineConfig(YAML::Node const &node) {
  return CompilePipeline(LoadPipelineSpec(node));
}

runtime::Pipeline LoadPipelineConfig(std::filesystem::path const &path) {
  return CompilePipeline(LoadPipelineSpec(path));
}

} // namespace epoch_pipeline::config
