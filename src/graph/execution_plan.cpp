#include <epoch_pipeline/graph/execution_plan.h>

#include <algorithm>
#include <fmt/format.h>
#include <glaze/glaze.hpp>

namespace epoch_pipeline::graph {

namespace {
struct PlanNodeView {
  size_t index;
  std::string compute;
  std::string kind;
  std::string term;
  int64_t window_length;
  int64_t extra_rows;
  std::vector<size_t> inputs;
  std::optional<size_t> mask;
  std::vector<size_t> consumers;
  bool retained;
};

struct PlanOutputView {
  std::string name;
  size_t node;
};

struct PlanView {
  std::vector<PlanNodeView> nodes;
  std::vector<PlanOutputView> outputs;
  std::optional<size_t> screen;
};
} // namespace

std::vector<size_t> PlanNode::Dependencies() const {
  std::vector<size_t> dependencies = inputs;
  if (mask) {
    dependencies.push_back(*mask);
  }
  std::ranges::sort(dependencies);
  auto [first, last] = std::ranges::unique(dependencies);
  dependencies.erase(first, last);
  return dependencies;
}

ExecutionPlan::ExecutionPlan(std::vector<PlanNode> nodes,
                             std::vector<std::pair<std::string, size_t>> outputs,
                             std::optional<size_t> screen)
    : m_nodes(std::move(nodes)), m_outputs(std::move(outputs)),
      m_screen(screen) {
  for (size_t i = 0; i < m_nodes.size(); ++i) {
    m_index.emplace(m_nodes[i].term, i);
  }
}

std::optional<size_t> ExecutionPlan::Find(const term::TermPtr &term) const {
  auto it = m_index.find(term);
  if (it == m_index.end()) {
    return std::nullopt;
  }
  return it->second;
}

const PlanNode &ExecutionPlan::GetNode(const term::TermPtr &term) const {
  if (auto index = Find(term)) {
    return m_nodes[*index];
  }
  throw std::out_of_range(fmt::format("{} is not part of the execution plan",
                                      term ? term->ToString() : "<null>"));
}

int64_t ExecutionPlan::MaxExtraRows() const noexcept {
  int64_t result = 0;
  for (auto const &node : m_nodes) {
    result = std::max(result, node.extraRows);
  }
  return result;
}

std::string ExecutionPlan::ToJson() const {
  PlanView view;
  view.nodes.reserve(m_nodes.size());
  for (size_t i = 0; i < m_nodes.size(); ++i) {
    auto const &node = m_nodes[i];
    view.nodes.emplace_back(PlanNodeView{
        .index = i,
        .compute = node.term->GetComputeId(),
        .kind = epoch_core::TermKindWrapper::ToString(node.term->GetKind()),
        .term = node.term->ToString(),
        .window_length = node.term->GetWindowLength(),
        .extra_rows = node.extraRows,
        .inputs = node.inputs,
        .mask = node.mask,
        .consumers = node.consumers,
        .retained = node.retained});
  }
  for (auto const &[name, index] : m_outputs) {
    view.outputs.emplace_back(PlanOutputView{.name = name, .node = index});
  }
  view.screen = m_screen;

  auto result = glz::write_json(view);
  if (!result) {
    throw std::runtime_error("Failed to serialize execution plan");
  }
  return result.value();
}

} // namespace epoch_pipeline::graph
