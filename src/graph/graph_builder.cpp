#include <epoch_pipeline/graph/graph_builder.h>

#include <epoch_pipeline/core/errors.h>

#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_pipeline::graph {

namespace {

// Depth-first post-order walk. A node is appended once all of its inputs
// and its mask have been appended, so discovery order breaks ties between
// independent branches.
class PlanResolver {
public:
  size_t Visit(const term::TermPtr &term) {
    if (auto it = m_index.find(term); it != m_index.end()) {
      return it->second;
    }
    // MakeTerm needs every input to exist first, so terms cannot form a cycle.
    // This re-checks the invariant for the graph being walked.
    if (m_onPath.contains(term)) {
      ThrowCycle(term);
    }

    m_path.push_back(term);
    m_onPath.insert(term);

    PlanNode node{.term = term};
    node.inputs.reserve(term->GetInputs().size());
    for (auto const &input : term->GetInputs()) {
      node.inputs.push_back(Visit(input));
    }
    if (term->GetMask()) {
      node.mask = Visit(term->GetMask());
    }

    m_onPath.erase(term);
    m_path.pop_back();

    const size_t index = m_nodes.size();
    m_nodes.emplace_back(std::move(node));
    m_index.emplace(term, index);
    return index;
  }

  std::vector<PlanNode> TakeNodes() { return std::move(m_nodes); }

private:
  [[noreturn]] void ThrowCycle(const term::TermPtr &term) const {
    auto start = std::ranges::find_if(m_path, [&](const term::TermPtr &entry) {
      return term::SameTerm(entry, term);
    });
    std::vector<std::string> chain;
    for (auto it = start; it != m_path.end(); ++it) {
      chain.emplace_back((*it)->ToString());
    }
    chain.emplace_back(term->ToString());
    throw CyclicDependency(std::move(chain));
  }

  std::vector<PlanNode> m_nodes;
  std::unordered_map<term::TermPtr, size_t, term::TermPtrHash, term::TermPtrEqual> m_index;
  std::vector<term::TermPtr> m_path;
  std::unordered_set<term::TermPtr, term::TermPtrHash, term::TermPtrEqual> m_onPath;
};

void ValidateOutputs(NamedTerms const &outputs, term::TermPtr const &screen) {
  if (outputs.empty()) {
    throw PipelineDefinitionError("A pipeline requires at least one output");
  }

  std::unordered_set<std::string> names;
  for (auto const &[name, term] : outputs) {
    if (name.empty()) {
      throw PipelineDefinitionError("Pipeline output names must not be empty");
    }
    if (!names.insert(name).second) {
      throw DuplicateOutputName(name);
    }
    if (!term) {
      throw PipelineDefinitionError(
          fmt::format("Pipeline output '{}' has no term", name));
    }
  }

  if (screen && !screen->IsFilter()) {
    throw UnsupportedDType(fmt::format(
        "Pipeline screen must be a Filter, got a {} ({})",
        epoch_core::TermKindWrapper::ToString(screen->GetKind()),
        screen->ToString()));
  }
}

} // namespace

ExecutionPlan GraphBuilder::Build(NamedTerms const &outputs,
                                  term::TermPtr const &screen) const {
  ValidateOutputs(outputs, screen);

  PlanResolver resolver;
  std::vector<std::pair<std::string, size_t>> outputIndices;
  outputIndices.reserve(outputs.size());
  for (auto const &[name, term] : outputs) {
    outputIndices.emplace_back(name, resolver.Visit(term));
  }
  std::optional<size_t> screenIndex;
  if (screen) {
    screenIndex = resolver.Visit(screen);
  }

  auto nodes = resolver.TakeNodes();

  for (size_t i = 0; i < nodes.size(); ++i) {
    for (const auto dependency : nodes[i].Dependencies()) {
      nodes[dependency].consumers.push_back(i);
    }
  }
  for (auto const &[name, index] : outputIndices) {
    nodes[index].retained = true;
  }
  if (screenIndex) {
    nodes[*screenIndex].retained = true;
  }

  // consumers always sit later in the order, so walking backwards settles
  // every consumer before its producers
  for (size_t i = nodes.size(); i-- > 0;) {
    auto &node = nodes[i];
    for (const auto consumer : node.consumers) {
      auto const &consumerNode = nodes[consumer];
      node.extraRows =
          std::max(node.extraRows, consumerNode.extraRows +
                                       consumerNode.term->GetEffectiveWindow() - 1);
    }
  }

  SPDLOG_DEBUG("Built execution plan with {} nodes for {} outputs", nodes.size(),
               outputIndices.size());
  return ExecutionPlan{std::move(nodes), std::move(outputIndices), screenIndex};
}

} // namespace epoch_pipeline::graph
