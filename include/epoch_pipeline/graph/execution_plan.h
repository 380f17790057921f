#pragma once
#include <epoch_pipeline/terms/term.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace epoch_pipeline::graph {

struct PlanNode {
  term::TermPtr term;
  // Extra leading rows this node must produce beyond the requested range.
  int64_t extraRows{0};
  // Plan indices of the term's inputs, in input order.
  std::vector<size_t> inputs{};
  std::optional<size_t> mask{std::nullopt};
  // Distinct plan indices of the nodes reading this one.
  std::vector<size_t> consumers{};
  // Outputs and the screen stay cached until the run is assembled.
  bool retained{false};

  // Distinct producers this node waits on (inputs and mask).
  [[nodiscard]] std::vector<size_t> Dependencies() const;
};

// Resolved, deduplicated dependency graph of a pipeline, in topological
// order: every node appears after all of its inputs and its mask.
class ExecutionPlan {
public:
  ExecutionPlan(std::vector<PlanNode> nodes,
                std::vector<std::pair<std::string, size_t>> outputs,
                std::optional<size_t> screen);

  [[nodiscard]] const std::vector<PlanNode> &Nodes() const noexcept { return m_nodes; }
  [[nodiscard]] size_t size() const noexcept { return m_nodes.size(); }
  [[nodiscard]] const PlanNode &GetNode(size_t index) const { return m_nodes.at(index); }

  [[nodiscard]] std::optional<size_t> Find(const term::TermPtr &term) const;
  // Throws std::out_of_range when the term is not part of the plan.
  [[nodiscard]] const PlanNode &GetNode(const term::TermPtr &term) const;

  [[nodiscard]] const std::vector<std::pair<std::string, size_t>> &Outputs() const noexcept {
    return m_outputs;
  }
  [[nodiscard]] const std::optional<size_t> &Screen() const noexcept { return m_screen; }

  [[nodiscard]] int64_t MaxExtraRows() const noexcept;

  // JSON rendering of the graph for inspection tools.
  [[nodiscard]] std::string ToJson() const;

private:
  std::vector<PlanNode> m_nodes;
  std::vector<std::pair<std::string, size_t>> m_outputs;
  std::optional<size_t> m_screen;
  std::unordered_map<term::TermPtr, size_t, term::TermPtrHash, term::TermPtrEqual> m_index;
};

} // namespace epoch_pipeline::graph
