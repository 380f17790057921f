#pragma once
#include "run_context.h"

namespace epoch_pipeline::runtime {

// Produces the output panel of one plan node and stores it in the run
// cache. Leaves are loaded, other nodes are computed one output day at a
// time from the cached panels of their inputs. Inputs whose consumers have
// all run are released afterwards.
class NodeExecutor {
public:
  explicit NodeExecutor(RunContext &context) : m_context(context) {}

  void Execute(size_t index) const;

private:
  [[nodiscard]] arma::mat Load(const graph::PlanNode &node) const;
  [[nodiscard]] arma::mat Compute(const graph::PlanNode &node) const;
  // Last `rows` rows of a cached dependency.
  [[nodiscard]] arma::mat TrailingRows(size_t index, size_t rows) const;
  void ReleaseDependencies(const graph::PlanNode &node) const;

  RunContext &m_context;
};

// Filters hold 1 for true and 0 for false or missing.
void NormalizeFilter(arma::mat &panel);

} // namespace epoch_pipeline::runtime
