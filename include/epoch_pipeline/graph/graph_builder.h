#pragma once
#include "execution_plan.h"

namespace epoch_pipeline::graph {

using NamedTerms = std::vector<std::pair<std::string, term::TermPtr>>;

// Resolves the transitive closure of the pipeline outputs into an
// ExecutionPlan: structurally identical terms collapse into one node, cycles
// are rejected and every node receives the extra rows its consumers need.
//
// Throws CyclicDependency, DuplicateOutputName, UnsupportedDType (screen not a
// Filter) or PipelineDefinitionError (no outputs, null terms).
class GraphBuilder {
public:
  [[nodiscard]] ExecutionPlan Build(NamedTerms const &outputs,
                                    term::TermPtr const &screen = nullptr) const;
};

} // namespace epoch_pipeline::graph
