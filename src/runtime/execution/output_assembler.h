#pragma once
#include "run_context.h"
#include <epoch_pipeline/runtime/pipeline_result.h>

namespace epoch_pipeline::runtime {

// Combines the cached output panels into the result table, keeping the
// (session, asset) pairs that pass the screen.
class OutputAssembler {
public:
  explicit OutputAssembler(const RunContext &context) : m_context(context) {}

  [[nodiscard]] PipelineResult Assemble(RunStatistics statistics) const;

private:
  // The requested range of a cached node, one row per output session.
  [[nodiscard]] arma::mat RangeRows(size_t index) const;

  const RunContext &m_context;
};

} // namespace epoch_pipeline::runtime
