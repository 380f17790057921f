#pragma once
#include "node_executor.h"

namespace epoch_pipeline::runtime {

// Runs every plan node in topological order on the calling thread.
void ExecuteSerial(const NodeExecutor &executor, const RunContext &context);

// Runs the plan as a TBB flow graph with one continue_node per plan node and
// an edge per dependency, so independent branches run concurrently. A
// non-zero `maxConcurrency` confines the graph to a task arena of that size.
// The first failure stops the remaining nodes and is rethrown once the graph
// has drained.
void ExecuteFlowGraph(const NodeExecutor &executor, const RunContext &context,
                      size_t maxConcurrency);

} // namespace epoch_pipeline::runtime
