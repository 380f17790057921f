#include "scheduler.h"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <tbb/flow_graph.h>
#include <tbb/task_arena.h>

namespace epoch_pipeline::runtime {

using ExecutionNode = tbb::flow::continue_node<tbb::flow::continue_msg>;

void ExecuteSerial(const NodeExecutor &executor, const RunContext &context) {
  for (size_t i = 0; i < context.plan.size(); ++i) {
    executor.Execute(i);
  }
}

void ExecuteFlowGraph(const NodeExecutor &executor, const RunContext &context,
                      size_t maxConcurrency) {
  auto const &plan = context.plan;

  auto run = [&] {
    tbb::flow::graph graph;
    std::vector<std::unique_ptr<ExecutionNode>> nodes;
    nodes.reserve(plan.size());

    std::mutex errorMutex;
    std::exception_ptr firstError;
    std::atomic<bool> failed{false};

    for (size_t i = 0; i < plan.size(); ++i) {
      nodes.emplace_back(std::make_unique<ExecutionNode>(
          graph, [&, i](const tbb::flow::continue_msg &) {
            if (failed.load(std::memory_order_acquire)) {
              return;
            }
            try {
              executor.Execute(i);
            } catch (...) {
              std::lock_guard lock(errorMutex);
              if (!firstError) {
                firstError = std::current_exception();
              }
              failed.store(true, std::memory_order_release);
            }
          }));
    }

    std::vector<ExecutionNode *> roots;
    for (size_t i = 0; i < plan.size(); ++i) {
      const auto dependencies = plan.GetNode(i).Dependencies();
      if (dependencies.empty()) {
        roots.push_back(nodes[i].get());
      }
      for (auto dependency : dependencies) {
        tbb::flow::make_edge(*nodes[dependency], *nodes[i]);
      }
    }

    SPDLOG_DEBUG("Executing flow graph of {} nodes from {} roots", plan.size(),
                 roots.size());
    for (auto *root : roots) {
      root->try_put(tbb::flow::continue_msg());
    }
    graph.wait_for_all();

    if (firstError) {
      std::rethrow_exception(firstError);
    }
  };

  if (maxConcurrency > 0) {
    tbb::task_arena arena(static_cast<int>(maxConcurrency));
    arena.execute(run);
  } else {
    run();
  }
}

} // namespace epoch_pipeline::runtime
