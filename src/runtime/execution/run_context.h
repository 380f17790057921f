#pragma once
#include "result_cache.h"

#include <atomic>
#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/graph/execution_plan.h>
#include <epoch_pipeline/loader/iloader.h>
#include <epoch_pipeline/runtime/events/cancellation_token.h>
#include <epoch_pipeline/runtime/events/event_dispatcher.h>
#include <vector>

namespace epoch_pipeline::runtime {

// State of one evaluation. Output rows cover calendar sessions
// [startIndex, endIndex]; a node with `extraRows` e produces rows for
// sessions [startIndex - e, endIndex], where negative indices are padding.
struct RunContext {
  RunContext(const graph::ExecutionPlan &plan_, const TradingCalendar &calendar_,
             const loader::ILoader &loader_, const std::vector<AssetID> &assets_,
             size_t startIndex_, size_t endIndex_,
             events::IEventDispatcher &dispatcher_,
             const events::CancellationToken *cancellation_)
      : plan(plan_), calendar(calendar_), loader(loader_), assets(assets_),
        startIndex(startIndex_), endIndex(endIndex_), dispatcher(dispatcher_),
        cancellation(cancellation_), pendingConsumers(plan_.size()) {
    for (size_t i = 0; i < plan.size(); ++i) {
      pendingConsumers[i].store(plan.GetNode(i).consumers.size());
    }
  }

  [[nodiscard]] size_t RangeLength() const noexcept { return endIndex - startIndex + 1; }

  [[nodiscard]] size_t RowsFor(const graph::PlanNode &node) const noexcept {
    return RangeLength() + static_cast<size_t>(node.extraRows);
  }

  void ThrowIfCancelled(const std::string &context) const {
    if (cancellation) {
      cancellation->ThrowIfCancelled(context);
    }
  }

  const graph::ExecutionPlan &plan;
  const TradingCalendar &calendar;
  const loader::ILoader &loader;
  const std::vector<AssetID> &assets;
  const size_t startIndex;
  const size_t endIndex;
  events::IEventDispatcher &dispatcher;
  const events::CancellationToken *cancellation;

  ResultCache cache;
  // Consumers of each node that have not run yet.
  std::vector<std::atomic<size_t>> pendingConsumers;
  std::atomic<size_t> nodesComputed{0};
  std::atomic<size_t> loaderRequests{0};
};

} // namespace epoch_pipeline::runtime
