#pragma once
#include "pipeline.h"
#include "pipeline_result.h"
#include "events/cancellation_token.h"
#include "events/event_dispatcher.h"

#include <epoch_pipeline/config/engine_config.h>
#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/loader/iloader.h>

namespace epoch_pipeline::loader {
class LoaderRouter;
class CoalescingLoader;
} // namespace epoch_pipeline::loader

namespace epoch_pipeline::runtime {

struct RunOptions {
  events::CancellationTokenPtr cancellationToken{};
};

// Evaluates pipelines over a trading calendar.
//
// Each run resolves the pipeline into an ExecutionPlan, loads the leaves it
// needs, computes every node once and assembles the (date, asset) table.
// Runs share nothing but the loaders, so one engine may evaluate several
// pipelines concurrently.
class PipelineEngine {
public:
  PipelineEngine(loader::ILoaderPtr defaultLoader, TradingCalendar calendar,
                 config::EngineConfig config = {});
  ~PipelineEngine();

  PipelineEngine(const PipelineEngine &) = delete;
  PipelineEngine &operator=(const PipelineEngine &) = delete;

  // Serves every column of `dataset` from `loader` instead of the default.
  void RegisterLoader(std::string dataset, loader::ILoaderPtr loader);

  // `start` and `end` snap inward to calendar sessions. Throws
  // InvalidDateRange, InvalidAssetUniverse, WindowLengthTooLong,
  // LoaderFailure and OperationCancelledException, plus any build error of
  // the pipeline.
  [[nodiscard]] PipelineResult Run(const Pipeline &pipeline, SessionDate start,
                                   SessionDate end, const std::vector<AssetID> &assets,
                                   const RunOptions &options = {}) const;

  [[nodiscard]] PipelineResult Run(const graph::ExecutionPlan &plan, SessionDate start,
                                   SessionDate end, const std::vector<AssetID> &assets,
                                   const RunOptions &options = {}) const;

  // Evaluates consecutive chunks of `chunkSize` sessions and concatenates
  // them. A chunk size of 0 uses EngineConfig::chunkSize, and when that is 0
  // too the range is evaluated in one run.
  [[nodiscard]] PipelineResult RunChunked(const Pipeline &pipeline, SessionDate start,
                                          SessionDate end,
                                          const std::vector<AssetID> &assets,
                                          size_t chunkSize = 0,
                                          const RunOptions &options = {}) const;

  boost::signals2::connection OnEvent(const events::EngineEventSlot &handler);

  template <typename T>
  boost::signals2::connection OnEvent(std::function<void(const T &)> handler) {
    return m_eventDispatcher->SubscribeTo<T>(std::move(handler));
  }

  [[nodiscard]] const TradingCalendar &GetCalendar() const noexcept {
    return m_calendar;
  }
  [[nodiscard]] const config::EngineConfig &GetConfig() const noexcept {
    return m_config;
  }

private:
  [[nodiscard]] std::pair<size_t, size_t> ResolveSessions(SessionDate start,
                                                          SessionDate end) const;

  TradingCalendar m_calendar;
  config::EngineConfig m_config;
  std::shared_ptr<loader::LoaderRouter> m_router;
  std::shared_ptr<loader::CoalescingLoader> m_loader;
  events::IEventDispatcherPtr m_eventDispatcher;
};

} // namespace epoch_pipeline::runtime
