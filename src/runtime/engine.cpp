#include <epoch_pipeline/runtime/engine.h>

#include "../loader/coalescing_loader.h"
#include "../loader/loader_router.h"
#include "execution/output_assembler.h"
#include "execution/scheduler.h"

#include <algorithm>
#include <epoch_pipeline/core/errors.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace epoch_pipeline::runtime {

namespace {
void ValidateAssets(const std::vector<AssetID> &assets) {
  if (assets.empty()) {
    throw InvalidAssetUniverse("asset universe is empty");
  }
  std::unordered_set<AssetID> seen;
  for (auto const &asset : assets) {
    if (asset.empty()) {
      throw InvalidAssetUniverse("asset universe contains an empty asset id");
    }
    if (!seen.insert(asset).second) {
      throw InvalidAssetUniverse(
          fmt::format("asset '{}' appears more than once in the universe", asset));
    }
  }
}
} // namespace

PipelineEngine::PipelineEngine(loader::ILoaderPtr defaultLoader,
                               TradingCalendar calendar, config::EngineConfig config)
    : m_calendar(std::move(calendar)), m_config(std::move(config)),
      m_router(std::make_shared<loader::LoaderRouter>(std::move(defaultLoader))),
      m_loader(std::make_shared<loader::CoalescingLoader>(m_router)),
      m_eventDispatcher(events::MakeEventDispatcher()) {
  if (m_calendar.empty()) {
    throw InvalidDateRange("engine calendar has no sessions");
  }
}

PipelineEngine::~PipelineEngine() = default;

void PipelineEngine::RegisterLoader(std::string dataset, loader::ILoaderPtr loader) {
  m_router->Register(std::move(dataset), std::move(loader));
}

boost::signals2::connection
PipelineEngine::OnEvent(const events::EngineEventSlot &handler) {
  return m_eventDispatcher->Subscribe(handler);
}

std::pair<size_t, size_t> PipelineEngine::ResolveSessions(SessionDate start,
                                                          SessionDate end) const {
  if (!start.ok() || !end.ok()) {
    throw InvalidDateRange(
        fmt::format("invalid date in range [{}, {}]", ToString(start), ToString(end)));
  }
  if (end < start) {
    throw InvalidDateRange(fmt::format("start {} is after end {}", ToString(start),
                                       ToString(end)));
  }
  const auto first = m_calendar.FirstOnOrAfter(start);
  const auto last = m_calendar.LastOnOrBefore(end);
  if (!first || !last || *first > *last) {
    throw InvalidDateRange(fmt::format("no trading sessions in [{}, {}]",
                                       ToString(start), ToString(end)));
  }
  return {*first, *last};
}

PipelineResult PipelineEngine::Run(const Pipeline &pipeline, SessionDate start,
                                   SessionDate end, const std::vector<AssetID> &assets,
                                   const RunOptions &options) const {
  return Run(pipeline.ToExecutionPlan(), start, end, assets, options);
}

PipelineResult PipelineEngine::Run(const graph::ExecutionPlan &plan, SessionDate start,
                                   SessionDate end, const std::vector<AssetID> &assets,
                                   const RunOptions &options) const {
  ValidateAssets(assets);
  const auto [startIndex, endIndex] = ResolveSessions(start, end);

  const auto lookback = static_cast<size_t>(plan.MaxExtraRows());
  if (m_config.strictLookback && lookback > startIndex) {
    throw WindowLengthTooLong(fmt::format(
        "pipeline needs {} sessions before {}, the calendar has {}", lookback,
        ToString(m_calendar.At(startIndex)), startIndex));
  }

  RunContext context(plan, m_calendar, *m_loader, assets, startIndex, endIndex,
                     *m_eventDispatcher, options.cancellationToken.get());
  const auto sessions = context.RangeLength();

  const auto startTime = events::Now();
  m_eventDispatcher->Emit(events::RunStartedEvent{
      .timestamp = startTime,
      .total_nodes = plan.size(),
      .total_assets = assets.size(),
      .total_sessions = sessions,
      .first_session = ToString(m_calendar.At(startIndex)),
      .last_session = ToString(m_calendar.At(endIndex))});
  SPDLOG_DEBUG("Running {} nodes over {} sessions x {} assets ({})", plan.size(),
               sessions, assets.size(), m_config.parallel ? "parallel" : "serial");

  try {
    const NodeExecutor executor(context);
    if (m_config.parallel && plan.size() > 1) {
      ExecuteFlowGraph(executor, context, m_config.maxConcurrency);
    } else {
      ExecuteSerial(executor, context);
    }
    context.ThrowIfCancelled("output assembly");

    auto result = OutputAssembler(context).Assemble(RunStatistics{
        .sessions = sessions,
        .nodesComputed = context.nodesComputed.load(),
        .loaderRequests = context.loaderRequests.load(),
        .peakCachedNodes = context.cache.GetPeakSize()});

    const auto duration = events::ToMillis(events::Now() - startTime);
    SPDLOG_DEBUG("Run completed in {}ms with {} rows", duration.count(),
                 result.num_rows());
    m_eventDispatcher->Emit(events::RunCompletedEvent{
        .timestamp = events::Now(),
        .duration = duration,
        .nodes_computed = context.nodesComputed.load(),
        .rows = result.num_rows()});
    return result;
  } catch (events::OperationCancelledException const &) {
    SPDLOG_WARN("Pipeline run cancelled after {} of {} nodes",
                context.nodesComputed.load(), plan.size());
    m_eventDispatcher->Emit(events::RunCancelledEvent{
        .timestamp = events::Now(),
        .elapsed = events::ToMillis(events::Now() - startTime),
        .nodes_completed = context.nodesComputed.load(),
        .nodes_total = plan.size()});
    throw;
  } catch (std::exception const &e) {
    SPDLOG_ERROR("Pipeline run failed: {}", e.what());
    m_eventDispatcher->Emit(events::RunFailedEvent{
        .timestamp = events::Now(),
        .elapsed = events::ToMillis(events::Now() - startTime),
        .error_message = e.what()});
    throw;
  }
}

PipelineResult PipelineEngine::RunChunked(const Pipeline &pipeline, SessionDate start,
                                          SessionDate end,
                                          const std::vector<AssetID> &assets,
                                          size_t chunkSize,
                                          const RunOptions &options) const {
  const auto chunk = chunkSize > 0 ? chunkSize : m_config.chunkSize;
  const auto plan = pipeline.ToExecutionPlan();
  if (chunk == 0) {
    return Run(plan, start, end, assets, options);
  }

  ValidateAssets(assets);
  const auto [first, last] = ResolveSessions(start, end);

  std::vector<PipelineResult> parts;
  for (size_t chunkStart = first; chunkStart <= last; chunkStart += chunk) {
    const auto chunkEnd = std::min(chunkStart + chunk - 1, last);
    SPDLOG_DEBUG("Running chunk [{}, {}]", ToString(m_calendar.At(chunkStart)),
                 ToString(m_calendar.At(chunkEnd)));
    parts.push_back(Run(plan, m_calendar.At(chunkStart), m_calendar.At(chunkEnd),
                        assets, options));
  }
  return PipelineResult::Concat(parts);
}

} // namespace epoch_pipeline::runtime
