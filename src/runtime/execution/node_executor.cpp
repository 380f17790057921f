#include "node_executor.h"

#include <cmath>
#include <optional>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/loader/panel.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_pipeline::runtime {

namespace {
// Cancellation is polled once per block of output days.
constexpr size_t CANCELLATION_POLL_ROWS = 64;
} // namespace

void NormalizeFilter(arma::mat &panel) {
  panel.transform([](double v) { return (std::isnan(v) || v == 0.0) ? 0.0 : 1.0; });
}

void NodeExecutor::Execute(size_t index) const {
  auto const &node = m_context.plan.GetNode(index);
  auto const &term = *node.term;
  const auto description = term.ToString();
  m_context.ThrowIfCancelled(description);

  const auto started = events::Now();
  m_context.dispatcher.Emit(events::NodeStartedEvent{
      .timestamp = started,
      .node_index = index,
      .term = description,
      .compute_id = term.GetComputeId(),
      .is_leaf = term.IsLoadable()});

  auto panel = term.IsLoadable() ? Load(node) : Compute(node);
  const auto rows = static_cast<size_t>(panel.n_rows);
  m_context.cache.Store(node.term, std::move(panel));
  ++m_context.nodesComputed;
  ReleaseDependencies(node);

  const auto duration = events::ToMillis(events::Now() - started);
  SPDLOG_DEBUG("Node {} {} produced {} rows in {}ms", index, description, rows,
               duration.count());
  m_context.dispatcher.Emit(events::NodeCompletedEvent{
      .timestamp = events::Now(),
      .node_index = index,
      .term = description,
      .duration = duration,
      .rows = rows});
}

arma::mat NodeExecutor::Load(const graph::PlanNode &node) const {
  auto const &term = *node.term;
  auto const &assets = m_context.assets;
  const auto rows = m_context.RowsFor(node);
  const auto extra = static_cast<size_t>(node.extraRows);
  // Lookback reaching before the first session is padded with missing rows.
  const auto padding = extra > m_context.startIndex ? extra - m_context.startIndex : 0;
  const auto first = m_context.startIndex - (extra - padding);
  const DateRange range{m_context.calendar.At(first),
                        m_context.calendar.At(m_context.endIndex)};
  const auto expectedRows = m_context.endIndex - first + 1;

  ++m_context.loaderRequests;
  const auto frame = [&] {
    try {
      return m_context.loader.LoadWindow(term, range, assets);
    } catch (events::OperationCancelledException const &) {
      throw;
    } catch (std::exception const &e) {
      throw LoaderFailure(term.ToString(), range, assets, e.what());
    }
  }();

  if (frame.num_rows() != expectedRows) {
    throw LoaderFailure(term.ToString(), range, assets,
                        fmt::format("expected {} rows, got {}", expectedRows,
                                    frame.num_rows()));
  }
  arma::mat loaded;
  try {
    loaded = loader::PanelFromDataFrame(frame, assets);
  } catch (std::exception const &e) {
    throw LoaderFailure(term.ToString(), range, assets, e.what());
  }

  arma::mat panel(rows, assets.size());
  panel.fill(MissingValue(term.GetKind()));
  if (!assets.empty()) {
    panel.rows(padding, rows - 1) = loaded;
  }
  if (term.IsFilter()) {
    NormalizeFilter(panel);
  }
  return panel;
}

arma::mat NodeExecutor::TrailingRows(size_t index, size_t rows) const {
  auto const &source = m_context.plan.GetNode(index);
  const auto panel = m_context.cache.Get(source.term);
  if (panel->n_rows < rows) {
    throw std::logic_error(fmt::format("{} holds {} rows, {} needed",
                                       source.term->ToString(), panel->n_rows, rows));
  }
  if (rows == 0) {
    return arma::mat(0, panel->n_cols);
  }
  const auto offset = panel->n_rows - rows;
  return panel->rows(offset, panel->n_rows - 1);
}

arma::mat NodeExecutor::Compute(const graph::PlanNode &node) const {
  auto const &term = *node.term;
  auto const &compute = term.GetCompute();
  const auto description = term.ToString();
  const auto window = static_cast<size_t>(term.GetEffectiveWindow());
  const auto rows = m_context.RowsFor(node);
  const auto inputRows = rows + window - 1;
  const auto assetCount = m_context.assets.size();

  std::vector<arma::mat> inputs;
  inputs.reserve(node.inputs.size());
  for (auto index : node.inputs) {
    inputs.emplace_back(TrailingRows(index, inputRows));
  }

  std::optional<arma::mat> mask;
  if (node.mask) {
    mask = TrailingRows(*node.mask, inputRows);
    const arma::uvec excluded = arma::find(*mask == 0.0);
    for (size_t i = 0; i < inputs.size(); ++i) {
      const auto kind = m_context.plan.GetNode(node.inputs[i]).term->GetKind();
      inputs[i].elem(excluded).fill(MissingValue(kind));
    }
  }

  const auto missing = MissingValue(term.GetKind());
  const auto firstSession =
      static_cast<int64_t>(m_context.startIndex) - node.extraRows;

  arma::mat panel(rows, assetCount);
  std::vector<arma::mat> windows(inputs.size());
  for (size_t t = 0; t < rows; ++t) {
    if (t % CANCELLATION_POLL_ROWS == 0) {
      m_context.ThrowIfCancelled(description);
    }
    const auto session = firstSession + static_cast<int64_t>(t);
    if (session < 0) {
      panel.row(t).fill(missing);
      continue;
    }
    for (size_t i = 0; i < inputs.size(); ++i) {
      windows[i] = inputs[i].rows(t, t + window - 1);
    }

    const term::ComputeWindow computeWindow{
        .today = m_context.calendar.At(static_cast<size_t>(session)),
        .assets = m_context.assets,
        .inputs = windows,
        .params = term.GetParams(),
        .windowLength = term.GetWindowLength()};
    arma::rowvec values = compute.Compute(computeWindow);
    if (values.n_elem != assetCount) {
      throw std::runtime_error(fmt::format("{} produced {} values for {} assets",
                                           description, values.n_elem, assetCount));
    }

    if (mask) {
      const auto today = t + window - 1;
      for (size_t j = 0; j < assetCount; ++j) {
        if ((*mask)(today, j) == 0.0) {
          values(j) = missing;
        }
      }
    }
    panel.row(t) = values;
  }

  if (term.IsFilter()) {
    NormalizeFilter(panel);
  }
  return panel;
}

void NodeExecutor::ReleaseDependencies(const graph::PlanNode &node) const {
  for (auto index : node.Dependencies()) {
    if (m_context.pendingConsumers[index].fetch_sub(1) != 1) {
      continue;
    }
    auto const &dependency = m_context.plan.GetNode(index);
    if (!dependency.retained) {
      m_context.cache.Release(dependency.term);
    }
  }
}

} // namespace epoch_pipeline::runtime
