#include <epoch_pipeline/loader/in_memory_loader.h>

#include <epoch_pipeline/loader/panel.h>
#include <epoch_pipeline/terms/dataset.h>

#include <fmt/format.h>
#include <mutex>

namespace epoch_pipeline::loader {

std::string ColumnKey(const term::ColumnRef &column) {
  return fmt::format("{}.{}", column.dataset, column.column);
}

arma::mat SlicePanel(const arma::mat &panel,
                     const std::unordered_map<AssetID, size_t> &panelAssets,
                     size_t first, size_t last,
                     const std::vector<AssetID> &assets) {
  arma::mat window(last - first + 1, assets.size());
  for (size_t j = 0; j < assets.size(); ++j) {
    auto it = panelAssets.find(assets[j]);
    if (it == panelAssets.end()) {
      throw std::out_of_range(fmt::format("unknown asset '{}'", assets[j]));
    }
    window.col(j) = panel.col(it->second).rows(first, last);
  }
  return window;
}

InMemoryLoader::InMemoryLoader(TradingCalendar calendar, std::vector<AssetID> assets)
    : m_calendar(std::move(calendar)), m_assets(std::move(assets)) {
  for (size_t j = 0; j < m_assets.size(); ++j) {
    if (!m_assetIndex.emplace(m_assets[j], j).second) {
      throw std::invalid_argument(
          fmt::format("duplicate asset '{}' in loader universe", m_assets[j]));
    }
  }
}

void InMemoryLoader::AddColumn(const term::ColumnRef &column, arma::mat values) {
  if (values.n_rows != m_calendar.size() || values.n_cols != m_assets.size()) {
    throw std::invalid_argument(fmt::format(
        "{}: expected a {}x{} panel, got {}x{}", ColumnKey(column),
        m_calendar.size(), m_assets.size(), values.n_rows, values.n_cols));
  }
  std::unique_lock lock(m_columnsMutex);
  m_columns.insert_or_assign(ColumnKey(column), std::move(values));
}

void InMemoryLoader::AddColumn(const term::ColumnRef &column,
                               const epoch_frame::DataFrame &frame) {
  AddColumn(column, PanelFromDataFrame(frame, m_assets));
}

epoch_frame::DataFrame
InMemoryLoader::LoadWindow(const term::Term &column, const DateRange &range,
                           const std::vector<AssetID> &assets) const {
  const auto ref = term::GetColumnRef(column);
  if (!ref) {
    throw std::invalid_argument(
        fmt::format("{} is not a dataset column", column.ToString()));
  }
  const auto first = m_calendar.IndexOf(range.first);
  const auto last = m_calendar.IndexOf(range.last);

  std::shared_lock lock(m_columnsMutex);
  auto it = m_columns.find(ColumnKey(*ref));
  if (it == m_columns.end()) {
    throw std::out_of_range(
        fmt::format("no data registered for column {}", ColumnKey(*ref)));
  }
  auto window = SlicePanel(it->second, m_assetIndex, first, last, assets);
  lock.unlock();

  return PanelToDataFrame(window, m_calendar.Slice(first, last), assets);
}

} // namespace epoch_pipeline::loader
