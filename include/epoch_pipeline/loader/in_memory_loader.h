#pragma once
#include "iloader.h"
#include <armadillo>
#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/terms/compute.h>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace epoch_pipeline::loader {

// Serves dataset columns from calendar-aligned panels held in memory. Each
// panel has one row per calendar session and one column per universe asset.
class InMemoryLoader final : public ILoader {
public:
  InMemoryLoader(TradingCalendar calendar, std::vector<AssetID> assets);

  void AddColumn(const term::ColumnRef &column, arma::mat values);
  // Frame rows follow the calendar sessions, columns are named by asset.
  void AddColumn(const term::ColumnRef &column, const epoch_frame::DataFrame &frame);

  [[nodiscard]] epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const override;

  [[nodiscard]] const TradingCalendar &GetCalendar() const noexcept {
    return m_calendar;
  }
  [[nodiscard]] const std::vector<AssetID> &GetAssets() const noexcept {
    return m_assets;
  }

private:
  TradingCalendar m_calendar;
  std::vector<AssetID> m_assets;
  std::unordered_map<AssetID, size_t> m_assetIndex;

  mutable std::shared_mutex m_columnsMutex;
  std::unordered_map<std::string, arma::mat> m_columns;
};

// Slices rows [first, last] and the requested asset columns out of a panel
// whose columns follow `panelAssets`.
arma::mat SlicePanel(const arma::mat &panel,
                     const std::unordered_map<AssetID, size_t> &panelAssets,
                     size_t first, size_t last,
                     const std::vector<AssetID> &assets);

std::string ColumnKey(const term::ColumnRef &column);

} // namespace epoch_pipeline::loader
