#include <epoch_pipeline/loader/panel.h>
#include <epoch_pipeline/core/constants.h>

#include <arrow/api.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/series.h>
#include <fmt/format.h>

namespace epoch_pipeline::loader {

epoch_frame::DataFrame PanelToDataFrame(const arma::mat &panel,
                                        const std::vector<SessionDate> &sessions,
                                        const std::vector<AssetID> &assets) {
  if (panel.n_rows != sessions.size() || panel.n_cols != assets.size()) {
    throw std::runtime_error(fmt::format(
        "panel shape {}x{} does not match {} sessions x {} assets", panel.n_rows,
        panel.n_cols, sessions.size(), assets.size()));
  }

  std::vector<epoch_frame::DateTime> timestamps;
  timestamps.reserve(sessions.size());
  for (auto const &session : sessions) {
    timestamps.emplace_back(ToDateTime(session));
  }
  auto index = epoch_frame::factory::index::make_datetime_index(timestamps, "", "UTC");

  std::vector<arrow::ChunkedArrayPtr> columns;
  columns.reserve(assets.size());
  for (arma::uword j = 0; j < panel.n_cols; ++j) {
    const double *data = panel.colptr(j);
    columns.emplace_back(
        epoch_frame::factory::array::make_array<double>(data, data + panel.n_rows));
  }
  return epoch_frame::make_dataframe(index, columns, assets);
}

arma::mat PanelFromDataFrame(const epoch_frame::DataFrame &frame,
                             const std::vector<AssetID> &assets) {
  const auto rows = frame.num_rows();
  arma::mat panel(rows, assets.size());

  for (size_t j = 0; j < assets.size(); ++j) {
    if (!frame.contains(assets[j])) {
      throw std::runtime_error(
          fmt::format("frame has no column for asset '{}'", assets[j]));
    }
    auto column = frame[assets[j]].contiguous_array();
    if (column.type()->id() != arrow::Type::DOUBLE) {
      column = column.cast(arrow::float64());
    }
    const auto view = column.template to_view<double>();
    for (size_t i = 0; i < rows; ++i) {
      const auto row = static_cast<int64_t>(i);
      panel(i, j) = view->IsNull(row) ? MISSING_FACTOR : view->Value(row);
    }
  }
  return panel;
}

} // namespace epoch_pipeline::loader
