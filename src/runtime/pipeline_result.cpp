#include <epoch_pipeline/runtime/pipeline_result.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <fmt/format.h>

namespace epoch_pipeline::runtime {

PipelineResult::PipelineResult(std::vector<SessionDate> dates,
                               std::vector<AssetID> assets,
                               std::vector<ResultColumn> columns,
                               RunStatistics statistics)
    : m_dates(std::move(dates)), m_assets(std::move(assets)),
      m_columns(std::move(columns)), m_statistics(statistics) {
  if (m_dates.size() != m_assets.size()) {
    throw std::invalid_argument(fmt::format("{} row dates for {} row assets",
                                            m_dates.size(), m_assets.size()));
  }
  for (auto const &column : m_columns) {
    if (column.values.size() != m_dates.size()) {
      throw std::invalid_argument(fmt::format("column '{}' has {} values for {} rows",
                                              column.name, column.values.size(),
                                              m_dates.size()));
    }
  }
}

std::vector<std::string> PipelineResult::GetColumnNames() const {
  std::vector<std::string> names;
  names.reserve(m_columns.size());
  for (auto const &column : m_columns) {
    names.push_back(column.name);
  }
  return names;
}

bool PipelineResult::HasColumn(std::string const &name) const {
  return std::ranges::any_of(m_columns,
                             [&](auto const &column) { return column.name == name; });
}

epoch_core::TermKind PipelineResult::GetKind(std::string const &name) const {
  return GetColumn(name).kind;
}

const ResultColumn &PipelineResult::GetColumn(std::string const &name) const {
  auto it = std::ranges::find(m_columns, name, &ResultColumn::name);
  if (it == m_columns.end()) {
    throw std::out_of_range(fmt::format("result has no column named '{}'", name));
  }
  return *it;
}

const ResultColumn &PipelineResult::GetColumn(std::string const &name,
                                              epoch_core::TermKind expected) const {
  auto const &column = GetColumn(name);
  if (column.kind != expected) {
    throw std::invalid_argument(
        fmt::format("column '{}' is a {}, not a {}", name,
                    epoch_core::TermKindWrapper::ToString(column.kind),
                    epoch_core::TermKindWrapper::ToString(expected)));
  }
  return column;
}

std::vector<double> PipelineResult::GetFactor(std::string const &name) const {
  return GetColumn(name, epoch_core::TermKind::Factor).values;
}

std::vector<bool> PipelineResult::GetFilter(std::string const &name) const {
  auto const &column = GetColumn(name, epoch_core::TermKind::Filter);
  std::vector<bool> values(column.values.size());
  std::ranges::transform(column.values, values.begin(),
                         [](double v) { return v != 0.0 && !std::isnan(v); });
  return values;
}

std::vector<int64_t> PipelineResult::GetClassifier(std::string const &name) const {
  auto const &column = GetColumn(name, epoch_core::TermKind::Classifier);
  std::vector<int64_t> values(column.values.size());
  std::ranges::transform(column.values, values.begin(), [](double v) {
    const bool representable =
        std::isfinite(v) && v >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        v < static_cast<double>(std::numeric_limits<int64_t>::max());
    return representable ? static_cast<int64_t>(v) : MISSING_LABEL;
  });
  return values;
}

std::optional<size_t> PipelineResult::FindRow(SessionDate date,
                                              AssetID const &asset) const {
  // Rows are sorted by date; only the assets within one date need a scan.
  auto [first, last] = std::equal_range(m_dates.begin(), m_dates.end(), date);
  for (auto it = first; it != last; ++it) {
    const auto row = static_cast<size_t>(it - m_dates.begin());
    if (m_assets[row] == asset) {
      return row;
    }
  }
  return std::nullopt;
}

double PipelineResult::GetValue(std::string const &name, size_t row) const {
  return GetColumn(name).values.at(row);
}

epoch_frame::DataFrame PipelineResult::ToDataFrame() const {
  std::vector<epoch_frame::DateTime> timestamps;
  timestamps.reserve(m_dates.size());
  for (auto const &date : m_dates) {
    timestamps.emplace_back(ToDateTime(date));
  }
  auto index = epoch_frame::factory::index::make_datetime_index(timestamps, "", "UTC");

  std::vector<arrow::ChunkedArrayPtr> arrays;
  std::vector<std::string> names;
  arrays.reserve(m_columns.size() + 1);
  names.reserve(m_columns.size() + 1);

  arrays.push_back(epoch_frame::factory::array::make_array(m_assets));
  names.emplace_back(ASSET_COLUMN);

  for (auto const &column : m_columns) {
    switch (column.kind) {
    case epoch_core::TermKind::Filter:
      arrays.push_back(epoch_frame::factory::array::make_array(GetFilter(column.name)));
      break;
    case epoch_core::TermKind::Classifier:
      arrays.push_back(
          epoch_frame::factory::array::make_array(GetClassifier(column.name)));
      break;
    default:
      arrays.push_back(epoch_frame::factory::array::make_array(column.values));
      break;
    }
    names.push_back(column.name);
  }
  return epoch_frame::make_dataframe(index, arrays, names);
}

PipelineResult PipelineResult::Concat(std::vector<PipelineResult> const &parts) {
  if (parts.empty()) {
    return {};
  }
  std::vector<SessionDate> dates;
  std::vector<AssetID> assets;
  std::vector<ResultColumn> columns;
  RunStatistics statistics;

  for (auto const &column : parts.front().m_columns) {
    columns.push_back(ResultColumn{.name = column.name, .kind = column.kind, .values = {}});
  }

  for (auto const &part : parts) {
    if (part.m_columns.size() != columns.size()) {
      throw std::invalid_argument("cannot concatenate results with different columns");
    }
    dates.insert(dates.end(), part.m_dates.begin(), part.m_dates.end());
    assets.insert(assets.end(), part.m_assets.begin(), part.m_assets.end());
    for (size_t i = 0; i < columns.size(); ++i) {
      if (part.m_columns[i].name != columns[i].name) {
        throw std::invalid_argument(fmt::format(
            "cannot concatenate column '{}' with '{}'", columns[i].name,
            part.m_columns[i].name));
      }
      auto const &values = part.m_columns[i].values;
      columns[i].values.insert(columns[i].values.end(), values.begin(), values.end());
    }
    auto const &s = part.m_statistics;
    statistics.sessions += s.sessions;
    statistics.nodesComputed += s.nodesComputed;
    statistics.loaderRequests += s.loaderRequests;
    statistics.peakCachedNodes = std::max(statistics.peakCachedNodes, s.peakCachedNodes);
  }
  return PipelineResult(std::move(dates), std::move(assets), std::move(columns),
                        statistics);
}

} // namespace epoch_pipeline::runtime
