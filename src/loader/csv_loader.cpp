#include <epoch_pipeline/loader/csv_loader.h>

#include <epoch_pipeline/loader/in_memory_loader.h>
#include <epoch_pipeline/loader/panel.h>
#include <epoch_pipeline/terms/dataset.h>

#include <arrow/api.h>
#include <epoch_frame/serialization.h>
#include <epoch_frame/series.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace epoch_pipeline::loader {

CsvDirectoryLoader::CsvDirectoryLoader(std::filesystem::path directory,
                                       TradingCalendar calendar)
    : m_directory(std::move(directory)), m_calendar(std::move(calendar)) {
  if (!std::filesystem::is_directory(m_directory)) {
    throw std::invalid_argument(
        fmt::format("data directory '{}' does not exist", m_directory.string()));
  }
}

std::filesystem::path
CsvDirectoryLoader::GetColumnPath(const term::ColumnRef &column) const {
  return m_directory / fmt::format("{}.{}.csv", column.dataset, column.column);
}

CsvDirectoryLoader::ColumnFilePtr
CsvDirectoryLoader::GetColumnFile(const term::ColumnRef &column) const {
  const auto key = ColumnKey(column);
  {
    std::lock_guard lock(m_filesMutex);
    if (auto it = m_files.find(key); it != m_files.end()) {
      return it->second;
    }
  }

  // parse outside the lock, first writer wins
  auto file = ReadColumnFile(column);
  std::lock_guard lock(m_filesMutex);
  return m_files.emplace(key, std::move(file)).first->second;
}

CsvDirectoryLoader::ColumnFilePtr
CsvDirectoryLoader::ReadColumnFile(const term::ColumnRef &column) const {
  const auto path = GetColumnPath(column);
  auto result = epoch_frame::read_csv_file(path.string(), epoch_frame::CSVReadOptions{});
  if (!result.ok()) {
    throw std::runtime_error(fmt::format("failed to read {}: {}", path.string(),
                                         result.status().ToString()));
  }
  auto frame = result.ValueOrDie();
  if (!frame.contains(DATE_COLUMN)) {
    throw std::runtime_error(
        fmt::format("{} has no '{}' column", path.string(), DATE_COLUMN));
  }

  std::vector<AssetID> assets;
  for (auto const &name : frame.column_names()) {
    if (name != DATE_COLUMN) {
      assets.emplace_back(name);
    }
  }
  const auto values = PanelFromDataFrame(frame, assets);
  const auto dates = std::static_pointer_cast<arrow::StringArray>(
      frame[DATE_COLUMN].contiguous_array().cast(arrow::utf8()).value());

  auto file = std::make_shared<ColumnFile>();
  file->values.set_size(m_calendar.size(), assets.size());
  file->values.fill(MISSING_FACTOR);
  for (size_t j = 0; j < assets.size(); ++j) {
    file->assets.emplace(assets[j], j);
  }

  size_t skipped = 0;
  for (int64_t i = 0; i < dates->length(); ++i) {
    if (dates->IsNull(i)) {
      ++skipped;
      continue;
    }
    const auto session = ParseSessionDate(dates->GetView(i));
    if (!m_calendar.IsSession(session)) {
      ++skipped;
      continue;
    }
    file->values.row(m_calendar.IndexOf(session)) = values.row(static_cast<arma::uword>(i));
  }

  SPDLOG_DEBUG("Read {} ({} rows, {} assets, {} non-session rows skipped)",
               path.string(), dates->length(), assets.size(), skipped);
  return file;
}

epoch_frame::DataFrame
CsvDirectoryLoader::LoadWindow(const term::Term &column, const DateRange &range,
                               const std::vector<AssetID> &assets) const {
  const auto ref = term::GetColumnRef(column);
  if (!ref) {
    throw std::invalid_argument(
        fmt::format("{} is not a dataset column", column.ToString()));
  }
  const auto first = m_calendar.IndexOf(range.first);
  const auto last = m_calendar.IndexOf(range.last);

  const auto file = GetColumnFile(*ref);
  auto window = SlicePanel(file->values, file->assets, first, last, assets);
  return PanelToDataFrame(window, m_calendar.Slice(first, last), assets);
}

} // namespace epoch_pipeline::loader
