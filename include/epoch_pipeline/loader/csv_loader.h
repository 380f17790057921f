#pragma once
#include "iloader.h"
#include <armadillo>
#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/terms/compute.h>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace epoch_pipeline::loader {

// Reads dataset columns from `<directory>/<dataset>.<column>.csv`. Each file
// holds a `date` column (YYYY-MM-DD) and one column per asset. Rows are
// aligned to the calendar; sessions absent from the file are missing, rows
// that are not sessions are ignored. Files are read once and kept.
class CsvDirectoryLoader final : public ILoader {
public:
  static constexpr auto DATE_COLUMN = "date";

  CsvDirectoryLoader(std::filesystem::path directory, TradingCalendar calendar);

  [[nodiscard]] epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const override;

  [[nodiscard]] std::filesystem::path
  GetColumnPath(const term::ColumnRef &column) const;

private:
  struct ColumnFile {
    std::unordered_map<AssetID, size_t> assets;
    arma::mat values;
  };
  using ColumnFilePtr = std::shared_ptr<const ColumnFile>;

  ColumnFilePtr GetColumnFile(const term::ColumnRef &column) const;
  ColumnFilePtr ReadColumnFile(const term::ColumnRef &column) const;

  std::filesystem::path m_directory;
  TradingCalendar m_calendar;

  mutable std::mutex m_filesMutex;
  mutable std::unordered_map<std::string, ColumnFilePtr> m_files;
};

} // namespace epoch_pipeline::loader
