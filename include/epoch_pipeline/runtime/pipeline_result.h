#pragma once
#include <epoch_frame/dataframe.h>
#include <epoch_pipeline/core/constants.h>
#include <epoch_pipeline/core/session_date.h>
#include <optional>
#include <string>
#include <vector>

namespace epoch_pipeline::runtime {

struct RunStatistics {
  size_t sessions{0};
  size_t nodesComputed{0};
  // Leaf windows requested by the run.
  size_t loaderRequests{0};
  // Largest number of node outputs held by the run-local cache at once.
  size_t peakCachedNodes{0};
};

// Cell values of one output column, in the double encoding used internally:
// factors as numbers (NaN when missing), filters as 0/1, classifiers as
// labels (NaN when missing).
struct ResultColumn {
  std::string name;
  epoch_core::TermKind kind;
  std::vector<double> values;
};

// Evaluated pipeline table. One row per (session, asset) pair that passed the
// screen, ordered by session then by the order of the requested universe.
class PipelineResult {
public:
  static constexpr auto ASSET_COLUMN = "asset";

  PipelineResult() = default;
  PipelineResult(std::vector<SessionDate> dates, std::vector<AssetID> assets,
                 std::vector<ResultColumn> columns, RunStatistics statistics = {});

  [[nodiscard]] size_t num_rows() const noexcept { return m_dates.size(); }
  [[nodiscard]] bool empty() const noexcept { return m_dates.empty(); }

  [[nodiscard]] const std::vector<SessionDate> &GetDates() const noexcept {
    return m_dates;
  }
  [[nodiscard]] const std::vector<AssetID> &GetAssets() const noexcept {
    return m_assets;
  }
  [[nodiscard]] std::vector<std::string> GetColumnNames() const;
  [[nodiscard]] bool HasColumn(std::string const &name) const;
  [[nodiscard]] epoch_core::TermKind GetKind(std::string const &name) const;

  // Typed column access. Each throws std::out_of_range for unknown names and
  // std::invalid_argument when the column holds another kind.
  [[nodiscard]] std::vector<double> GetFactor(std::string const &name) const;
  [[nodiscard]] std::vector<bool> GetFilter(std::string const &name) const;
  // Missing labels are MISSING_LABEL.
  [[nodiscard]] std::vector<int64_t> GetClassifier(std::string const &name) const;

  [[nodiscard]] std::optional<size_t> FindRow(SessionDate date,
                                              AssetID const &asset) const;
  [[nodiscard]] double GetValue(std::string const &name, size_t row) const;

  [[nodiscard]] const RunStatistics &GetStatistics() const noexcept {
    return m_statistics;
  }

  // Datetime index, an `asset` column and one column per output: float64
  // factors, boolean filters and int64 classifiers.
  [[nodiscard]] epoch_frame::DataFrame ToDataFrame() const;

  // Appends the rows of consecutive, non-overlapping runs of the same
  // pipeline. Statistics are summed, except the peak which is the maximum.
  static PipelineResult Concat(std::vector<PipelineResult> const &parts);

private:
  const ResultColumn &GetColumn(std::string const &name) const;
  const ResultColumn &GetColumn(std::string const &name,
                                epoch_core::TermKind expected) const;

  std::vector<SessionDate> m_dates;
  std::vector<AssetID> m_assets;
  std::vector<ResultColumn> m_columns;
  RunStatistics m_statistics;
};

} // namespace epoch_pipeline::runtime
