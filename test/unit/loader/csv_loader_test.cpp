#include "common/pipeline_test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/loader/csv_loader.h>
#include <epoch_pipeline/loader/panel.h>
#include <chrono>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>

using namespace epoch_pipeline;
using namespace epoch_pipeline::loader;
using epoch_pipeline::test::Day;
using epoch_pipeline::test::MakeCalendar;
using epoch_pipeline::test::RequireValues;

namespace {
constexpr double NaN = MISSING_FACTOR;

class TempDirectory {
public:
  TempDirectory()
      : m_path(std::filesystem::temp_directory_path() /
               fmt::format("epoch_pipeline_csv_{}",
                           std::chrono::steady_clock::now().time_since_epoch().count())) {
    std::filesystem::create_directories(m_path);
  }
  ~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  void Write(std::string const &name, std::string const &content) const {
    std::ofstream(m_path / name) << content;
  }

  [[nodiscard]] const std::filesystem::path &Path() const { return m_path; }

private:
  std::filesystem::path m_path;
};

std::vector<double> Column(const epoch_frame::DataFrame &frame, AssetID const &asset) {
  return arma::conv_to<std::vector<double>>::from(PanelFromDataFrame(frame, {asset}).col(0));
}
} // namespace

TEST_CASE("CsvDirectoryLoader - reads calendar aligned columns", "[loader][csv]") {
  TempDirectory directory;
  directory.Write("EquityPricing.close.csv", "date,AAPL,MSFT\n"
                                             "2024-01-01,1,10\n"
                                             "2024-01-02,2,\n"
                                             "2024-01-06,99,99\n"
                                             "2024-01-03,3,30\n");

  CsvDirectoryLoader loader(directory.Path(), MakeCalendar(5));
  const auto close = term::EquityPricing::Close();
  const DateRange range{Day(2024, 1, 1), Day(2024, 1, 5)};

  SECTION("Missing sessions and empty cells are missing values") {
    const auto frame = loader.LoadWindow(*close, range, {"MSFT", "AAPL"});
    REQUIRE(frame.num_rows() == 5);
    RequireValues(Column(frame, "MSFT"), {10, NaN, 30, NaN, NaN});
    RequireValues(Column(frame, "AAPL"), {1, 2, 3, NaN, NaN});
  }

  SECTION("Sub-ranges") {
    const auto frame = loader.LoadWindow(*close, {Day(2024, 1, 2), Day(2024, 1, 3)}, {"AAPL"});
    RequireValues(Column(frame, "AAPL"), {2, 3});
  }

  SECTION("Failures") {
    REQUIRE(loader.GetColumnPath({EQUITY_PRICING_DATASET, "open"}) ==
            directory.Path() / "EquityPricing.open.csv");
    REQUIRE_THROWS_AS(loader.LoadWindow(*term::EquityPricing::Open(), range, {"AAPL"}),
                      std::runtime_error);
    REQUIRE_THROWS_AS(loader.LoadWindow(*close, range, {"GOOG"}), std::out_of_range);
    REQUIRE_THROWS_AS(CsvDirectoryLoader(directory.Path() / "missing", MakeCalendar(5)),
                      std::invalid_argument);
  }
}

TEST_CASE("CsvDirectoryLoader - sample data", "[loader][csv]") {
  const auto calendar =
      TradingCalendar::BusinessDays(Day(2024, 1, 1), Day(2024, 1, 31));
  CsvDirectoryLoader loader(std::filesystem::path{EPOCH_PIPELINE_TEST_DATA_DIR} / "equity",
                            calendar);

  const auto frame = loader.LoadWindow(*term::EquityPricing::Close(),
                                       {Day(2024, 1, 12), Day(2024, 1, 16)}, {"MSFT"});
  RequireValues(Column(frame, "MSFT"), {367.5, NaN, 364.5});

  const auto volume = loader.LoadWindow(*term::EquityPricing::Volume(),
                                        {Day(2024, 1, 31), Day(2024, 1, 31)}, {"SPY"});
  RequireValues(Column(volume, "SPY"), {47800000});
}
