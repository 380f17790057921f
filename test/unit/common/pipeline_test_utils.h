#pragma once

#include <algorithm>
#include <armadillo>
#include <atomic>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <epoch_core/catch_defs.h>
#include <epoch_pipeline/core/calendar.h>
#include <epoch_pipeline/loader/in_memory_loader.h>
#include <epoch_pipeline/terms/dataset.h>
#include <memory>
#include <mutex>
#include <string>
#include <trompeloeil.hpp>
#include <vector>

namespace epoch_pipeline::test {

using namespace std::chrono_literals;

inline SessionDate Day(int year, unsigned month, unsigned day) {
  return SessionDate{std::chrono::year{year}, std::chrono::month{month},
                     std::chrono::day{day}};
}

// Weekday sessions starting Monday 2024-01-01.
inline TradingCalendar MakeCalendar(size_t sessions) {
  std::vector<SessionDate> dates;
  std::chrono::sys_days day{Day(2024, 1, 1)};
  while (dates.size() < sessions) {
    const std::chrono::weekday weekday{day};
    if (weekday != std::chrono::Saturday && weekday != std::chrono::Sunday) {
      dates.emplace_back(day);
    }
    day += std::chrono::days{1};
  }
  return TradingCalendar(std::move(dates));
}

// Panel whose column j holds `values[j]`, one row per session.
inline arma::mat MakePanel(std::vector<std::vector<double>> const &columns) {
  const auto rows = columns.empty() ? 0 : columns.front().size();
  arma::mat panel(rows, columns.size());
  for (size_t j = 0; j < columns.size(); ++j) {
    panel.col(j) = arma::vec(columns[j]);
  }
  return panel;
}

inline std::shared_ptr<loader::InMemoryLoader>
MakeLoader(TradingCalendar const &calendar, std::vector<AssetID> const &assets) {
  return std::make_shared<loader::InMemoryLoader>(calendar, assets);
}

// Element-wise comparison treating NaN as equal to NaN.
inline void RequireValues(std::vector<double> const &actual,
                          std::vector<double> const &expected,
                          double epsilon = 1e-9) {
  REQUIRE(actual.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    INFO("index " << i);
    if (std::isnan(expected[i])) {
      REQUIRE(std::isnan(actual[i]));
    } else {
      REQUIRE(actual[i] == Catch::Approx(expected[i]).margin(epsilon));
    }
  }
}

inline void RequireValues(arma::rowvec const &actual,
                          std::vector<double> const &expected,
                          double epsilon = 1e-9) {
  RequireValues(arma::conv_to<std::vector<double>>::from(actual), expected, epsilon);
}

// Runs one compute step of `term` on the given input windows.
inline arma::rowvec ApplyCompute(term::TermPtr const &term,
                                 std::vector<arma::mat> const &inputs) {
  std::vector<AssetID> assets;
  for (arma::uword j = 0; j < inputs.front().n_cols; ++j) {
    assets.emplace_back("A" + std::to_string(j));
  }
  return term->GetCompute().Compute(term::ComputeWindow{
      .today = Day(2024, 1, 31),
      .assets = assets,
      .inputs = inputs,
      .params = term->GetParams(),
      .windowLength = term->GetWindowLength()});
}

// Forwards to another loader and records every request.
class RecordingLoader final : public loader::ILoader {
public:
  struct Request {
    std::string column;
    DateRange range;
    std::vector<AssetID> assets;
  };

  explicit RecordingLoader(loader::ILoaderPtr inner) : m_inner(std::move(inner)) {}

  [[nodiscard]] epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const override {
    {
      std::lock_guard lock(m_mutex);
      m_requests.push_back(Request{column.ToString(), range, assets});
    }
    return m_inner->LoadWindow(column, range, assets);
  }

  [[nodiscard]] std::vector<Request> GetRequests() const {
    std::lock_guard lock(m_mutex);
    return m_requests;
  }

  [[nodiscard]] size_t CountFor(std::string const &column) const {
    std::lock_guard lock(m_mutex);
    return static_cast<size_t>(std::ranges::count(m_requests, column, &Request::column));
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard lock(m_mutex);
    return m_requests.size();
  }

private:
  loader::ILoaderPtr m_inner;
  mutable std::mutex m_mutex;
  mutable std::vector<Request> m_requests;
};

class MockLoader : public loader::ILoader {
public:
  MAKE_CONST_MOCK3(LoadWindow,
                   epoch_frame::DataFrame(const term::Term &, const DateRange &,
                                          const std::vector<AssetID> &),
                   override);
};

} // namespace epoch_pipeline::test
