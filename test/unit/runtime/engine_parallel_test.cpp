#include "common/pipeline_test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <epoch_pipeline/runtime/engine.h>
#include <epoch_pipeline/terms/builtins.h>
#include <cmath>
#include <fmt/format.h>
#include <optional>
#include <thread>

using namespace epoch_pipeline;
using namespace epoch_pipeline::runtime;
using namespace epoch_pipeline::term;
using epoch_pipeline::test::Day;
using epoch_pipeline::test::MakeCalendar;
using epoch_pipeline::test::RequireValues;

namespace {

constexpr size_t kSessions = 120;

std::vector<AssetID> MakeUniverse(size_t count) {
  std::vector<AssetID> assets;
  for (size_t j = 0; j < count; ++j) {
    assets.emplace_back(fmt::format("ASSET{:02}", j));
  }
  return assets;
}

// Deterministic, non-trivial prices and volumes with a few gaps.
std::shared_ptr<loader::InMemoryLoader> MakeMarketLoader(std::vector<AssetID> const &assets) {
  auto loader = test::MakeLoader(MakeCalendar(kSessions), assets);
  arma::mat close(kSessions, assets.size());
  arma::mat volume(kSessions, assets.size());
  for (size_t i = 0; i < kSessions; ++i) {
    for (size_t j = 0; j < assets.size(); ++j) {
      const auto t = static_cast<double>(i);
      const auto a = static_cast<double>(j + 1);
      close(i, j) = 50.0 + a * 3.0 + 5.0 * std::sin(t / (2.0 + a)) + 0.1 * t * a;
      volume(i, j) = 1000.0 * (1.0 + std::fmod(t * a, 7.0));
    }
  }
  close(10, 1) = MISSING_FACTOR;
  close(57, 3) = MISSING_FACTOR;
  loader->AddColumn({EQUITY_PRICING_DATASET, "close"}, close);
  loader->AddColumn({EQUITY_PRICING_DATASET, "volume"}, volume);
  return loader;
}

Pipeline MakeWidePipeline() {
  const auto close = EquityPricing::Close();
  const auto volume = EquityPricing::Volume();
  const auto liquid = Greater(SimpleMovingAverage(volume, 5), 2500.0);
  const auto momentum = Returns(20);
  const auto sector = Quantiles(SimpleMovingAverage(close, 10), 3);

  return Pipeline({{"sma_10", SimpleMovingAverage(close, 10)},
                   {"sma_30", SimpleMovingAverage(close, 30)},
                   {"momentum", momentum},
                   {"momentum_rank", Rank(momentum, false, liquid)},
                   {"rsi", RSI()},
                   {"vwap", VWAP(10)},
                   {"ewma", EWMA(close, 15, DecayRateFromSpan(10.0))},
                   {"drawdown", MaxDrawdown(close, 30)},
                   {"zscore_by_sector", ZScore(Returns(5), nullptr, sector)},
                   {"sector", sector},
                   {"top", Top(momentum, 2, liquid, sector)},
                   {"spread", Sub(SimpleMovingAverage(close, 10),
                                  SimpleMovingAverage(close, 30))}},
                  NotNaN(momentum));
}

void RequireSameResult(PipelineResult const &lhs, PipelineResult const &rhs) {
  REQUIRE(lhs.GetDates() == rhs.GetDates());
  REQUIRE(lhs.GetAssets() == rhs.GetAssets());
  REQUIRE(lhs.GetColumnNames() == rhs.GetColumnNames());
  for (auto const &name : lhs.GetColumnNames()) {
    INFO(name);
    switch (lhs.GetKind(name)) {
    case epoch_core::TermKind::Filter:
      REQUIRE(lhs.GetFilter(name) == rhs.GetFilter(name));
      break;
    case epoch_core::TermKind::Classifier:
      REQUIRE(lhs.GetClassifier(name) == rhs.GetClassifier(name));
      break;
    default:
      RequireValues(lhs.GetFactor(name), rhs.GetFactor(name), 0.0);
      break;
    }
  }
}

} // namespace

TEST_CASE("PipelineEngine - parallel evaluation matches serial evaluation",
          "[runtime][engine][parallel]") {
  const auto assets = MakeUniverse(8);
  const auto loader = MakeMarketLoader(assets);
  const auto pipeline = MakeWidePipeline();
  const auto start = Day(2024, 2, 1);
  const auto end = Day(2024, 6, 14);

  PipelineEngine serial(loader, MakeCalendar(kSessions),
                        config::EngineConfig{.parallel = false});
  const auto expected = serial.Run(pipeline, start, end, assets);
  REQUIRE_FALSE(expected.empty());

  const auto maxConcurrency = GENERATE(size_t{0}, size_t{1}, size_t{2}, size_t{8});
  DYNAMIC_SECTION("max concurrency " << maxConcurrency) {
    PipelineEngine parallel(loader, MakeCalendar(kSessions),
                            config::EngineConfig{.parallel = true,
                                                 .maxConcurrency = maxConcurrency});
    const auto actual = parallel.Run(pipeline, start, end, assets);
    RequireSameResult(expected, actual);
    REQUIRE(actual.GetStatistics().nodesComputed ==
            expected.GetStatistics().nodesComputed);
    REQUIRE(actual.GetStatistics().loaderRequests == 2);
  }
}

TEST_CASE("PipelineEngine - concurrent runs on one engine", "[runtime][engine][parallel]") {
  const auto assets = MakeUniverse(6);
  auto recording = std::make_shared<test::RecordingLoader>(MakeMarketLoader(assets));
  PipelineEngine engine(recording, MakeCalendar(kSessions));
  const auto pipeline = MakeWidePipeline();
  const auto start = Day(2024, 3, 1);
  const auto end = Day(2024, 5, 31);

  const auto reference = engine.Run(pipeline, start, end, assets);

  constexpr size_t kThreads = 4;
  std::vector<std::optional<PipelineResult>> results(kThreads);
  std::vector<std::thread> threads;
  for (size_t k = 0; k < kThreads; ++k) {
    threads.emplace_back([&, k] { results[k] = engine.Run(pipeline, start, end, assets); });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  for (auto const &result : results) {
    REQUIRE(result.has_value());
    RequireSameResult(reference, *result);
  }
  // concurrent identical leaf requests may share a load, never exceed one per run
  REQUIRE(recording->size() <= 2 * (kThreads + 1));
}
