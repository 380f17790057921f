#include "common/pipeline_test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <epoch_pipeline/runtime/engine.h>
#include <epoch_pipeline/terms/builtins.h>

using namespace epoch_pipeline;
using namespace epoch_pipeline::runtime;
using namespace epoch_pipeline::term;
using epoch_pipeline::test::Day;
using epoch_pipeline::test::MakeCalendar;
using epoch_pipeline::test::MakePanel;
using epoch_pipeline::test::RequireValues;

namespace {
constexpr double NaN = MISSING_FACTOR;

const std::vector<AssetID> kAssets{"A", "B"};

// Ten weekday sessions from 2024-01-01. A closes at 1..10, B at 10..100.
std::shared_ptr<loader::InMemoryLoader> MakePricingLoader() {
  auto loader = test::MakeLoader(MakeCalendar(10), kAssets);
  loader->AddColumn({EQUITY_PRICING_DATASET, "close"},
                    MakePanel({{1, 2, 3, 4, 5, 6, 7, 8, 9, 10},
                               {10, 20, 30, 40, 50, 60, 70, 80, 90, 100}}));
  loader->AddColumn({EQUITY_PRICING_DATASET, "volume"},
                    MakePanel({{5, 5, 5, 5, 5, 0, 0, 0, 0, 0},
                               {1, 2, 3, 4, 5, 6, 7, 8, 9, 10}}));
  return loader;
}

config::EngineConfig SerialConfig() { return config::EngineConfig{.parallel = false}; }
} // namespace

TEST_CASE("PipelineEngine - evaluates outputs per session and asset", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const auto close = EquityPricing::Close();

  Pipeline pipeline;
  pipeline.Add("sma_3", SimpleMovingAverage(close, 3));
  pipeline.Add("close", close);

  const auto result = engine.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), kAssets);

  REQUIRE(result.num_rows() == 6);
  REQUIRE(result.GetColumnNames() == std::vector<std::string>{"sma_3", "close"});
  REQUIRE(result.GetDates() == std::vector<SessionDate>{Day(2024, 1, 3), Day(2024, 1, 3),
                                                        Day(2024, 1, 4), Day(2024, 1, 4),
                                                        Day(2024, 1, 5), Day(2024, 1, 5)});
  REQUIRE(result.GetAssets() == std::vector<AssetID>{"A", "B", "A", "B", "A", "B"});
  RequireValues(result.GetFactor("sma_3"), {2, 20, 3, 30, 4, 40});
  RequireValues(result.GetFactor("close"), {3, 30, 4, 40, 5, 50});

  SECTION("Rows are found by date and asset") {
    const auto row = result.FindRow(Day(2024, 1, 4), "B");
    REQUIRE(row == 3u);
    REQUIRE(result.GetValue("sma_3", *row) == 30.0);
    REQUIRE_FALSE(result.FindRow(Day(2024, 1, 8), "A"));
  }

  SECTION("The universe order decides the asset order") {
    const auto reversed =
        engine.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 3), {"B", "A"});
    REQUIRE(reversed.GetAssets() == std::vector<AssetID>{"B", "A"});
    RequireValues(reversed.GetFactor("close"), {30, 3});
  }
}

TEST_CASE("PipelineEngine - range endpoints snap to sessions", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const Pipeline pipeline({{"close", EquityPricing::Close()}});

  // Saturday to Sunday covers the second week only
  const auto result = engine.Run(pipeline, Day(2024, 1, 6), Day(2024, 1, 14), {"A"});
  REQUIRE(result.num_rows() == 5);
  REQUIRE(result.GetDates().front() == Day(2024, 1, 8));
  REQUIRE(result.GetDates().back() == Day(2024, 1, 12));
  REQUIRE(result.GetStatistics().sessions == 5);
}

TEST_CASE("PipelineEngine - shared leaves are loaded once", "[runtime][engine]") {
  auto recording = std::make_shared<test::RecordingLoader>(MakePricingLoader());
  PipelineEngine engine(recording, MakeCalendar(10), SerialConfig());
  const auto close = EquityPricing::Close();

  const Pipeline pipeline({{"sma_3", SimpleMovingAverage(close, 3)},
                           {"returns_5", Returns(5)},
                           {"rank", Rank(Returns(5))}});
  const auto result = engine.Run(pipeline, Day(2024, 1, 8), Day(2024, 1, 12), kAssets);

  REQUIRE(recording->size() == 1);
  const auto request = recording->GetRequests().front();
  REQUIRE(request.column == "EquityPricing.close");
  // returns over five sessions needs four sessions before 2024-01-08
  REQUIRE(request.range == DateRange{Day(2024, 1, 2), Day(2024, 1, 12)});
  REQUIRE(request.assets == kAssets);

  REQUIRE(result.GetStatistics().loaderRequests == 1);
  REQUIRE(result.GetStatistics().nodesComputed == 4);
}

TEST_CASE("PipelineEngine - no look-ahead", "[runtime][engine]") {
  auto original = MakePricingLoader();
  auto altered = test::MakeLoader(MakeCalendar(10), kAssets);
  altered->AddColumn({EQUITY_PRICING_DATASET, "close"},
                     MakePanel({{1, 2, 3, 4, 5, -60, -70, -80, -90, -100},
                                {10, 20, 30, 40, 50, 0, 0, 0, 0, 0}}));

  const auto close = EquityPricing::Close();
  const Pipeline pipeline({{"sma", SimpleMovingAverage(close, 3)},
                           {"zscore", ZScore(Returns(2))},
                           {"top", Top(close, 1)}});

  PipelineEngine a(original, MakeCalendar(10), SerialConfig());
  PipelineEngine b(altered, MakeCalendar(10), SerialConfig());
  const auto lhs = a.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), kAssets);
  const auto rhs = b.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), kAssets);

  for (auto const &name : {"sma", "zscore"}) {
    INFO(name);
    RequireValues(lhs.GetFactor(name), rhs.GetFactor(name));
  }
  REQUIRE(lhs.GetFilter("top") == rhs.GetFilter("top"));
}

TEST_CASE("PipelineEngine - screens and masks", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const auto close = EquityPricing::Close();

  SECTION("Screened out rows are dropped") {
    Pipeline pipeline({{"close", close}}, Greater(close, 5.0));
    const auto result = engine.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), kAssets);
    REQUIRE(result.GetAssets() == std::vector<AssetID>{"B", "B", "B"});
    RequireValues(result.GetFactor("close"), {30, 40, 50});
  }

  SECTION("A screen excluding everything gives an empty table") {
    Pipeline pipeline({{"close", close}}, Greater(close, 1000.0));
    const auto result = engine.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), kAssets);
    REQUIRE(result.empty());
    REQUIRE(result.GetColumnNames() == std::vector<std::string>{"close"});
  }

  SECTION("Masked inputs are missing inside the window") {
    const auto above = Greater(close, 2.5);
    Pipeline pipeline({{"masked", SimpleMovingAverage(close, 3, above)},
                       {"above", above}});
    const auto result = engine.Run(pipeline, Day(2024, 1, 2), Day(2024, 1, 4), {"A"});
    // window [1, 2] on 01-02 is fully masked, [1, 2, 3] keeps 3, [2, 3, 4] keeps 3 and 4
    RequireValues(result.GetFactor("masked"), {NaN, 3.0, 3.5});
    REQUIRE(result.GetFilter("above") == std::vector<bool>{false, true, true});
  }

  SECTION("Masked inputs drop out of exponential averages") {
    const auto above = Greater(close, 2.5);
    Pipeline pipeline({{"ewma", EWMA(close, 3, 0.5, above)},
                       {"ewmstd", EWMSTD(close, 3, 0.5, above)}});
    const auto result = engine.Run(pipeline, Day(2024, 1, 3), Day(2024, 1, 5), {"A"});
    // weights .0625, .125, .25; close 2 is masked on 01-04 and renormalised away
    RequireValues(result.GetFactor("ewma"), {3.0, 11.0 / 3.0, 31.0 / 7.0});
    RequireValues(result.GetFactor("ewmstd"),
                  {NaN, std::sqrt(0.5), std::sqrt(45.5 / 49.0)});
  }

  SECTION("Masked cross-sections only see the assets passing the mask") {
    const auto liquid = Greater(EquityPricing::Volume(), 0.0);
    Pipeline pipeline({{"rank", Rank(close, false, liquid)}});
    const auto result = engine.Run(pipeline, Day(2024, 1, 5), Day(2024, 1, 8), kAssets);
    // A has no volume from 2024-01-08 on
    RequireValues(result.GetFactor("rank"), {2, 1, NaN, 1});
  }
}

TEST_CASE("PipelineEngine - lookback before the calendar is padded", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const auto close = EquityPricing::Close();
  const Pipeline pipeline({{"sma", SimpleMovingAverage(close, 3)},
                           {"returns", Returns(2)},
                           {"quantile", Quantiles(Returns(2), 2)}});

  const auto result = engine.Run(pipeline, Day(2024, 1, 1), Day(2024, 1, 2), {"A", "B"});
  RequireValues(result.GetFactor("sma"), {1, 10, 1.5, 15});
  RequireValues(result.GetFactor("returns"), {NaN, NaN, 1, 1});
  REQUIRE(result.GetClassifier("quantile") ==
          std::vector<int64_t>{MISSING_LABEL, MISSING_LABEL, 0, 1});
}

TEST_CASE("PipelineEngine - percent change over a two session window", "[runtime][engine]") {
  auto loader = test::MakeLoader(MakeCalendar(4), {"A"});
  loader->AddColumn({EQUITY_PRICING_DATASET, "close"}, MakePanel({{10, 11, 12, 13}}));
  PipelineEngine engine(loader, MakeCalendar(4), SerialConfig());

  const auto result =
      engine.Run(Pipeline({{"returns", Returns(2)}}), Day(2024, 1, 1), Day(2024, 1, 4), {"A"});
  REQUIRE(result.num_rows() == 4);
  // the row before the first session is padding
  RequireValues(result.GetFactor("returns"), {NaN, 0.1, 1.0 / 11.0, 1.0 / 12.0});
}

TEST_CASE("PipelineEngine - intermediate results are released", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const auto chain = Rank(Returns(2, SimpleMovingAverage(EquityPricing::Close(), 3)));

  const auto result =
      engine.Run(Pipeline({{"rank", chain}}), Day(2024, 1, 8), Day(2024, 1, 12), kAssets);
  REQUIRE(result.GetStatistics().nodesComputed == 4);
  REQUIRE(result.GetStatistics().peakCachedNodes == 2);
  // both assets grow at the same rate, ties keep the universe order
  RequireValues(result.GetFactor("rank"), {1, 2, 1, 2, 1, 2, 1, 2, 1, 2});
}

TEST_CASE("PipelineEngine - repeated and chunked runs agree", "[runtime][engine]") {
  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  const auto close = EquityPricing::Close();
  const Pipeline pipeline({{"sma", SimpleMovingAverage(close, 4)},
                           {"returns", Returns(3)},
                           {"bucket", Quantiles(close, 2)},
                           {"top", Top(Returns(3), 1)}},
                          NotNaN(Returns(3)));

  const auto whole = engine.Run(pipeline, Day(2024, 1, 2), Day(2024, 1, 12), kAssets);
  const auto again = engine.Run(pipeline, Day(2024, 1, 2), Day(2024, 1, 12), kAssets);
  const auto chunked =
      engine.RunChunked(pipeline, Day(2024, 1, 2), Day(2024, 1, 12), kAssets, 3);

  for (auto const *other : {&again, &chunked}) {
    REQUIRE(other->GetDates() == whole.GetDates());
    REQUIRE(other->GetAssets() == whole.GetAssets());
    RequireValues(other->GetFactor("sma"), whole.GetFactor("sma"));
    RequireValues(other->GetFactor("returns"), whole.GetFactor("returns"));
    REQUIRE(other->GetClassifier("bucket") == whole.GetClassifier("bucket"));
    REQUIRE(other->GetFilter("top") == whole.GetFilter("top"));
  }
  REQUIRE(chunked.GetStatistics().sessions == whole.GetStatistics().sessions);
  // nine sessions in chunks of three
  REQUIRE(chunked.GetStatistics().loaderRequests == 3);

  SECTION("Chunk size from the engine configuration") {
    PipelineEngine chunking(MakePricingLoader(), MakeCalendar(10),
                            config::EngineConfig{.parallel = false, .chunkSize = 4});
    const auto configured =
        chunking.RunChunked(pipeline, Day(2024, 1, 2), Day(2024, 1, 12), kAssets);
    REQUIRE(configured.GetDates() == whole.GetDates());
    REQUIRE(configured.GetStatistics().loaderRequests == 3);
  }
}

TEST_CASE("PipelineEngine - datasets routed to their own loaders", "[runtime][engine]") {
  auto fundamentals = test::MakeLoader(MakeCalendar(10), kAssets);
  fundamentals->AddColumn({"Fundamentals", "shares"},
                          MakePanel({std::vector<double>(10, 100.0),
                                     std::vector<double>(10, 2.0)}));

  PipelineEngine engine(MakePricingLoader(), MakeCalendar(10), SerialConfig());
  engine.RegisterLoader("Fundamentals", fundamentals);

  const auto marketCap = Mul(EquityPricing::Close(), Column("Fundamentals", "shares"));
  const auto result = engine.Run(Pipeline({{"market_cap", marketCap}}), Day(2024, 1, 1),
                                 Day(2024, 1, 1), kAssets);
  RequireValues(result.GetFactor("market_cap"), {100, 20});
}
