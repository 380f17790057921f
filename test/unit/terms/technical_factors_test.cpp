#include "common/pipeline_test_utils.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <epoch_pipeline/terms/builtins.h>

using namespace epoch_pipeline;
using namespace epoch_pipeline::term;
using epoch_pipeline::test::ApplyCompute;
using epoch_pipeline::test::MakePanel;
using epoch_pipeline::test::RequireValues;

namespace {
constexpr double NaN = MISSING_FACTOR;
}

TEST_CASE("Latest", "[terms][technical]") {
  const auto term = Latest(EquityPricing::Close());
  REQUIRE(term->GetWindowLength() == 1);
  RequireValues(ApplyCompute(term, {MakePanel({{4.0}, {NaN}})}), {4.0, NaN});
}

TEST_CASE("Returns", "[terms][technical]") {
  const auto term = Returns(2);
  const auto window = MakePanel({{10.0, 11.0}, {0.0, 5.0}, {NaN, 5.0}, {4.0, 3.0}});
  RequireValues(ApplyCompute(term, {window}), {0.1, NaN, NaN, -0.25});

  SECTION("Only the window endpoints matter") {
    const auto longer = Returns(4);
    RequireValues(ApplyCompute(longer, {MakePanel({{10.0, 50.0, NaN, 12.0}})}), {0.2});
  }
}

TEST_CASE("SimpleMovingAverage", "[terms][technical]") {
  const auto term = SimpleMovingAverage(EquityPricing::Close(), 3);
  const auto window = MakePanel({{1.0, 2.0, 3.0}, {1.0, 2.0, NaN}, {NaN, NaN, NaN}});
  RequireValues(ApplyCompute(term, {window}), {2.0, 1.5, NaN});
}

TEST_CASE("VWAP", "[terms][technical]") {
  const auto term = VWAP(2);
  REQUIRE(term->GetInputs().size() == 2);
  REQUIRE(SameTerm(term->GetInputs()[0], EquityPricing::Close()));
  REQUIRE(SameTerm(term->GetInputs()[1], EquityPricing::Volume()));

  const auto closes = MakePanel({{10.0, 20.0}, {5.0, 5.0}});
  const auto volumes = MakePanel({{1.0, 3.0}, {0.0, 0.0}});
  RequireValues(ApplyCompute(term, {closes, volumes}), {17.5, NaN});
}

TEST_CASE("RSI", "[terms][technical]") {
  const auto term = RSI(3);
  const auto window = MakePanel(
      {{1.0, 2.0, 1.0}, {1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}, {5.0, 5.0, 5.0}, {1.0, 4.0, 3.0}});
  // last column: up 3, down 1 -> mean up 1.5, mean down 0.5 -> 100 - 100 / 4
  RequireValues(ApplyCompute(term, {window}), {50.0, 100.0, 0.0, NaN, 75.0});
}

TEST_CASE("MaxDrawdown", "[terms][technical]") {
  const auto term = MaxDrawdown(EquityPricing::Close(), 5);
  const auto window =
      MakePanel({{10.0, 12.0, 9.0, 11.0, 8.0}, {1.0, 2.0, 3.0, 4.0, 5.0}});
  RequireValues(ApplyCompute(term, {window}), {0.5, 0.0});
}

TEST_CASE("EWMA and EWMSTD", "[terms][technical][ewm]") {
  const auto close = EquityPricing::Close();

  SECTION("Newer rows weigh more") {
    const auto term = EWMA(close, 3, 0.5);
    // weights 0.0625, 0.125, 0.25
    RequireValues(ApplyCompute(term, {MakePanel({{1.0, 2.0, 3.0}})}),
                  {(0.0625 + 0.25 + 0.75) / 0.4375});
  }

  SECTION("A decay rate of one is a plain mean") {
    const auto term = EWMA(close, 4, 1.0);
    RequireValues(ApplyCompute(term, {MakePanel({{1.0, 2.0, 3.0, 6.0}})}), {3.0});
  }

  SECTION("Constant series have no dispersion") {
    const auto term = EWMSTD(close, 3, 0.5);
    RequireValues(ApplyCompute(term, {MakePanel({{2.0, 2.0, 2.0}})}), {0.0});
  }

  SECTION("Unit decay matches the sample standard deviation") {
    const auto term = EWMSTD(close, 3, 1.0);
    RequireValues(ApplyCompute(term, {MakePanel({{1.0, 2.0, 3.0}})}), {1.0});
  }

  SECTION("Missing rows are skipped and the remaining weights renormalised") {
    const auto term = EWMA(close, 3, 0.5);
    RequireValues(ApplyCompute(term, {MakePanel({{NaN, 3.0, 4.0}, {NaN, NaN, NaN}})}),
                  {(0.375 + 1.0) / 0.375, NaN});
  }

  SECTION("Decay rate helpers build equivalent terms") {
    REQUIRE(SameTerm(EWMA(close, 10, DecayRateFromSpan(3.0)), EWMA(close, 10, 0.5)));
  }
}

TEST_CASE("Rolling statistics", "[terms][technical][statistics]") {
  const auto x = EquityPricing::Close();
  const auto y = EquityPricing::Open();

  SECTION("Pearson correlation") {
    const auto term = RollingPearson(x, y, 3);
    const auto xs = MakePanel({{1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}});
    const auto ys = MakePanel({{2.0, 4.0, 6.0}, {6.0, 4.0, 2.0}, {5.0, 5.0, 5.0}});
    RequireValues(ApplyCompute(term, {xs, ys}), {1.0, -1.0, NaN});
  }

  SECTION("Beta is the slope of x on y") {
    const auto term = RollingBeta(x, y, 3);
    const auto xs = MakePanel({{2.0, 4.0, 6.0}, {1.0, 2.0, 3.0}});
    const auto ys = MakePanel({{1.0, 2.0, 3.0}, {7.0, 7.0, 7.0}});
    RequireValues(ApplyCompute(term, {xs, ys}), {2.0, NaN});
  }

  SECTION("Rows missing on either side are dropped") {
    const auto term = RollingPearson(x, y, 3);
    const auto xs = MakePanel({{1.0, NaN, 3.0}, {1.0, NaN, NaN}});
    const auto ys = MakePanel({{1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}});
    RequireValues(ApplyCompute(term, {xs, ys}), {1.0, NaN});
  }
}

TEST_CASE("DollarVolume", "[terms][technical]") {
  const auto term = DollarVolume();
  REQUIRE(term->GetComputeId() == "binary_op");
  REQUIRE(term->GetParam("op").GetString() == "mul");
  RequireValues(ApplyCompute(term, {MakePanel({{10.0}}), MakePanel({{300.0}})}), {3000.0});
}
