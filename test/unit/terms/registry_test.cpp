#include "common/pipeline_test_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/builtins.h>
#include <epoch_pipeline/terms/registry.h>

using namespace epoch_pipeline;
using namespace epoch_pipeline::term;

namespace {

// Doubles today's value of its input.
class DoubleItCompute final : public TermCompute {
public:
  DoubleItCompute()
      : TermCompute(ComputeMetaData{.id = "test_double_it",
                                    .kind = epoch_core::TermKind::Factor,
                                    .name = "Double It",
                                    .inputs = {{.id = "x"}},
                                    .defaultWindowLength = 0}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    return window.inputs[0].row(window.inputs[0].n_rows - 1) * 2.0;
  }
};

void EnsureDoubleItRegistered() {
  auto &registry = ComputeRegistry::GetInstance();
  if (!registry.Contains("test_double_it")) {
    Register<DoubleItCompute>();
  }
}

} // namespace

TEST_CASE("ComputeRegistry - builtins", "[terms][registry]") {
  auto &registry = ComputeRegistry::GetInstance();

  for (auto const *id :
       {"column", "latest", "returns", "simple_moving_average", "vwap", "rsi",
        "max_drawdown", "ewma", "ewmstd", "rolling_pearson", "rolling_beta",
        "rank", "zscore", "demean", "quantiles", "top", "bottom",
        "percentile_between", "binary_op", "scalar_op", "math", "compare",
        "logical", "not", "isnan", "notnan"}) {
    INFO(id);
    REQUIRE(registry.Contains(id));
  }

  const auto metadata = registry.GetMetaData();
  REQUIRE(std::ranges::is_sorted(metadata, {}, &ComputeMetaData::id));

  REQUIRE_THROWS_AS(registry.Get("not_registered"), UnknownComputeDefinition);
  REQUIRE_THROWS_AS(registry.Register(nullptr), std::runtime_error);
}

TEST_CASE("ComputeRegistry - user defined computes", "[terms][registry]") {
  EnsureDoubleItRegistered();

  SECTION("Ids are unique") {
    REQUIRE_THROWS_AS(Register<DoubleItCompute>(), std::runtime_error);
  }

  SECTION("Registered computes build terms by id") {
    const auto term = MakeTerm(TermSpec{.compute = "test_double_it",
                                        .inputs = {EquityPricing::Close()}});
    REQUIRE(term->IsFactor());
    REQUIRE(term->GetComputeId() == "test_double_it");
    REQUIRE(SameTerm(term, MakeTerm(TermSpec{.compute = "test_double_it",
                                             .inputs = {EquityPricing::Close()}})));

    const auto out = test::ApplyCompute(term, {test::MakePanel({{1.0, 2.0}, {3.0, 4.0}})});
    test::RequireValues(out, {4.0, 8.0});
  }

  SECTION("Their metadata is listed") {
    const auto metadata = ComputeRegistry::GetInstance().GetMetaData();
    REQUIRE(std::ranges::find(metadata, std::string{"test_double_it"},
                              &ComputeMetaData::id) != metadata.end());
  }
}
