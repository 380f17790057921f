#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>

namespace epoch_pipeline::term::components {

// Most recent value of the input. Output kind follows the input.
class LatestCompute final : public TermCompute {
public:
  LatestCompute()
      : TermCompute(ComputeMetaData{
            .id = "latest",
            .kind = epoch_core::TermKind::Null,
            .name = "Latest",
            .inputs = {{.id = "x", .kind = epoch_core::TermKind::Null}},
            .defaultWindowLength = 1,
            .desc = "Most recent value of the input"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    return LastRow(window.inputs[0]);
  }
};

class SimpleMovingAverageCompute final : public TermCompute {
public:
  SimpleMovingAverageCompute()
      : TermCompute(ComputeMetaData{
            .id = "simple_moving_average",
            .kind = epoch_core::TermKind::Factor,
            .name = "Simple Moving Average",
            .inputs = {{.id = "x"}},
            .minWindowLength = 1,
            .desc = "Mean of the non-missing values over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    return ReduceColumns(window.inputs[0], NanMean);
  }
};

// nansum(base * weight) / nansum(weight). Also backs VWAP, which only
// differs by its default inputs.
class WeightedAverageValueCompute final : public TermCompute {
public:
  explicit WeightedAverageValueCompute(std::string id = "weighted_average_value",
                                       std::vector<ColumnRef> defaultInputs = {})
      : TermCompute(ComputeMetaData{
            .id = std::move(id),
            .kind = epoch_core::TermKind::Factor,
            .name = "Weighted Average Value",
            .inputs = {{.id = "base"}, {.id = "weight"}},
            .minWindowLength = 1,
            .defaultInputs = std::move(defaultInputs),
            .desc = "Weighted average of base over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto &base = window.inputs[0];
    const auto &weight = window.inputs[1];
    arma::rowvec out(base.n_cols);
    for (arma::uword j = 0; j < base.n_cols; ++j) {
      double numerator = 0.0;
      double denominator = 0.0;
      for (arma::uword i = 0; i < base.n_rows; ++i) {
        const double product = base(i, j) * weight(i, j);
        if (!std::isnan(product)) {
          numerator += product;
        }
        if (!std::isnan(weight(i, j))) {
          denominator += weight(i, j);
        }
      }
      out(j) = denominator == 0.0 ? MISSING_FACTOR : numerator / denominator;
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
