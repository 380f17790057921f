#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/compute.h>
#include <fmt/format.h>

namespace epoch_pipeline::term::components {

// Weights decay_rate^(n+1), decay_rate^n, ..., decay_rate^2 for a window of
// n rows, oldest row first.
inline arma::vec ExponentialWeights(arma::uword length, double decayRate) {
  arma::vec weights(length);
  for (arma::uword i = 0; i < length; ++i) {
    weights(i) = std::pow(decayRate, static_cast<double>(length + 1 - i));
  }
  return weights;
}

template <bool kStdDev>
class ExponentialWeightedCompute final : public TermCompute {
public:
  ExponentialWeightedCompute()
      : TermCompute(ComputeMetaData{
            .id = kStdDev ? "ewmstd" : "ewma",
            .kind = epoch_core::TermKind::Factor,
            .name = kStdDev ? "Exponentially Weighted Moving Std Dev"
                            : "Exponentially Weighted Moving Average",
            .inputs = {{.id = "x"}},
            .minWindowLength = 1,
            .params = {{.id = "decay_rate",
                        .type = epoch_core::ParamType::Decimal,
                        .desc = "Discount applied per row back in time, in (0, 1]"}},
            .desc = "Exponentially weighted statistic over the window"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    const double decayRate = params.at("decay_rate").GetDecimal();
    if (!(decayRate > 0.0 && decayRate <= 1.0)) {
      throw InvalidParameter(fmt::format(
          "{}: decay_rate must be in (0, 1], got {}", GetMetaData().id, decayRate));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto &data = window.inputs[0];
    const auto weights =
        ExponentialWeights(data.n_rows, window.params.at("decay_rate").GetDecimal());

    arma::rowvec out(data.n_cols);
    for (arma::uword j = 0; j < data.n_cols; ++j) {
      const arma::vec column = data.col(j);
      // Missing and masked rows drop out; the kept weights are renormalised.
      const arma::uvec kept = arma::find_finite(column);
      if (kept.is_empty()) {
        out(j) = MISSING_FACTOR;
        continue;
      }
      const arma::vec values = column.elem(kept);
      const arma::vec keptWeights = weights.elem(kept);
      const double weightSum = arma::accu(keptWeights);
      const double mean = arma::dot(values, keptWeights) / weightSum;
      if constexpr (kStdDev) {
        const double variance =
            arma::dot(arma::square(values - mean), keptWeights) / weightSum;
        const double squaredSum = weightSum * weightSum;
        const double biasCorrection =
            squaredSum / (squaredSum - arma::accu(arma::square(keptWeights)));
        out(j) = std::sqrt(variance * biasCorrection);
      } else {
        out(j) = mean;
      }
    }
    return out;
  }
};

using EWMACompute = ExponentialWeightedCompute<false>;
using EWMSTDCompute = ExponentialWeightedCompute<true>;

} // namespace epoch_pipeline::term::components
