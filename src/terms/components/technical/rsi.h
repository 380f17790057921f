#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>

namespace epoch_pipeline::term::components {

// Relative Strength Index: 100 - 100 / (1 + mean(up moves) / |mean(down moves)|)
class RSICompute final : public TermCompute {
public:
  RSICompute()
      : TermCompute(ComputeMetaData{
            .id = "rsi",
            .kind = epoch_core::TermKind::Factor,
            .name = "Relative Strength Index",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 15,
            .minWindowLength = 2,
            .defaultInputs = {{EQUITY_PRICING_DATASET, "close"}},
            .desc = "Relative Strength Index over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto &closes = window.inputs[0];
    return ReduceColumns(closes, [](const arma::vec &column) {
      double ups = 0.0;
      double downs = 0.0;
      size_t count = 0;
      for (arma::uword i = 1; i < column.n_elem; ++i) {
        const double diff = column(i) - column(i - 1);
        if (std::isnan(diff)) {
          continue;
        }
        ups += std::max(diff, 0.0);
        downs += std::min(diff, 0.0);
        ++count;
      }
      if (count == 0) {
        return MISSING_FACTOR;
      }
      ups /= static_cast<double>(count);
      downs = std::abs(downs / static_cast<double>(count));
      if (downs == 0.0) {
        return ups == 0.0 ? MISSING_FACTOR : 100.0;
      }
      return 100.0 - (100.0 / (1.0 + ups / downs));
    });
  }
};

} // namespace epoch_pipeline::term::components
