#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>

namespace epoch_pipeline::term::components {

// Percent change over the window: (x[-1] - x[0]) / x[0].
class ReturnsCompute final : public TermCompute {
public:
  ReturnsCompute()
      : TermCompute(ComputeMetaData{
            .id = "returns",
            .kind = epoch_core::TermKind::Factor,
            .name = "Returns",
            .inputs = {{.id = "x"}},
            .minWindowLength = 2,
            .defaultInputs = {{EQUITY_PRICING_DATASET, "close"}},
            .desc = "Percent change in the input over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto &data = window.inputs[0];
    arma::rowvec out(data.n_cols);
    for (arma::uword j = 0; j < data.n_cols; ++j) {
      const double first = data(0, j);
      const double last = data(data.n_rows - 1, j);
      out(j) = first == 0.0 ? MISSING_FACTOR : (last - first) / first;
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
