#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>
#include <limits>

namespace epoch_pipeline::term::components {

// Largest peak-to-trough decline within the window, relative to the trough.
class MaxDrawdownCompute final : public TermCompute {
public:
  MaxDrawdownCompute()
      : TermCompute(ComputeMetaData{
            .id = "max_drawdown",
            .kind = epoch_core::TermKind::Factor,
            .name = "Max Drawdown",
            .inputs = {{.id = "x"}},
            .minWindowLength = 1,
            .desc = "Maximum drawdown over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    return ReduceColumns(window.inputs[0], [](const arma::vec &column) {
      // locate the end of the deepest drawdown, then its preceding peak
      double runningMax = MISSING_FACTOR;
      double deepest = -std::numeric_limits<double>::infinity();
      arma::uword end = 0;
      for (arma::uword i = 0; i < column.n_elem; ++i) {
        if (!std::isnan(column(i)) &&
            (std::isnan(runningMax) || column(i) > runningMax)) {
          runningMax = column(i);
        }
        const double drawdown = runningMax - column(i);
        if (!std::isnan(drawdown) && drawdown > deepest) {
          deepest = drawdown;
          end = i;
        }
      }
      const double peak = NanMax(arma::vec(column.head(end + 1)));
      return (peak - column(end)) / column(end);
    });
  }
};

} // namespace epoch_pipeline::term::components
