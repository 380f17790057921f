#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/terms/compute.h>

namespace epoch_pipeline::term::components {

struct PairMoments {
  size_t count{0};
  double covariance{0.0};
  double varianceX{0.0};
  double varianceY{0.0};
};

// Sample moments over the rows where both series are present.
inline PairMoments ComputePairMoments(const arma::vec &x, const arma::vec &y) {
  PairMoments moments;
  double sumX = 0.0;
  double sumY = 0.0;
  for (arma::uword i = 0; i < x.n_elem; ++i) {
    if (!std::isnan(x(i)) && !std::isnan(y(i))) {
      sumX += x(i);
      sumY += y(i);
      ++moments.count;
    }
  }
  if (moments.count < 2) {
    return moments;
  }
  const double meanX = sumX / static_cast<double>(moments.count);
  const double meanY = sumY / static_cast<double>(moments.count);
  for (arma::uword i = 0; i < x.n_elem; ++i) {
    if (!std::isnan(x(i)) && !std::isnan(y(i))) {
      const double dx = x(i) - meanX;
      const double dy = y(i) - meanY;
      moments.covariance += dx * dy;
      moments.varianceX += dx * dx;
      moments.varianceY += dy * dy;
    }
  }
  const double ddof = static_cast<double>(moments.count - 1);
  moments.covariance /= ddof;
  moments.varianceX /= ddof;
  moments.varianceY /= ddof;
  return moments;
}

// Per-asset rolling statistic between two inputs. Pearson correlation, or
// the regression slope of the first input on the second.
template <bool kBeta>
class RollingPairCompute final : public TermCompute {
public:
  RollingPairCompute()
      : TermCompute(ComputeMetaData{
            .id = kBeta ? "rolling_beta" : "rolling_pearson",
            .kind = epoch_core::TermKind::Factor,
            .name = kBeta ? "Rolling Linear Regression Beta" : "Rolling Pearson",
            .inputs = {{.id = "x"}, {.id = "y"}},
            .minWindowLength = 2,
            .desc = kBeta ? "Slope of x regressed on y over the window"
                          : "Pearson correlation of x and y over the window"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto &x = window.inputs[0];
    const auto &y = window.inputs[1];
    arma::rowvec out(x.n_cols);
    for (arma::uword j = 0; j < x.n_cols; ++j) {
      const auto moments = ComputePairMoments(arma::vec(x.col(j)), arma::vec(y.col(j)));
      if (moments.count < 2 || moments.varianceY == 0.0 ||
          (!kBeta && moments.varianceX == 0.0)) {
        out(j) = MISSING_FACTOR;
        continue;
      }
      if constexpr (kBeta) {
        out(j) = moments.covariance / moments.varianceY;
      } else {
        out(j) = moments.covariance /
                 std::sqrt(moments.varianceX * moments.varianceY);
      }
    }
    return out;
  }
};

using RollingPearsonCompute = RollingPairCompute<false>;
using RollingBetaCompute = RollingPairCompute<true>;

} // namespace epoch_pipeline::term::components
