#pragma once
#include "grouping.h"

namespace epoch_pipeline::term::components {

// Cross-sectional demeaning, optionally scaled by the population standard
// deviation (z-score). Groups with zero dispersion yield missing z-scores.
template <bool kScale>
class NormalizeCompute final : public TermCompute {
public:
  NormalizeCompute()
      : TermCompute(ComputeMetaData{
            .id = kScale ? "zscore" : "demean",
            .kind = epoch_core::TermKind::Factor,
            .name = kScale ? "Z-Score" : "Demean",
            .inputs = {{.id = "x"}, GroupBySlot()},
            .defaultWindowLength = 0,
            .desc = kScale ? "Cross-sectional z-score, optionally per group"
                           : "Cross-sectional demeaning, optionally per group"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto section = MakeCrossSection(window);
    auto out = MissingRow(section.values.n_elem);

    for (auto const &group : section.Groups()) {
      if (group.empty()) {
        continue;
      }
      arma::vec values(group.size());
      for (size_t k = 0; k < group.size(); ++k) {
        values(k) = section.values(group[k]);
      }
      const double mean = arma::mean(values);
      double scale = 1.0;
      if constexpr (kScale) {
        scale = arma::stddev(values, 1);
      }
      for (size_t k = 0; k < group.size(); ++k) {
        const double centered = values(k) - mean;
        out(group[k]) = scale == 0.0 ? MISSING_FACTOR : centered / scale;
      }
    }
    return out;
  }
};

using ZScoreCompute = NormalizeCompute<true>;
using DemeanCompute = NormalizeCompute<false>;

} // namespace epoch_pipeline::term::components
