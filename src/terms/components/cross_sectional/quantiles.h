#pragma once
#include "rank.h"

namespace epoch_pipeline::term::components {

// Classifier assigning each asset to one of `bins` equal-count buckets by
// ordinal rank. Labels run from 0 (lowest values) to bins - 1.
class QuantilesCompute final : public TermCompute {
public:
  QuantilesCompute()
      : TermCompute(ComputeMetaData{
            .id = "quantiles",
            .kind = epoch_core::TermKind::Classifier,
            .name = "Quantiles",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 0,
            .params = {{.id = "bins", .type = epoch_core::ParamType::Integer}},
            .desc = "Cross-sectional quantile bucket of the input"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    if (params.at("bins").GetInteger() < 1) {
      throw InvalidParameter(fmt::format("quantiles: bins must be positive, got {}",
                                         params.at("bins").GetInteger()));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    const auto bins = static_cast<double>(window.params.at("bins").GetInteger());
    const auto valid = ValidIndices(values);

    auto ranks = MissingRow(values.n_elem);
    RankInto(values, valid, true, "ordinal", ranks);

    auto out = MissingRow(values.n_elem);
    const auto count = static_cast<double>(valid.size());
    for (const auto j : valid) {
      out(j) = std::floor((ranks(j) - 1.0) * bins / count);
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
