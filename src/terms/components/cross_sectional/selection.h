#pragma once
#include "rank.h"

namespace epoch_pipeline::term::components {

// Filter selecting the N highest (top) or lowest (bottom) assets, per group
// when a classifier is bound.
template <bool kTop>
class TopBottomCompute final : public TermCompute {
public:
  TopBottomCompute()
      : TermCompute(ComputeMetaData{
            .id = kTop ? "top" : "bottom",
            .kind = epoch_core::TermKind::Filter,
            .name = kTop ? "Top N" : "Bottom N",
            .inputs = {{.id = "x"}, GroupBySlot()},
            .defaultWindowLength = 0,
            .params = {{.id = "n", .type = epoch_core::ParamType::Integer}},
            .desc = kTop ? "Assets with the N largest values"
                         : "Assets with the N smallest values"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    if (params.at("n").GetInteger() < 1) {
      throw InvalidParameter(fmt::format("{}: n must be positive, got {}",
                                         GetMetaData().id,
                                         params.at("n").GetInteger()));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto section = MakeCrossSection(window);
    const auto n = static_cast<double>(window.params.at("n").GetInteger());

    auto ranks = MissingRow(section.values.n_elem);
    for (auto &group : section.Groups()) {
      RankInto(section.values, std::move(group), !kTop, "ordinal", ranks);
    }

    arma::rowvec out(section.values.n_elem, arma::fill::zeros);
    for (arma::uword j = 0; j < ranks.n_elem; ++j) {
      out(j) = !std::isnan(ranks(j)) && ranks(j) <= n ? 1.0 : 0.0;
    }
    return out;
  }
};

using TopCompute = TopBottomCompute<true>;
using BottomCompute = TopBottomCompute<false>;

// Linear-interpolated percentile of the sorted sample, q in [0, 100].
inline double Percentile(const std::vector<double> &sorted, double q) {
  if (sorted.empty()) {
    return MISSING_FACTOR;
  }
  const double position = q / 100.0 * static_cast<double>(sorted.size() - 1);
  const auto lower = static_cast<size_t>(std::floor(position));
  const auto upper = std::min(lower + 1, sorted.size() - 1);
  const double fraction = position - static_cast<double>(lower);
  return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

class PercentileBetweenCompute final : public TermCompute {
public:
  PercentileBetweenCompute()
      : TermCompute(ComputeMetaData{
            .id = "percentile_between",
            .kind = epoch_core::TermKind::Filter,
            .name = "Percentile Between",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 0,
            .params = {{.id = "min_percentile", .type = epoch_core::ParamType::Decimal},
                       {.id = "max_percentile", .type = epoch_core::ParamType::Decimal}},
            .desc = "Assets whose value lies between two cross-sectional percentiles"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    const double lower = params.at("min_percentile").GetDecimal();
    const double upper = params.at("max_percentile").GetDecimal();
    if (!(0.0 <= lower && lower <= upper && upper <= 100.0)) {
      throw InvalidParameter(fmt::format(
          "percentile_between: expected 0 <= min <= max <= 100, got [{}, {}]",
          lower, upper));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    std::vector<double> sorted;
    for (const auto j : ValidIndices(values)) {
      sorted.push_back(values(j));
    }
    std::ranges::sort(sorted);

    const double lower = Percentile(sorted, window.params.at("min_percentile").GetDecimal());
    const double upper = Percentile(sorted, window.params.at("max_percentile").GetDecimal());

    arma::rowvec out(values.n_elem, arma::fill::zeros);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      out(j) = values(j) >= lower && values(j) <= upper ? 1.0 : 0.0;
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
