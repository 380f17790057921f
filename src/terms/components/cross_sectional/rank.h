#pragma once
#include "grouping.h"
#include <epoch_pipeline/core/errors.h>
#include <fmt/format.h>
#include <algorithm>
#include <string>

namespace epoch_pipeline::term::components {

// 1-based ranks of values within `indices`, written to `out`. Ties are
// resolved according to `method` (ordinal, average, min, max, dense).
inline void RankInto(const arma::rowvec &values,
                     std::vector<arma::uword> indices, bool ascending,
                     std::string const &method, arma::rowvec &out) {
  std::ranges::stable_sort(indices, [&](arma::uword a, arma::uword b) {
    return ascending ? values(a) < values(b) : values(a) > values(b);
  });

  size_t dense = 0;
  for (size_t begin = 0; begin < indices.size();) {
    size_t end = begin + 1;
    while (end < indices.size() && values(indices[end]) == values(indices[begin])) {
      ++end;
    }
    ++dense;
    for (size_t k = begin; k < end; ++k) {
      double rank{};
      if (method == "ordinal") {
        rank = static_cast<double>(k + 1);
      } else if (method == "average") {
        rank = static_cast<double>(begin + end + 1) / 2.0;
      } else if (method == "min") {
        rank = static_cast<double>(begin + 1);
      } else if (method == "max") {
        rank = static_cast<double>(end);
      } else {
        rank = static_cast<double>(dense);
      }
      out(indices[k]) = rank;
    }
    begin = end;
  }
}

class RankCompute final : public TermCompute {
public:
  RankCompute()
      : TermCompute(ComputeMetaData{
            .id = "rank",
            .kind = epoch_core::TermKind::Factor,
            .name = "Rank",
            .inputs = {{.id = "x"}, GroupBySlot()},
            .defaultWindowLength = 0,
            .params = {{.id = "ascending",
                        .type = epoch_core::ParamType::Boolean,
                        .defaultValue = ParamValue{true}},
                       {.id = "method",
                        .type = epoch_core::ParamType::String,
                        .defaultValue = ParamValue{"ordinal"}}},
            .desc = "Cross-sectional rank of the input, optionally per group"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    static const std::vector<std::string> kMethods{"ordinal", "average", "min",
                                                   "max", "dense"};
    const auto &method = params.at("method").GetString();
    if (std::ranges::find(kMethods, method) == kMethods.end()) {
      throw InvalidParameter(fmt::format("rank: unknown method '{}'", method));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto section = MakeCrossSection(window);
    const bool ascending = window.params.at("ascending").GetBoolean();
    const auto &method = window.params.at("method").GetString();

    auto out = MissingRow(section.values.n_elem);
    for (auto &group : section.Groups()) {
      RankInto(section.values, std::move(group), ascending, method, out);
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
