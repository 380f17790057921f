#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/compute.h>
#include <fmt/format.h>

namespace epoch_pipeline::term::components {

class LogicalCompute final : public TermCompute {
public:
  LogicalCompute()
      : TermCompute(ComputeMetaData{
            .id = "logical",
            .kind = epoch_core::TermKind::Filter,
            .name = "Logical",
            .inputs = {{.id = "lhs", .kind = epoch_core::TermKind::Filter},
                       {.id = "rhs", .kind = epoch_core::TermKind::Filter}},
            .defaultWindowLength = 0,
            .params = {{.id = "op", .type = epoch_core::ParamType::String}},
            .desc = "Element-wise conjunction or disjunction of two filters"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    const auto &op = params.at("op").GetString();
    if (op != "and" && op != "or") {
      throw InvalidParameter(fmt::format("logical: unknown operator '{}'", op));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto lhs = LastRow(window.inputs[0]);
    const auto rhs = LastRow(window.inputs[1]);
    const bool conjunction = window.params.at("op").GetString() == "and";
    arma::rowvec out(lhs.n_elem);
    for (arma::uword j = 0; j < lhs.n_elem; ++j) {
      const bool a = lhs(j) != 0.0;
      const bool b = rhs(j) != 0.0;
      out(j) = (conjunction ? (a && b) : (a || b)) ? 1.0 : 0.0;
    }
    return out;
  }
};

class NotCompute final : public TermCompute {
public:
  NotCompute()
      : TermCompute(ComputeMetaData{
            .id = "not",
            .kind = epoch_core::TermKind::Filter,
            .name = "Not",
            .inputs = {{.id = "x", .kind = epoch_core::TermKind::Filter}},
            .defaultWindowLength = 0,
            .desc = "Element-wise negation of a filter"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    arma::rowvec out(values.n_elem);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      out(j) = values(j) != 0.0 ? 0.0 : 1.0;
    }
    return out;
  }
};

// isnan / notnan over factors and classifiers.
template <bool kIsNaN>
class MissingTestCompute final : public TermCompute {
public:
  MissingTestCompute()
      : TermCompute(ComputeMetaData{
            .id = kIsNaN ? "isnan" : "notnan",
            .kind = epoch_core::TermKind::Filter,
            .name = kIsNaN ? "Is Missing" : "Is Present",
            .inputs = {{.id = "x", .kind = epoch_core::TermKind::Null}},
            .defaultWindowLength = 0,
            .desc = kIsNaN ? "True where the input is missing"
                           : "True where the input is present"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    arma::rowvec out(values.n_elem);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      out(j) = std::isnan(values(j)) == kIsNaN ? 1.0 : 0.0;
    }
    return out;
  }
};

using IsNaNCompute = MissingTestCompute<true>;
using NotNaNCompute = MissingTestCompute<false>;

} // namespace epoch_pipeline::term::components
