#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/compute.h>
#include <fmt/format.h>
#include <string>

namespace epoch_pipeline::term::components {

// Comparisons involving a missing value are false.
inline double ApplyComparison(std::string const &op, double lhs, double rhs) {
  if (std::isnan(lhs) || std::isnan(rhs)) {
    return 0.0;
  }
  bool result{};
  if (op == "lt") {
    result = lhs < rhs;
  } else if (op == "le") {
    result = lhs <= rhs;
  } else if (op == "gt") {
    result = lhs > rhs;
  } else if (op == "ge") {
    result = lhs >= rhs;
  } else if (op == "eq") {
    result = lhs == rhs;
  } else {
    result = lhs != rhs;
  }
  return result ? 1.0 : 0.0;
}

inline void ValidateComparisonOp(std::string const &compute, std::string const &op) {
  static const std::vector<std::string> kOps{"lt", "le", "gt", "ge", "eq", "ne"};
  if (std::ranges::find(kOps, op) == kOps.end()) {
    throw InvalidParameter(fmt::format("{}: unknown comparison '{}'", compute, op));
  }
}

class CompareCompute final : public TermCompute {
public:
  CompareCompute()
      : TermCompute(ComputeMetaData{
            .id = "compare",
            .kind = epoch_core::TermKind::Filter,
            .name = "Compare",
            .inputs = {{.id = "lhs"}, {.id = "rhs"}},
            .defaultWindowLength = 0,
            .params = {{.id = "op", .type = epoch_core::ParamType::String}},
            .desc = "Element-wise comparison of two factors"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    ValidateComparisonOp("compare", params.at("op").GetString());
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto lhs = LastRow(window.inputs[0]);
    const auto rhs = LastRow(window.inputs[1]);
    const auto &op = window.params.at("op").GetString();
    arma::rowvec out(lhs.n_elem);
    for (arma::uword j = 0; j < lhs.n_elem; ++j) {
      out(j) = ApplyComparison(op, lhs(j), rhs(j));
    }
    return out;
  }
};

class ScalarCompareCompute final : public TermCompute {
public:
  ScalarCompareCompute()
      : TermCompute(ComputeMetaData{
            .id = "scalar_compare",
            .kind = epoch_core::TermKind::Filter,
            .name = "Scalar Compare",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 0,
            .params = {{.id = "op", .type = epoch_core::ParamType::String},
                       {.id = "scalar", .type = epoch_core::ParamType::Decimal}},
            .desc = "Element-wise comparison of a factor with a constant"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    ValidateComparisonOp("scalar_compare", params.at("op").GetString());
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    const auto &op = window.params.at("op").GetString();
    const double scalar = window.params.at("scalar").GetDecimal();
    arma::rowvec out(values.n_elem);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      out(j) = ApplyComparison(op, values(j), scalar);
    }
    return out;
  }
};

class ClassifierEqualsCompute final : public TermCompute {
public:
  ClassifierEqualsCompute()
      : TermCompute(ComputeMetaData{
            .id = "classifier_eq",
            .kind = epoch_core::TermKind::Filter,
            .name = "Classifier Equals",
            .inputs = {{.id = "x", .kind = epoch_core::TermKind::Classifier}},
            .defaultWindowLength = 0,
            .params = {{.id = "label", .type = epoch_core::ParamType::Integer}},
            .desc = "Assets whose label equals the given value"}) {}

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto labels = LastRow(window.inputs[0]);
    const auto label = static_cast<double>(window.params.at("label").GetInteger());
    arma::rowvec out(labels.n_elem);
    for (arma::uword j = 0; j < labels.n_elem; ++j) {
      out(j) = ApplyComparison("eq", labels(j), label);
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
