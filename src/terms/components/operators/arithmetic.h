#pragma once
#include "../window_utils.h"
#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/compute.h>
#include <fmt/format.h>
#include <string>

namespace epoch_pipeline::term::components {

// Element-wise arithmetic on today's values. Division by zero and
// non-finite results are reported as missing.
inline double ApplyArithmetic(std::string const &op, double lhs, double rhs) {
  double result{};
  if (op == "add") {
    result = lhs + rhs;
  } else if (op == "sub") {
    result = lhs - rhs;
  } else if (op == "mul") {
    result = lhs * rhs;
  } else if (op == "div") {
    result = rhs == 0.0 ? MISSING_FACTOR : lhs / rhs;
  } else {
    result = std::pow(lhs, rhs);
  }
  return std::isfinite(result) ? result : MISSING_FACTOR;
}

inline void ValidateArithmeticOp(std::string const &compute, std::string const &op) {
  static const std::vector<std::string> kOps{"add", "sub", "mul", "div", "pow"};
  if (std::ranges::find(kOps, op) == kOps.end()) {
    throw InvalidParameter(fmt::format("{}: unknown operator '{}'", compute, op));
  }
}

class BinaryOpCompute final : public TermCompute {
public:
  BinaryOpCompute()
      : TermCompute(ComputeMetaData{
            .id = "binary_op",
            .kind = epoch_core::TermKind::Factor,
            .name = "Binary Operator",
            .inputs = {{.id = "lhs"}, {.id = "rhs"}},
            .defaultWindowLength = 0,
            .params = {{.id = "op", .type = epoch_core::ParamType::String}},
            .desc = "Element-wise arithmetic between two factors"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    ValidateArithmeticOp("binary_op", params.at("op").GetString());
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto lhs = LastRow(window.inputs[0]);
    const auto rhs = LastRow(window.inputs[1]);
    const auto &op = window.params.at("op").GetString();
    arma::rowvec out(lhs.n_elem);
    for (arma::uword j = 0; j < lhs.n_elem; ++j) {
      out(j) = ApplyArithmetic(op, lhs(j), rhs(j));
    }
    return out;
  }
};

// Arithmetic against a constant. With `reflected` the constant is the
// left-hand operand.
class ScalarOpCompute final : public TermCompute {
public:
  ScalarOpCompute()
      : TermCompute(ComputeMetaData{
            .id = "scalar_op",
            .kind = epoch_core::TermKind::Factor,
            .name = "Scalar Operator",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 0,
            .params = {{.id = "op", .type = epoch_core::ParamType::String},
                       {.id = "scalar", .type = epoch_core::ParamType::Decimal},
                       {.id = "reflected",
                        .type = epoch_core::ParamType::Boolean,
                        .defaultValue = ParamValue{false}}},
            .desc = "Element-wise arithmetic between a factor and a constant"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    ValidateArithmeticOp("scalar_op", params.at("op").GetString());
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    const auto &op = window.params.at("op").GetString();
    const double scalar = window.params.at("scalar").GetDecimal();
    const bool reflected = window.params.at("reflected").GetBoolean();
    arma::rowvec out(values.n_elem);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      out(j) = reflected ? ApplyArithmetic(op, scalar, values(j))
                         : ApplyArithmetic(op, values(j), scalar);
    }
    return out;
  }
};

class MathCompute final : public TermCompute {
public:
  MathCompute()
      : TermCompute(ComputeMetaData{
            .id = "math",
            .kind = epoch_core::TermKind::Factor,
            .name = "Math Function",
            .inputs = {{.id = "x"}},
            .defaultWindowLength = 0,
            .params = {{.id = "fn", .type = epoch_core::ParamType::String}},
            .desc = "Element-wise negate, log, exp, abs or sqrt"}) {}

  void Validate(const ParamMap &params, int64_t) const override {
    static const std::vector<std::string> kFunctions{"negate", "log", "exp",
                                                     "abs", "sqrt"};
    const auto &fn = params.at("fn").GetString();
    if (std::ranges::find(kFunctions, fn) == kFunctions.end()) {
      throw InvalidParameter(fmt::format("math: unknown function '{}'", fn));
    }
  }

  [[nodiscard]] arma::rowvec Compute(const ComputeWindow &window) const override {
    const auto values = LastRow(window.inputs[0]);
    const auto &fn = window.params.at("fn").GetString();
    arma::rowvec out(values.n_elem);
    for (arma::uword j = 0; j < values.n_elem; ++j) {
      const double x = values(j);
      double result{};
      if (fn == "negate") {
        result = -x;
      } else if (fn == "log") {
        result = x > 0.0 ? std::log(x) : MISSING_FACTOR;
      } else if (fn == "exp") {
        result = std::exp(x);
      } else if (fn == "abs") {
        result = std::abs(x);
      } else {
        result = x >= 0.0 ? std::sqrt(x) : MISSING_FACTOR;
      }
      out(j) = std::isfinite(result) ? result : MISSING_FACTOR;
    }
    return out;
  }
};

} // namespace epoch_pipeline::term::components
