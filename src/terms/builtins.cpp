#include <epoch_pipeline/terms/builtins.h>

#include <epoch_pipeline/core/errors.h>
#include <epoch_pipeline/terms/dataset.h>

#include <cmath>
#include <fmt/format.h>

namespace epoch_pipeline::term {

namespace {

std::vector<TermPtr> Inputs(TermPtr input) {
  if (!input) {
    return {};
  }
  return {std::move(input)};
}

std::vector<TermPtr> Inputs(TermPtr input, TermPtr groupby) {
  std::vector<TermPtr> inputs{std::move(input)};
  if (groupby) {
    inputs.emplace_back(std::move(groupby));
  }
  return inputs;
}

TermPtr Windowed(std::string compute, std::vector<TermPtr> inputs,
                 std::optional<int64_t> windowLength, TermPtr mask,
                 ParamMap params = {}) {
  return MakeTerm(TermSpec{.compute = std::move(compute),
                           .inputs = std::move(inputs),
                           .windowLength = windowLength,
                           .mask = std::move(mask),
                           .params = std::move(params)});
}

TermPtr Elementwise(std::string compute, std::vector<TermPtr> inputs,
                    ParamMap params) {
  return MakeTerm(TermSpec{.compute = std::move(compute),
                           .inputs = std::move(inputs),
                           .params = std::move(params)});
}

TermPtr BinaryOp(TermPtr lhs, TermPtr rhs, std::string const &op) {
  return Elementwise("binary_op", {std::move(lhs), std::move(rhs)}, {{"op", op}});
}

TermPtr ScalarOp(TermPtr input, double scalar, std::string const &op,
                 bool reflected) {
  return Elementwise("scalar_op", {std::move(input)},
                     {{"op", op}, {"scalar", scalar}, {"reflected", reflected}});
}

TermPtr Compare(TermPtr lhs, TermPtr rhs, std::string const &op) {
  return Elementwise("compare", {std::move(lhs), std::move(rhs)}, {{"op", op}});
}

TermPtr ScalarCompare(TermPtr input, double scalar, std::string const &op) {
  return Elementwise("scalar_compare", {std::move(input)},
                     {{"op", op}, {"scalar", scalar}});
}

TermPtr MathFunction(TermPtr input, std::string const &fn) {
  return Elementwise("math", {std::move(input)}, {{"fn", fn}});
}

} // namespace

TermPtr Latest(TermPtr input) {
  return Windowed("latest", Inputs(std::move(input)), std::nullopt, nullptr);
}

TermPtr Returns(int64_t windowLength, TermPtr input, TermPtr mask) {
  return Windowed("returns", Inputs(std::move(input)), windowLength,
                  std::move(mask));
}

TermPtr SimpleMovingAverage(TermPtr input, int64_t windowLength, TermPtr mask) {
  return Windowed("simple_moving_average", Inputs(std::move(input)),
                  windowLength, std::move(mask));
}

TermPtr WeightedAverageValue(TermPtr base, TermPtr weight, int64_t windowLength,
                             TermPtr mask) {
  return Windowed("weighted_average_value", {std::move(base), std::move(weight)},
                  windowLength, std::move(mask));
}

TermPtr VWAP(int64_t windowLength, TermPtr mask) {
  return Windowed("vwap", {}, windowLength, std::move(mask));
}

TermPtr RSI(std::optional<int64_t> windowLength, TermPtr input, TermPtr mask) {
  return Windowed("rsi", Inputs(std::move(input)), windowLength, std::move(mask));
}

TermPtr MaxDrawdown(TermPtr input, int64_t windowLength, TermPtr mask) {
  return Windowed("max_drawdown", Inputs(std::move(input)), windowLength,
                  std::move(mask));
}

TermPtr EWMA(TermPtr input, int64_t windowLength, double decayRate, TermPtr mask) {
  return Windowed("ewma", Inputs(std::move(input)), windowLength,
                  std::move(mask), {{"decay_rate", decayRate}});
}

TermPtr EWMSTD(TermPtr input, int64_t windowLength, double decayRate,
               TermPtr mask) {
  return Windowed("ewmstd", Inputs(std::move(input)), windowLength,
                  std::move(mask), {{"decay_rate", decayRate}});
}

double DecayRateFromSpan(double span) {
  if (span <= 1.0) {
    throw InvalidParameter(
        fmt::format("span must be greater than 1, got {}", span));
  }
  return 1.0 - (2.0 / (1.0 + span));
}

double DecayRateFromHalflife(double halflife) {
  if (halflife <= 0.0) {
    throw InvalidParameter(
        fmt::format("halflife must be positive, got {}", halflife));
  }
  return std::exp(std::log(0.5) / halflife);
}

double DecayRateFromCenterOfMass(double centerOfMass) {
  if (centerOfMass < 0.0) {
    throw InvalidParameter(fmt::format(
        "center of mass must be non-negative, got {}", centerOfMass));
  }
  return 1.0 - (1.0 / (1.0 + centerOfMass));
}

TermPtr DollarVolume() {
  return Mul(Latest(EquityPricing::Close()), Latest(EquityPricing::Volume()));
}

TermPtr RollingPearson(TermPtr x, TermPtr y, int64_t windowLength, TermPtr mask) {
  return Windowed("rolling_pearson", {std::move(x), std::move(y)}, windowLength,
                  std::move(mask));
}

TermPtr RollingBeta(TermPtr dependent, TermPtr independent, int64_t windowLength,
                    TermPtr mask) {
  return Windowed("rolling_beta", {std::move(dependent), std::move(independent)},
                  windowLength, std::move(mask));
}

TermPtr Rank(TermPtr input, bool ascending, TermPtr mask, TermPtr groupby,
             std::string const &method) {
  return Windowed("rank", Inputs(std::move(input), std::move(groupby)),
                  std::nullopt, std::move(mask),
                  {{"ascending", ascending}, {"method", method}});
}

TermPtr ZScore(TermPtr input, TermPtr mask, TermPtr groupby) {
  return Windowed("zscore", Inputs(std::move(input), std::move(groupby)),
                  std::nullopt, std::move(mask));
}

TermPtr Demean(TermPtr input, TermPtr mask, TermPtr groupby) {
  return Windowed("demean", Inputs(std::move(input), std::move(groupby)),
                  std::nullopt, std::move(mask));
}

TermPtr Quantiles(TermPtr input, int64_t bins, TermPtr mask) {
  return Windowed("quantiles", Inputs(std::move(input)), std::nullopt,
                  std::move(mask), {{"bins", bins}});
}

TermPtr Top(TermPtr input, int64_t n, TermPtr mask, TermPtr groupby) {
  return Windowed("top", Inputs(std::move(input), std::move(groupby)),
                  std::nullopt, std::move(mask), {{"n", n}});
}

TermPtr Bottom(TermPtr input, int64_t n, TermPtr mask, TermPtr groupby) {
  return Windowed("bottom", Inputs(std::move(input), std::move(groupby)),
                  std::nullopt, std::move(mask), {{"n", n}});
}

TermPtr PercentileBetween(TermPtr input, double minPercentile,
                          double maxPercentile, TermPtr mask) {
  return Windowed("percentile_between", Inputs(std::move(input)), std::nullopt,
                  std::move(mask),
                  {{"min_percentile", minPercentile},
                   {"max_percentile", maxPercentile}});
}

TermPtr Add(TermPtr lhs, TermPtr rhs) { return BinaryOp(std::move(lhs), std::move(rhs), "add"); }
TermPtr Sub(TermPtr lhs, TermPtr rhs) { return BinaryOp(std::move(lhs), std::move(rhs), "sub"); }
TermPtr Mul(TermPtr lhs, TermPtr rhs) { return BinaryOp(std::move(lhs), std::move(rhs), "mul"); }
TermPtr Div(TermPtr lhs, TermPtr rhs) { return BinaryOp(std::move(lhs), std::move(rhs), "div"); }
TermPtr Pow(TermPtr lhs, TermPtr rhs) { return BinaryOp(std::move(lhs), std::move(rhs), "pow"); }

TermPtr Add(TermPtr lhs, double rhs) { return ScalarOp(std::move(lhs), rhs, "add", false); }
TermPtr Sub(TermPtr lhs, double rhs) { return ScalarOp(std::move(lhs), rhs, "sub", false); }
TermPtr Sub(double lhs, TermPtr rhs) { return ScalarOp(std::move(rhs), lhs, "sub", true); }
TermPtr Mul(TermPtr lhs, double rhs) { return ScalarOp(std::move(lhs), rhs, "mul", false); }
TermPtr Div(TermPtr lhs, double rhs) { return ScalarOp(std::move(lhs), rhs, "div", false); }
TermPtr Div(double lhs, TermPtr rhs) { return ScalarOp(std::move(rhs), lhs, "div", true); }
TermPtr Pow(TermPtr lhs, double rhs) { return ScalarOp(std::move(lhs), rhs, "pow", false); }

TermPtr Negate(TermPtr input) { return MathFunction(std::move(input), "negate"); }
TermPtr Log(TermPtr input) { return MathFunction(std::move(input), "log"); }
TermPtr Exp(TermPtr input) { return MathFunction(std::move(input), "exp"); }
TermPtr Abs(TermPtr input) { return MathFunction(std::move(input), "abs"); }
TermPtr Sqrt(TermPtr input) { return MathFunction(std::move(input), "sqrt"); }

TermPtr Less(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "lt"); }
TermPtr LessEqual(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "le"); }
TermPtr Greater(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "gt"); }
TermPtr GreaterEqual(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "ge"); }
TermPtr Equal(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "eq"); }
TermPtr NotEqual(TermPtr lhs, TermPtr rhs) { return Compare(std::move(lhs), std::move(rhs), "ne"); }

TermPtr Less(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "lt"); }
TermPtr LessEqual(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "le"); }
TermPtr Greater(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "gt"); }
TermPtr GreaterEqual(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "ge"); }
TermPtr Equal(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "eq"); }
TermPtr NotEqual(TermPtr lhs, double rhs) { return ScalarCompare(std::move(lhs), rhs, "ne"); }

TermPtr And(TermPtr lhs, TermPtr rhs) {
  return Elementwise("logical", {std::move(lhs), std::move(rhs)}, {{"op", "and"}});
}

TermPtr Or(TermPtr lhs, TermPtr rhs) {
  return Elementwise("logical", {std::move(lhs), std::move(rhs)}, {{"op", "or"}});
}

TermPtr Not(TermPtr input) { return Elementwise("not", {std::move(input)}, {}); }

TermPtr IsNaN(TermPtr input) { return Elementwise("isnan", {std::move(input)}, {}); }
TermPtr NotNaN(TermPtr input) { return Elementwise("notnan", {std::move(input)}, {}); }

TermPtr LabelEquals(TermPtr classifier, int64_t label) {
  return Elementwise("classifier_eq", {std::move(classifier)}, {{"label", label}});
}

} // namespace epoch_pipeline::term
