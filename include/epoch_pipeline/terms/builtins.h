#pragma once
//
// Builders for the registered compute definitions. Every builder returns an
// immutable term; equal arguments yield structurally equal terms.
//

#include "term.h"
#include <optional>

namespace epoch_pipeline::term {

// ============================================================================
// Technical factors
// ============================================================================

TermPtr Latest(TermPtr input);

// Percent change over the window. Defaults to EquityPricing close.
TermPtr Returns(int64_t windowLength, TermPtr input = nullptr,
                TermPtr mask = nullptr);

TermPtr SimpleMovingAverage(TermPtr input, int64_t windowLength,
                            TermPtr mask = nullptr);

TermPtr WeightedAverageValue(TermPtr base, TermPtr weight, int64_t windowLength,
                             TermPtr mask = nullptr);

// Volume weighted average close price.
TermPtr VWAP(int64_t windowLength, TermPtr mask = nullptr);

// Window defaults to 15 sessions and the input to EquityPricing close.
TermPtr RSI(std::optional<int64_t> windowLength = std::nullopt,
            TermPtr input = nullptr, TermPtr mask = nullptr);

TermPtr MaxDrawdown(TermPtr input, int64_t windowLength, TermPtr mask = nullptr);

TermPtr EWMA(TermPtr input, int64_t windowLength, double decayRate,
             TermPtr mask = nullptr);
TermPtr EWMSTD(TermPtr input, int64_t windowLength, double decayRate,
               TermPtr mask = nullptr);

// Decay rate conversions for EWMA / EWMSTD. Throw InvalidParameter when the
// argument is out of range.
double DecayRateFromSpan(double span);
double DecayRateFromHalflife(double halflife);
double DecayRateFromCenterOfMass(double centerOfMass);

// EquityPricing close.latest * volume.latest
TermPtr DollarVolume();

TermPtr RollingPearson(TermPtr x, TermPtr y, int64_t windowLength,
                       TermPtr mask = nullptr);
// Slope of `dependent` regressed on `independent`.
TermPtr RollingBeta(TermPtr dependent, TermPtr independent, int64_t windowLength,
                    TermPtr mask = nullptr);

// ============================================================================
// Cross-sectional
// ============================================================================

TermPtr Rank(TermPtr input, bool ascending = true, TermPtr mask = nullptr,
             TermPtr groupby = nullptr, std::string const &method = "ordinal");
TermPtr ZScore(TermPtr input, TermPtr mask = nullptr, TermPtr groupby = nullptr);
TermPtr Demean(TermPtr input, TermPtr mask = nullptr, TermPtr groupby = nullptr);
TermPtr Quantiles(TermPtr input, int64_t bins, TermPtr mask = nullptr);
TermPtr Top(TermPtr input, int64_t n, TermPtr mask = nullptr,
            TermPtr groupby = nullptr);
TermPtr Bottom(TermPtr input, int64_t n, TermPtr mask = nullptr,
               TermPtr groupby = nullptr);
TermPtr PercentileBetween(TermPtr input, double minPercentile,
                          double maxPercentile, TermPtr mask = nullptr);

// ============================================================================
// Element-wise expressions
// ============================================================================

TermPtr Add(TermPtr lhs, TermPtr rhs);
TermPtr Sub(TermPtr lhs, TermPtr rhs);
TermPtr Mul(TermPtr lhs, TermPtr rhs);
TermPtr Div(TermPtr lhs, TermPtr rhs);
TermPtr Pow(TermPtr lhs, TermPtr rhs);

TermPtr Add(TermPtr lhs, double rhs);
TermPtr Sub(TermPtr lhs, double rhs);
TermPtr Sub(double lhs, TermPtr rhs);
TermPtr Mul(TermPtr lhs, double rhs);
TermPtr Div(TermPtr lhs, double rhs);
TermPtr Div(double lhs, TermPtr rhs);
TermPtr Pow(TermPtr lhs, double rhs);

TermPtr Negate(TermPtr input);
TermPtr Log(TermPtr input);
TermPtr Exp(TermPtr input);
TermPtr Abs(TermPtr input);
TermPtr Sqrt(TermPtr input);

TermPtr Less(TermPtr lhs, TermPtr rhs);
TermPtr LessEqual(TermPtr lhs, TermPtr rhs);
TermPtr Greater(TermPtr lhs, TermPtr rhs);
TermPtr GreaterEqual(TermPtr lhs, TermPtr rhs);
TermPtr Equal(TermPtr lhs, TermPtr rhs);
TermPtr NotEqual(TermPtr lhs, TermPtr rhs);

TermPtr Less(TermPtr lhs, double rhs);
TermPtr LessEqual(TermPtr lhs, double rhs);
TermPtr Greater(TermPtr lhs, double rhs);
TermPtr GreaterEqual(TermPtr lhs, double rhs);
TermPtr Equal(TermPtr lhs, double rhs);
TermPtr NotEqual(TermPtr lhs, double rhs);

TermPtr And(TermPtr lhs, TermPtr rhs);
TermPtr Or(TermPtr lhs, TermPtr rhs);
TermPtr Not(TermPtr input);

TermPtr IsNaN(TermPtr input);
TermPtr NotNaN(TermPtr input);

TermPtr LabelEquals(TermPtr classifier, int64_t label);

} // namespace epoch_pipeline::term
