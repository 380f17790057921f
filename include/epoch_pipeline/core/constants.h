#pragma once
#include <cstdint>
#include <epoch_core/enum_wrapper.h>
#include <limits>
#include <string>

// Output dtype of a term. Factors are numeric, filters are boolean masks and
// classifiers carry integer labels.
CREATE_ENUM(TermKind, Factor, Filter, Classifier);

CREATE_ENUM(ParamType, Integer, Decimal, Boolean, String);

namespace epoch_pipeline {
using AssetID = std::string;

constexpr double MISSING_FACTOR = std::numeric_limits<double>::quiet_NaN();
constexpr int64_t MISSING_LABEL = -1;

constexpr auto EQUITY_PRICING_DATASET = "EquityPricing";
constexpr auto COLUMN_COMPUTE_ID = "column";

// Missing value for a panel cell of the given kind, in the double encoding
// used by compute windows (filters are 0/1, classifier labels are NaN when
// absent).
inline double MissingValue(epoch_core::TermKind kind) {
  return kind == epoch_core::TermKind::Filter ? 0.0 : MISSING_FACTOR;
}
} // namespace epoch_pipeline
