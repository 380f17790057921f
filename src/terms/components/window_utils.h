#pragma once
//
// NaN-aware reductions over compute windows.
//
#include <algorithm>
#include <armadillo>
#include <cmath>
#include <epoch_pipeline/core/constants.h>
#include <vector>

namespace epoch_pipeline::term::components {

inline arma::rowvec MissingRow(size_t n) {
  arma::rowvec row(n);
  row.fill(MISSING_FACTOR);
  return row;
}

inline arma::rowvec LastRow(const arma::mat &window) {
  return window.row(window.n_rows - 1);
}

inline double NanSum(const arma::vec &values) {
  double sum = 0.0;
  for (const double v : values) {
    if (!std::isnan(v)) {
      sum += v;
    }
  }
  return sum;
}

inline double NanMean(const arma::vec &values) {
  double sum = 0.0;
  size_t count = 0;
  for (const double v : values) {
    if (!std::isnan(v)) {
      sum += v;
      ++count;
    }
  }
  return count == 0 ? MISSING_FACTOR : sum / static_cast<double>(count);
}

inline double NanMax(const arma::vec &values) {
  double result = MISSING_FACTOR;
  for (const double v : values) {
    if (!std::isnan(v) && (std::isnan(result) || v > result)) {
      result = v;
    }
  }
  return result;
}

// Population (ddof = 0) standard deviation of the non-missing values.
inline double NanStd(const arma::vec &values) {
  const double mean = NanMean(values);
  if (std::isnan(mean)) {
    return MISSING_FACTOR;
  }
  double sq = 0.0;
  size_t count = 0;
  for (const double v : values) {
    if (!std::isnan(v)) {
      sq += (v - mean) * (v - mean);
      ++count;
    }
  }
  return std::sqrt(sq / static_cast<double>(count));
}

// Applies fn to every column (asset) of the window.
template <typename Fn>
arma::rowvec ReduceColumns(const arma::mat &window, Fn &&fn) {
  arma::rowvec out(window.n_cols);
  for (arma::uword j = 0; j < window.n_cols; ++j) {
    out(j) = fn(arma::vec(window.col(j)));
  }
  return out;
}

// Indices of the non-missing entries of a cross-section.
inline std::vector<arma::uword> ValidIndices(const arma::rowvec &row) {
  std::vector<arma::uword> indices;
  indices.reserve(row.n_elem);
  for (arma::uword j = 0; j < row.n_elem; ++j) {
    if (!std::isnan(row(j))) {
      indices.push_back(j);
    }
  }
  return indices;
}

} // namespace epoch_pipeline::term::components
