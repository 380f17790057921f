#pragma once
//
// Compute definitions: the per-date step a term applies to its input
// windows, together with the metadata used to validate term construction.
//

#include "param_value.h"
#include <armadillo>
#include <epoch_pipeline/core/session_date.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epoch_pipeline::term {

struct ColumnRef {
  std::string dataset;
  std::string column;
  epoch_core::TermKind kind{epoch_core::TermKind::Factor};

  bool operator==(const ColumnRef &) const = default;
};

struct InputSlot {
  std::string id;
  // Null accepts any kind.
  epoch_core::TermKind kind{epoch_core::TermKind::Factor};
  bool optional{false};
};

struct ParamSpec {
  std::string id;
  epoch_core::ParamType type{epoch_core::ParamType::Decimal};
  std::optional<ParamValue> defaultValue{std::nullopt};
  std::string desc{};
};

struct ComputeMetaData {
  std::string id;
  // Null means the output kind follows the first input, or is chosen by the
  // caller for loadable columns.
  epoch_core::TermKind kind{epoch_core::TermKind::Factor};
  std::string name{};
  std::vector<InputSlot> inputs{};
  std::optional<int64_t> defaultWindowLength{std::nullopt};
  int64_t minWindowLength{0};
  std::vector<ColumnRef> defaultInputs{};
  std::vector<ParamSpec> params{};
  bool loadable{false};
  std::string desc{};
};

// Trailing data handed to a compute step for one output day. Every input
// matrix has max(window_length, 1) rows (oldest first, the last row is
// `today`) and one column per asset. Missing cells are NaN, masked filter
// cells are 0.
struct ComputeWindow {
  SessionDate today;
  const std::vector<AssetID> &assets;
  const std::vector<arma::mat> &inputs;
  const ParamMap &params;
  int64_t windowLength;
};

class ITermCompute {
public:
  virtual ~ITermCompute() = default;

  [[nodiscard]] virtual const ComputeMetaData &GetMetaData() const = 0;

  // One value per asset for `window.today`.
  [[nodiscard]] virtual arma::rowvec Compute(const ComputeWindow &window) const = 0;

  // Checks beyond the declared parameter types, e.g. value ranges. Throws
  // InvalidParameter or InvalidWindowLength.
  virtual void Validate(const ParamMap &params, int64_t windowLength) const {
    (void)params;
    (void)windowLength;
  }
};

using ITermComputePtr = std::shared_ptr<const ITermCompute>;

class TermCompute : public ITermCompute {
public:
  explicit TermCompute(ComputeMetaData metaData)
      : m_metaData(std::move(metaData)) {}

  [[nodiscard]] const ComputeMetaData &GetMetaData() const final {
    return m_metaData;
  }

private:
  ComputeMetaData m_metaData;
};

} // namespace epoch_pipeline::term
