#pragma once
#include "compute.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epoch_pipeline::term {

class Term;
using TermPtr = std::shared_ptr<const Term>;

// Construction request for a term. Unset fields fall back to the compute
// definition's defaults.
struct TermSpec {
  std::string compute;
  std::vector<TermPtr> inputs{};
  std::optional<int64_t> windowLength{std::nullopt};
  TermPtr mask{};
  ParamMap params{};
  std::optional<epoch_core::TermKind> kind{std::nullopt};
};

// Immutable node of a pipeline graph. Identity is structural: two terms built
// from the same compute, inputs, window length, mask and parameters compare
// equal and hash alike, regardless of how they were constructed.
class Term {
public:
  // Only MakeTerm can construct one, so every term is validated.
  class Key {
    Key() = default;
    friend TermPtr MakeTerm(ITermComputePtr compute, TermSpec spec);
  };

  Term(Key, ITermComputePtr compute, epoch_core::TermKind kind,
       std::vector<TermPtr> inputs, int64_t windowLength, TermPtr mask,
       ParamMap params);

  [[nodiscard]] epoch_core::TermKind GetKind() const noexcept { return m_kind; }
  [[nodiscard]] bool IsFactor() const noexcept {
    return m_kind == epoch_core::TermKind::Factor;
  }
  [[nodiscard]] bool IsFilter() const noexcept {
    return m_kind == epoch_core::TermKind::Filter;
  }
  [[nodiscard]] bool IsClassifier() const noexcept {
    return m_kind == epoch_core::TermKind::Classifier;
  }

  [[nodiscard]] const std::string &GetComputeId() const noexcept;
  [[nodiscard]] const ITermCompute &GetCompute() const noexcept {
    return *m_compute;
  }

  [[nodiscard]] const std::vector<TermPtr> &GetInputs() const noexcept {
    return m_inputs;
  }
  [[nodiscard]] int64_t GetWindowLength() const noexcept { return m_windowLength; }
  // Rows of each input consumed per output day.
  [[nodiscard]] int64_t GetEffectiveWindow() const noexcept {
    return m_windowLength > 1 ? m_windowLength : 1;
  }
  [[nodiscard]] const TermPtr &GetMask() const noexcept { return m_mask; }
  [[nodiscard]] const ParamMap &GetParams() const noexcept { return m_params; }
  [[nodiscard]] const ParamValue &GetParam(std::string const &name) const;

  // Leaves are served by a loader rather than computed.
  [[nodiscard]] bool IsLoadable() const noexcept { return m_inputs.empty(); }

  [[nodiscard]] size_t GetHash() const noexcept { return m_hash; }

  [[nodiscard]] std::string ToString() const;

  bool operator==(const Term &other) const;

private:
  size_t ComputeHash() const;

  ITermComputePtr m_compute;
  epoch_core::TermKind m_kind;
  std::vector<TermPtr> m_inputs;
  int64_t m_windowLength;
  TermPtr m_mask;
  ParamMap m_params;
  size_t m_hash;
};

// Validates the request against the compute definition and returns the term.
// Throws a BuildError subclass on invalid window lengths, parameters, input
// arity or input kinds.
TermPtr MakeTerm(ITermComputePtr compute, TermSpec spec);

// Resolves spec.compute through the ComputeRegistry.
TermPtr MakeTerm(TermSpec spec);

// Structural comparison of possibly-null term pointers.
bool SameTerm(const TermPtr &lhs, const TermPtr &rhs);

struct TermPtrHash {
  size_t operator()(const TermPtr &term) const noexcept {
    return term ? term->GetHash() : 0;
  }
};

struct TermPtrEqual {
  bool operator()(const TermPtr &lhs, const TermPtr &rhs) const {
    return SameTerm(lhs, rhs);
  }
};

} // namespace epoch_pipeline::term
