#pragma once
#include <armadillo>
#include <epoch_pipeline/terms/term.h>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace epoch_pipeline::runtime {

// Run-local store of node outputs keyed by structural term identity. Each
// panel has one row per session the node produces and one column per asset.
class ResultCache {
public:
  using Panel = std::shared_ptr<const arma::mat>;

  // Throws std::logic_error when the term is already cached.
  void Store(const term::TermPtr &term, arma::mat panel);
  // Throws std::out_of_range when the term is not cached.
  [[nodiscard]] Panel Get(const term::TermPtr &term) const;
  [[nodiscard]] bool Contains(const term::TermPtr &term) const;
  void Release(const term::TermPtr &term);

  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t GetPeakSize() const;

private:
  mutable std::shared_mutex m_mutex;
  std::unordered_map<term::TermPtr, Panel, term::TermPtrHash, term::TermPtrEqual>
      m_panels;
  size_t m_peakSize{0};
};

} // namespace epoch_pipeline::runtime
