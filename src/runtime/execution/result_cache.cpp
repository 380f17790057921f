#include "result_cache.h"

#include <algorithm>
#include <fmt/format.h>
#include <mutex>

namespace epoch_pipeline::runtime {

void ResultCache::Store(const term::TermPtr &term, arma::mat panel) {
  auto stored = std::make_shared<const arma::mat>(std::move(panel));
  std::unique_lock lock(m_mutex);
  if (!m_panels.emplace(term, std::move(stored)).second) {
    throw std::logic_error(fmt::format("{} is already cached", term->ToString()));
  }
  m_peakSize = std::max(m_peakSize, m_panels.size());
}

ResultCache::Panel ResultCache::Get(const term::TermPtr &term) const {
  std::shared_lock lock(m_mutex);
  auto it = m_panels.find(term);
  if (it == m_panels.end()) {
    throw std::out_of_range(fmt::format("{} is not cached", term->ToString()));
  }
  return it->second;
}

bool ResultCache::Contains(const term::TermPtr &term) const {
  std::shared_lock lock(m_mutex);
  return m_panels.contains(term);
}

void ResultCache::Release(const term::TermPtr &term) {
  std::unique_lock lock(m_mutex);
  m_panels.erase(term);
}

size_t ResultCache::size() const {
  std::shared_lock lock(m_mutex);
  return m_panels.size();
}

size_t ResultCache::GetPeakSize() const {
  std::shared_lock lock(m_mutex);
  return m_peakSize;
}

} // namespace epoch_pipeline::runtime
