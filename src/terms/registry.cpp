#include <epoch_pipeline/terms/registry.h>

#include <epoch_pipeline/core/errors.h>
#include "components/registration.h"

#include <fmt/format.h>
#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

namespace epoch_pipeline::term {

ComputeRegistry::ComputeRegistry() {
  components::RegisterBuiltins(*this);
  SPDLOG_DEBUG("Registered {} builtin compute definitions", m_computes.size());
}

ComputeRegistry &ComputeRegistry::GetInstance() {
  static ComputeRegistry instance;
  return instance;
}

void ComputeRegistry::Register(ITermComputePtr compute) {
  if (!compute) {
    throw std::runtime_error("Cannot register a null compute definition");
  }
  const auto id = compute->GetMetaData().id;

  std::unique_lock lock(m_mutex);
  if (!m_computes.emplace(id, std::move(compute)).second) {
    throw std::runtime_error(
        fmt::format("Compute definition '{}' is already registered", id));
  }
}

ITermComputePtr ComputeRegistry::Get(std::string const &id) const {
  std::shared_lock lock(m_mutex);
  auto it = m_computes.find(id);
  if (it == m_computes.end()) {
    throw UnknownComputeDefinition(id);
  }
  return it->second;
}

bool ComputeRegistry::Contains(std::string const &id) const {
  std::shared_lock lock(m_mutex);
  return m_computes.contains(id);
}

std::vector<ComputeMetaData> ComputeRegistry::GetMetaData() const {
  std::shared_lock lock(m_mutex);
  std::vector<ComputeMetaData> result;
  result.reserve(m_computes.size());
  for (auto const &[id, compute] : m_computes) {
    result.emplace_back(compute->GetMetaData());
  }
  std::ranges::sort(result, {}, &ComputeMetaData::id);
  return result;
}

} // namespace epoch_pipeline::term
