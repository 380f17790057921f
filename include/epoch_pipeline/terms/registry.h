#pragma once
#include "compute.h"
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace epoch_pipeline::term {

// Process-wide lookup of compute definitions by id. Builtins are registered
// on first access.
class ComputeRegistry {
public:
  static ComputeRegistry &GetInstance();

  ComputeRegistry(const ComputeRegistry &) = delete;
  ComputeRegistry &operator=(const ComputeRegistry &) = delete;

  // Throws std::runtime_error when the id is already taken.
  void Register(ITermComputePtr compute);

  [[nodiscard]] ITermComputePtr Get(std::string const &id) const;
  [[nodiscard]] bool Contains(std::string const &id) const;
  [[nodiscard]] std::vector<ComputeMetaData> GetMetaData() const;

private:
  ComputeRegistry();

  mutable std::shared_mutex m_mutex;
  std::unordered_map<std::string, ITermComputePtr> m_computes;
};

template <typename T, typename... Args> void Register(Args &&...args) {
  ComputeRegistry::GetInstance().Register(
      std::make_shared<const T>(std::forward<Args>(args)...));
}

} // namespace epoch_pipeline::term
