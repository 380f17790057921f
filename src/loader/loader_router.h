#pragma once
#include <epoch_pipeline/loader/iloader.h>

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace epoch_pipeline::loader {

// Dispatches a column to the loader registered for its dataset, or to the
// default loader when none is.
class LoaderRouter final : public ILoader {
public:
  explicit LoaderRouter(ILoaderPtr defaultLoader);

  void Register(std::string dataset, ILoaderPtr loader);

  [[nodiscard]] ILoaderPtr Resolve(const term::Term &column) const;

  [[nodiscard]] epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const override;

private:
  ILoaderPtr m_default;
  mutable std::shared_mutex m_mutex;
  std::unordered_map<std::string, ILoaderPtr> m_loaders;
};

} // namespace epoch_pipeline::loader
