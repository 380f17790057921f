#include "loader_router.h"

#include <epoch_pipeline/terms/dataset.h>
#include <fmt/format.h>
#include <mutex>

namespace epoch_pipeline::loader {

LoaderRouter::LoaderRouter(ILoaderPtr defaultLoader)
    : m_default(std::move(defaultLoader)) {}

void LoaderRouter::Register(std::string dataset, ILoaderPtr loader) {
  if (!loader) {
    throw std::invalid_argument(
        fmt::format("null loader registered for dataset '{}'", dataset));
  }
  std::unique_lock lock(m_mutex);
  m_loaders.insert_or_assign(std::move(dataset), std::move(loader));
}

ILoaderPtr LoaderRouter::Resolve(const term::Term &column) const {
  const auto ref = term::GetColumnRef(column);
  if (!ref) {
    throw std::invalid_argument(
        fmt::format("{} is not a dataset column", column.ToString()));
  }
  {
    std::shared_lock lock(m_mutex);
    if (auto it = m_loaders.find(ref->dataset); it != m_loaders.end()) {
      return it->second;
    }
  }
  if (!m_default) {
    throw std::runtime_error(
        fmt::format("no loader registered for dataset '{}'", ref->dataset));
  }
  return m_default;
}

epoch_frame::DataFrame
LoaderRouter::LoadWindow(const term::Term &column, const DateRange &range,
                         const std::vector<AssetID> &assets) const {
  return Resolve(column)->LoadWindow(column, range, assets);
}

} // namespace epoch_pipeline::loader
