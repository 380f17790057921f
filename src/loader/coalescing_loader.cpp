#include "coalescing_loader.h"

#include <epoch_core/enum_wrapper.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace epoch_pipeline::loader {

CoalescingLoader::CoalescingLoader(ILoaderPtr inner) : m_inner(std::move(inner)) {
  if (!m_inner) {
    throw std::invalid_argument("CoalescingLoader requires a loader");
  }
}

std::string CoalescingLoader::MakeRequestKey(const term::Term &column,
                                             const DateRange &range,
                                             const std::vector<AssetID> &assets) {
  return fmt::format("{}:{}|{}|{}", column.ToString(),
                     epoch_core::TermKindWrapper::ToString(column.GetKind()),
                     ToString(range), fmt::join(assets, ","));
}

epoch_frame::DataFrame
CoalescingLoader::LoadWindow(const term::Term &column, const DateRange &range,
                             const std::vector<AssetID> &assets) const {
  ++m_requests;
  const auto key = MakeRequestKey(column, range, assets);

  std::promise<epoch_frame::DataFrame> promise;
  std::shared_future<epoch_frame::DataFrame> future;
  bool owner = false;
  {
    std::lock_guard lock(m_mutex);
    if (auto it = m_inFlight.find(key); it != m_inFlight.end()) {
      future = it->second;
    } else {
      future = promise.get_future().share();
      m_inFlight.emplace(key, future);
      owner = true;
    }
  }

  if (!owner) {
    SPDLOG_DEBUG("Joining in-flight load {}", key);
    return future.get();
  }

  ++m_loads;
  try {
    promise.set_value(m_inner->LoadWindow(column, range, assets));
  } catch (...) {
    promise.set_exception(std::current_exception());
  }
  {
    std::lock_guard lock(m_mutex);
    m_inFlight.erase(key);
  }
  return future.get();
}

} // namespace epoch_pipeline::loader
