#pragma once
#include <epoch_pipeline/loader/iloader.h>

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace epoch_pipeline::loader {

// Shares one underlying LoadWindow call between identical requests that are
// in flight at the same time. Every waiter receives the same frame, or the
// same exception. Completed requests are not retained.
class CoalescingLoader final : public ILoader {
public:
  explicit CoalescingLoader(ILoaderPtr inner);

  [[nodiscard]] epoch_frame::DataFrame
  LoadWindow(const term::Term &column, const DateRange &range,
             const std::vector<AssetID> &assets) const override;

  // Requests received, coalesced or not.
  [[nodiscard]] size_t GetRequestCount() const noexcept { return m_requests.load(); }
  // Calls forwarded to the wrapped loader.
  [[nodiscard]] size_t GetLoadCount() const noexcept { return m_loads.load(); }

  static std::string MakeRequestKey(const term::Term &column, const DateRange &range,
                                    const std::vector<AssetID> &assets);

private:
  ILoaderPtr m_inner;

  mutable std::mutex m_mutex;
  mutable std::unordered_map<std::string, std::shared_future<epoch_frame::DataFrame>>
      m_inFlight;
  mutable std::atomic<size_t> m_requests{0};
  mutable std::atomic<size_t> m_loads{0};
};

} // namespace epoch_pipeline::loader
