#pragma once
#include "engine_events.h"
#include <functional>
#include <memory>

namespace epoch_pipeline::runtime::events {

class IEventDispatcher {
public:
  virtual ~IEventDispatcher() = default;

  // Thread-safe; handlers run on the emitting thread.
  virtual void Emit(const EngineEvent &event) = 0;

  virtual boost::signals2::connection Subscribe(const EngineEventSlot &handler) = 0;

  // Only receives events of type T.
  template <typename T>
  boost::signals2::connection SubscribeTo(std::function<void(const T &)> handler) {
    return Subscribe([handler = std::move(handler)](const EngineEvent &event) {
      if (const auto *typed = std::get_if<T>(&event)) {
        handler(*typed);
      }
    });
  }
};

using IEventDispatcherPtr = std::shared_ptr<IEventDispatcher>;

class EventDispatcher : public IEventDispatcher {
public:
  EventDispatcher() = default;

  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;

  void Emit(const EngineEvent &event) override;

  boost::signals2::connection Subscribe(const EngineEventSlot &handler) override;

  [[nodiscard]] size_t SubscriberCount() const;

private:
  EngineEventSignal m_signal;
};

inline IEventDispatcherPtr MakeEventDispatcher() {
  return std::make_shared<EventDispatcher>();
}

} // namespace epoch_pipeline::runtime::events
