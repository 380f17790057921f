#include <epoch_pipeline/runtime/events/event_dispatcher.h>

namespace epoch_pipeline::runtime::events {

void EventDispatcher::Emit(const EngineEvent &event) { m_signal(event); }

boost::signals2::connection
EventDispatcher::Subscribe(const EngineEventSlot &handler) {
  return m_signal.connect(handler);
}

size_t EventDispatcher::SubscriberCount() const { return m_signal.num_slots(); }

} // namespace epoch_pipeline::runtime::events
