#pragma once
//
// Progress events emitted by PipelineEngine while a run is in progress.
// Delivered through boost::signals2 as a std::variant.
//

#include <boost/signals2/signal.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace epoch_pipeline::runtime::events {

using Timestamp = std::chrono::steady_clock::time_point;

// ============================================================================
// Run Events
// ============================================================================

struct RunStartedEvent {
  Timestamp timestamp;
  size_t total_nodes;
  size_t total_assets;
  size_t total_sessions;
  std::string first_session;
  std::string last_session;
};

struct RunCompletedEvent {
  Timestamp timestamp;
  std::chrono::milliseconds duration;
  size_t nodes_computed;
  size_t rows;
};

struct RunFailedEvent {
  Timestamp timestamp;
  std::chrono::milliseconds elapsed;
  std::string error_message;
};

struct RunCancelledEvent {
  Timestamp timestamp;
  std::chrono::milliseconds elapsed;
  size_t nodes_completed;
  size_t nodes_total;
};

// ============================================================================
// Node Events
// ============================================================================

struct NodeStartedEvent {
  Timestamp timestamp;
  size_t node_index;
  std::string term;
  std::string compute_id;
  bool is_leaf;
};

struct NodeCompletedEvent {
  Timestamp timestamp;
  size_t node_index;
  std::string term;
  std::chrono::milliseconds duration;
  size_t rows;
};

using EngineEvent = std::variant<RunStartedEvent, RunCompletedEvent, RunFailedEvent,
                                 RunCancelledEvent, NodeStartedEvent,
                                 NodeCompletedEvent>;

enum class EventType : uint8_t {
  RunStarted,
  RunCompleted,
  RunFailed,
  RunCancelled,
  NodeStarted,
  NodeCompleted
};

template <typename T> struct EventTypeFor;

template <> struct EventTypeFor<RunStartedEvent> {
  static constexpr EventType value = EventType::RunStarted;
};
template <> struct EventTypeFor<RunCompletedEvent> {
  static constexpr EventType value = EventType::RunCompleted;
};
template <> struct EventTypeFor<RunFailedEvent> {
  static constexpr EventType value = EventType::RunFailed;
};
template <> struct EventTypeFor<RunCancelledEvent> {
  static constexpr EventType value = EventType::RunCancelled;
};
template <> struct EventTypeFor<NodeStartedEvent> {
  static constexpr EventType value = EventType::NodeStarted;
};
template <> struct EventTypeFor<NodeCompletedEvent> {
  static constexpr EventType value = EventType::NodeCompleted;
};

inline EventType GetEventType(const EngineEvent &event) {
  return std::visit(
      [](const auto &e) -> EventType {
        return EventTypeFor<std::decay_t<decltype(e)>>::value;
      },
      event);
}

using EngineEventSignal = boost::signals2::signal<void(const EngineEvent &)>;
using EngineEventSlot = EngineEventSignal::slot_type;

inline Timestamp Now() { return std::chrono::steady_clock::now(); }

template <typename Duration> inline std::chrono::milliseconds ToMillis(Duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace epoch_pipeline::runtime::events
