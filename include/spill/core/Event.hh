#pragma once

#include "spill/utils/ErrorHandling.hh"
#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace spill {

// Named event with a typed payload. Producers attach one payload struct
// (e.g. CastImpact) and handlers read it back with the same type.
class Event {
public:
  Event(const std::string& type, const std::string& source);
  virtual ~Event() = default;

  const std::string& getType() const;
  const std::string& getSource() const;

  template <typename T>
  void setPayload(T value) {
    std::lock_guard<std::mutex> lock(payloadMutex);
    payload = std::any(std::move(value));
  }

  template <typename T>
  const T& getPayload() const {
    std::lock_guard<std::mutex> lock(payloadMutex);
    if (!payload.has_value()) {
      throwError("Event '" + type + "' has no payload");
    }
    const T* value = std::any_cast<T>(&payload);
    if (!value) {
      throwError("Event '" + type + "' payload has incorrect type");
    }
    return *value;
  }

  bool hasPayload() const;

  bool isHandled() const;
  void setHandled(bool handled = true);

  bool isCancelled() const;
  void setCancelled(bool cancelled = true);

private:
  std::string type;
  std::string source;
  mutable std::mutex payloadMutex;
  std::any payload;
  std::atomic<bool> handled{false};
  std::atomic<bool> cancelled{false};
};

using EventHandler = std::function<void(Event&)>;

class EventDispatcher {
public:
  EventDispatcher() = default;

  // Subscribe with optional priority (lower runs first, default 0)
  std::string addEventListener(const std::string& eventType,
                               const EventHandler& handler,
                               int32_t priority = 0);

  bool removeEventListener(const std::string& eventType, const std::string& handlerId);

  // Handlers run on a snapshot of the listener list, so a handler may
  // unsubscribe itself (or others) while the event is in flight.
  bool dispatchEvent(Event& event);

  size_t listenerCount(const std::string& eventType) const;

private:
  struct HandlerEntry {
    std::string id;
    EventHandler handler;
    int32_t priority = 0;
  };

  mutable std::mutex listenersMutex;
  std::unordered_map<std::string, std::vector<HandlerEntry>> listeners;
  uint64_t nextHandlerId = 1;
};

} // namespace spill
