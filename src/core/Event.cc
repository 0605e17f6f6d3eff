#include "spill/core/Event.hh"
#include "spill/core/Log.hh"
#include "spill/utils/ErrorHandling.hh"
#include <algorithm>

namespace spill {

Event::Event(const std::string& type, const std::string& source) : type(type), source(source) {
    if (type.empty()) {
        throwError("Event type cannot be empty");
    }
}

const std::string& Event::getType() const {
    return type;
}

const std::string& Event::getSource() const {
    return source;
}

bool Event::hasPayload() const {
    std::lock_guard<std::mutex> lock(payloadMutex);
    return payload.has_value();
}

bool Event::isHandled() const {
    return handled;
}

void Event::setHandled(bool handled) {
    this->handled = handled;
}

bool Event::isCancelled() const {
    return cancelled;
}

void Event::setCancelled(bool cancelled) {
    this->cancelled = cancelled;
}

std::string EventDispatcher::addEventListener(const std::string& eventType, const EventHandler& handler,
                                              int32_t priority) {
    if (eventType.empty()) {
        throwError("Event type cannot be empty");
    }

    if (!handler) {
        throwError("Event handler cannot be null");
    }

    std::lock_guard<std::mutex> lock(listenersMutex);

    HandlerEntry entry;
    entry.id = eventType + "#" + std::to_string(nextHandlerId++);
    entry.handler = handler;
    entry.priority = priority;

    // Insert in priority-sorted order (lower priority first).
    // upper_bound preserves insertion order for equal priorities.
    auto& vec = listeners[eventType];
    auto pos = std::upper_bound(vec.begin(), vec.end(), entry,
                                [](const HandlerEntry& a, const HandlerEntry& b) { return a.priority < b.priority; });
    vec.insert(pos, entry);

    SPILL_LOG_DEBUG("Added event listener for type '{}' with ID '{}' (priority {})", eventType, entry.id, priority);

    return entry.id;
}

bool EventDispatcher::removeEventListener(const std::string& eventType, const std::string& handlerId) {
    std::lock_guard<std::mutex> lock(listenersMutex);

    auto it = listeners.find(eventType);
    if (it == listeners.end()) {
        return false;
    }

    auto& handlers = it->second;
    auto handlerIt = std::find_if(handlers.begin(), handlers.end(),
                                  [&handlerId](const HandlerEntry& entry) { return entry.id == handlerId; });

    if (handlerIt != handlers.end()) {
        handlers.erase(handlerIt);
        SPILL_LOG_DEBUG("Removed event listener for type '{}' with ID '{}'", eventType, handlerId);
        return true;
    }

    return false;
}

bool EventDispatcher::dispatchEvent(Event& event) {
    std::vector<HandlerEntry> handlersToInvoke;

    {
        std::lock_guard<std::mutex> lock(listenersMutex);

        auto it = listeners.find(event.getType());
        if (it == listeners.end()) {
            return false;
        }

        handlersToInvoke = it->second;
    }

    bool handled = false;

    for (const auto& entry : handlersToInvoke) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            SPILL_LOG_ERROR("Exception in '{}' handler {}: {}", event.getType(), entry.id, e.what());
        }
        if (event.isCancelled() || event.isHandled()) {
            handled = true;
            break;
        }
    }

    return handled;
}

size_t EventDispatcher::listenerCount(const std::string& eventType) const {
    std::lock_guard<std::mutex> lock(listenersMutex);
    auto it = listeners.find(eventType);
    return it == listeners.end() ? 0 : it->second.size();
}

} // namespace spill
