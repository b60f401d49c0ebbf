#pragma once

#include "Event.hpp"
#include "IEventHandler.hpp"
#include <vector>
#include <memory>
#include <mutex>
#include <queue>

// Thread-safe event manager. Handlers can subscribe/unsubscribe and events can be
// published immediately or queued for later processing.
class EventManager {
public:
    using EventPtr = std::shared_ptr<Event>;
    using HandlerPtr = IEventHandler*; // non-owning

    EventManager() = default;
    ~EventManager();

    // Duplicate registrations are ignored
    void subscribe(HandlerPtr handler);
    void unsubscribe(HandlerPtr handler);
    size_t getHandlerCount();

    // Handlers subscribed while an event is dispatched only see later events.
    // A handler throwing does not stop delivery to the others.
    void publish(const EventPtr &event);

    void queue(const EventPtr &event);
    size_t getQueuedCount();

    // Dispatches queued events in FIFO order, including ones queued by handlers meanwhile
    void processQueued();

private:
    bool isSubscribed(HandlerPtr handler);

    std::mutex handlersMutex;
    std::vector<HandlerPtr> handlers; // guarded by handlersMutex

    std::mutex queueMutex;
    std::queue<EventPtr> eventQueue; // guarded by queueMutex
};
