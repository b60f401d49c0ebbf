#include "EventManager.hpp"
#include <algorithm>
#include <iostream>

EventManager::~EventManager() {
    std::lock_guard<std::mutex> ql(queueMutex);
    while (!eventQueue.empty()) eventQueue.pop();
    std::lock_guard<std::mutex> hl(handlersMutex);
    handlers.clear();
}

void EventManager::subscribe(HandlerPtr handler) {
    if (!handler) return;
    std::lock_guard<std::mutex> lock(handlersMutex);
    auto it = std::find(handlers.begin(), handlers.end(), handler);
    if (it == handlers.end()) handlers.push_back(handler);
}

void EventManager::unsubscribe(HandlerPtr handler) {
    if (!handler) return;
    std::lock_guard<std::mutex> lock(handlersMutex);
    handlers.erase(std::remove(handlers.begin(), handlers.end(), handler), handlers.end());
}

size_t EventManager::getHandlerCount() {
    std::lock_guard<std::mutex> lock(handlersMutex);
    return handlers.size();
}

bool EventManager::isSubscribed(HandlerPtr handler) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    return std::find(handlers.begin(), handlers.end(), handler) != handlers.end();
}

void EventManager::publish(const EventPtr &event) {
    if (!event) return;
    std::vector<HandlerPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        snapshot = handlers;
    }
    for (HandlerPtr h : snapshot) {
        // skip handlers unsubscribed by an earlier one
        if (!isSubscribed(h)) continue;
        try {
            h->onEvent(event);
        } catch (const std::exception &e) {
            std::cerr << "EventManager: handler failed on " << event->name() << ": " << e.what() << std::endl;
        }
    }
}

void EventManager::queue(const EventPtr &event) {
    if (!event) return;
    std::lock_guard<std::mutex> lock(queueMutex);
    eventQueue.push(event);
}

size_t EventManager::getQueuedCount() {
    std::lock_guard<std::mutex> lock(queueMutex);
    return eventQueue.size();
}

void EventManager::processQueued() {
    while (true) {
        EventPtr event;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (eventQueue.empty()) return;
            event = eventQueue.front();
            eventQueue.pop();
        }
        publish(event);
    }
}
