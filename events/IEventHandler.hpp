#pragma once

#include "Event.hpp"
#include <memory>

// Receives events published through an EventManager it is subscribed to
class IEventHandler {
public:
    using EventPtr = std::shared_ptr<Event>;
    virtual ~IEventHandler() = default;

    virtual void onEvent(const EventPtr &event) = 0;
};
