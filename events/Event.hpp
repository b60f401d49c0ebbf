#pragma once

#include <string>
#include <memory>

// Base class of everything published through EventManager
class Event {
public:
    using Ptr = std::shared_ptr<Event>;
    Event() = default;
    virtual ~Event() = default;

    // Short runtime name for logging
    virtual std::string name() const { return "Event"; }

    // One-line human readable description
    virtual std::string describe() const { return name(); }
};

template<typename T, typename... Args>
inline std::shared_ptr<T> make_event(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}
