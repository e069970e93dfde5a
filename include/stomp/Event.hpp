#pragma once
#include <any>
#include <string>
#include <utility>

/*
Events the session hands to its registered handler. Produced only by the
session's callback side, never by the application.
*/

namespace stomp {

enum class EventType {
    Connecting,         // connect request has just been issued
    Connected,          // websocket and STOMP are both up
    Disconnected,       // both layers are down; no auto-reconnect follows
    PayloadReceived,    // a body decoded into one of the candidate types
    ErrorReceived
};

inline const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::Connecting: return "Connecting";
        case EventType::Connected: return "Connected";
        case EventType::Disconnected: return "Disconnected";
        case EventType::PayloadReceived: return "PayloadReceived";
        case EventType::ErrorReceived: return "ErrorReceived";
    }
    return "Unknown";
}

class Event {
public:
    static Event connecting()   { return Event(EventType::Connecting); }
    static Event connected()    { return Event(EventType::Connected); }
    static Event disconnected() { return Event(EventType::Disconnected); }

    static Event payload_received(std::any payload, std::string payload_type,
                                  std::string destination) {
        Event ev(EventType::PayloadReceived);
        ev.payload_ = std::move(payload);
        ev.payload_type_ = std::move(payload_type);
        ev.destination_ = std::move(destination);
        return ev;
    }

    static Event error_received(std::string description) {
        Event ev(EventType::ErrorReceived);
        ev.description_ = std::move(description);
        return ev;
    }

    EventType type() const { return type_; }

    // PayloadReceived only
    const std::any& payload() const { return payload_; }
    const std::string& payload_type() const { return payload_type_; }
    const std::string& destination() const { return destination_; }

    // Typed view of the payload; nullptr when the event carries something else.
    template <typename T>
    const T* payload_as() const { return std::any_cast<T>(&payload_); }

    // ErrorReceived only
    const std::string& description() const { return description_; }

private:
    explicit Event(EventType type) : type_(type) {}

    EventType   type_;
    std::any    payload_;
    std::string payload_type_;
    std::string destination_;
    std::string description_;
};

} // namespace stomp
