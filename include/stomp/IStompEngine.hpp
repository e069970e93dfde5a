#pragma once
#include "stomp/IStompDelegate.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

/*
the interface in which STOMP engines -- the classes that own the socket, the
framing and the reconnect policy -- inherit. Every command is fire-and-forget;
results come back later through the delegate.
*/

namespace stomp {

class IStompEngine {
public:
    virtual ~IStompEngine() = default;

    // nullptr stops callback delivery
    virtual void set_delegate(IStompDelegate* delegate) = 0;

    virtual void connect(std::chrono::milliseconds timeout, bool auto_reconnect) = 0;
    virtual void disconnect(bool force) = 0;

    virtual void subscribe(const std::string& destination) = 0;
    virtual void unsubscribe(const std::string& destination) = 0;

    // the engine owns the wire encoding of `body`
    virtual void send(const nlohmann::json& body, const std::string& destination) = 0;

    virtual void enable_auto_ping(std::chrono::milliseconds interval) = 0;
    virtual void set_auto_reconnect(bool enabled) = 0;
};

} // namespace stomp
