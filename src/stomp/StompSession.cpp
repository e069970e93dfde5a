/*
 * StompSession command side: admission control and the state transitions
 * driven by the application's own calls.
 */

#include "stomp/StompSession.hpp"
#include "stomp/Errors.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace stomp {

StompSession::StompSession(std::unique_ptr<IStompEngine> engine, SessionConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {
    if (!engine_) {
        throw std::invalid_argument("StompSession requires an engine");
    }
    if (!config_.event_handler) {
        config_.event_handler = [](StompSession&, const Event&) {};
    }
}

StompSession::~StompSession() {
    // Unconditional: even after a socket disconnect released the registration,
    // the engine may still be inside the callback that emitted Disconnected.
    // Clearing the delegate blocks until that callback has returned.
    registered_ = false;
    engine_->set_delegate(nullptr);
}

void StompSession::connect() {
    if (is_connecting()) {
        return;
    }
    if (is_connected_via_stomp()) {
        throw AlreadyConnectedError();
    }

    // State and event go first: the engine may report the outcome from its
    // own thread before its connect() returns.
    register_with_engine();
    state_ = ConnectionState::Connecting;

#ifdef STOMP_DEBUG
    std::cout << "[StompSession] connecting to " << config_.endpoint << "\n";
#endif

    emit(Event::connecting());
    engine_->connect(config_.connection_timeout, true);
}

void StompSession::disconnect(bool force) {
    // no reconnect attempts after an explicit disconnect
    engine_->set_auto_reconnect(false);
    engine_->disconnect(force);

    if (force) {
        release_engine_callbacks();
        state_ = ConnectionState::Disconnected;
        emit(Event::disconnected());
    }
}

void StompSession::subscribe(const std::string& destination) {
    if (!is_connected_via_stomp()) {
        throw NotConnectedError("subscribe to '" + destination + "'");
    }
    engine_->subscribe(destination);
}

void StompSession::unsubscribe(const std::string& destination) {
    if (!is_connected_via_stomp()) {
        throw NotConnectedError("unsubscribe from '" + destination + "'");
    }
    engine_->unsubscribe(destination);
}

void StompSession::send(const nlohmann::json& payload, const std::string& destination) {
    if (!is_connected_via_stomp()) {
        throw NotConnectedError("send to '" + destination + "'");
    }
    engine_->send(payload, destination);
}

void StompSession::set_event_handler(EventHandler handler) {
    if (!handler) {
        handler = [](StompSession&, const Event&) {};
    }
    config_.event_handler = std::move(handler);
}

void StompSession::emit(const Event& ev) {
#ifdef STOMP_DEBUG
    std::cout << "[StompSession] emit " << event_type_to_string(ev.type()) << "\n";
#endif
    config_.event_handler(*this, ev);
}

void StompSession::register_with_engine() {
    engine_->set_delegate(this);
    registered_ = true;
}

// Breaks the engine -> session link once per registration: on the terminal
// socket disconnect or on a forced disconnect.
void StompSession::release_engine_callbacks() {
    if (!registered_.exchange(false)) return;
    engine_->set_delegate(nullptr);
}

} // namespace stomp
