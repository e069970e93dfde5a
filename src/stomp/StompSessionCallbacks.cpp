/*
 * StompSession callback side: translates engine callbacks into Events.
 */

#include "stomp/StompSession.hpp"
#include <iostream>

namespace stomp {

namespace {

// Text and binary bodies are both accepted; anything else has no bytes.
std::optional<Bytes> message_bytes(const std::any& message) {
    if (const auto* text = std::any_cast<std::string>(&message)) {
        return Bytes(text->begin(), text->end());
    }
    if (const auto* data = std::any_cast<Bytes>(&message)) {
        return *data;
    }
    return std::nullopt;
}

} // namespace

void StompSession::on_connect(ConnectType type) {
    switch (type) {
        case ConnectType::ToSocketEndpoint:
            // socket only; the STOMP handshake is still in flight
            state_ = ConnectionState::SocketConnected;
            break;
        case ConnectType::ToStomp:
            // keep-alive pings only make sense once STOMP is up
            engine_->enable_auto_ping(config_.auto_ping_interval);
            state_ = ConnectionState::FullyConnected;
            emit(Event::connected());
            break;
    }
}

void StompSession::on_disconnect(DisconnectType type) {
    switch (type) {
        case DisconnectType::FromSocket:
            // released before emitting so a handler may connect() again
            state_ = ConnectionState::Disconnected;
            release_engine_callbacks();
            emit(Event::disconnected());
            break;
        case DisconnectType::FromStomp:
            // The socket is still open. With auto-reconnect on, the engine
            // brings STOMP back by itself; otherwise the socket closes soon.
            if (state_ == ConnectionState::FullyConnected) {
                state_ = ConnectionState::SocketConnected;
            }
            std::cout << "[StompSession] STOMP layer dropped, socket still open\n";
            break;
    }
}

void StompSession::on_message_received(const std::any& message,
                                       const std::string& message_id,
                                       const std::string& destination,
                                       const Headers& /*headers*/) {
    auto bytes = message_bytes(message);
    if (!bytes) {
#ifdef STOMP_DEBUG
        std::cout << "[StompSession] dropping message " << message_id
                  << ": unsupported body representation\n";
#endif
        return;
    }

    for (const auto& candidate : config_.payload_types) {
        if (!candidate) continue;
        auto decoded = candidate->try_decode(*bytes, config_.decoder);
        if (decoded) {
            emit(Event::payload_received(std::move(*decoded), candidate->name(), destination));
            return;
        }
    }

#ifdef STOMP_DEBUG
    std::cout << "[StompSession] message " << message_id << " on " << destination
              << " matched no payload type\n";
#endif
}

void StompSession::on_error(const std::string& brief_description,
                            const std::optional<std::string>& /*full_description*/,
                            const std::optional<std::string>& /*receipt_id*/,
                            ErrorType /*type*/) {
    emit(Event::error_received(brief_description));
}

void StompSession::on_receipt(const std::string& /*receipt_id*/) {
}

void StompSession::on_socket_event(const std::string& /*name*/,
                                   const std::string& /*description*/) {
}

} // namespace stomp
