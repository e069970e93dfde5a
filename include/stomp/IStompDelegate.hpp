#pragma once
#include "stomp/Types.hpp"
#include <any>
#include <optional>
#include <string>

/*
the callback interface an engine drives. StompSession implements it; the
engine only ever holds a non-owning pointer to it.
*/

namespace stomp {

class IStompDelegate {
public:
    virtual ~IStompDelegate() = default;

    virtual void on_connect(ConnectType type) = 0;
    virtual void on_disconnect(DisconnectType type) = 0;

    // `message` is whatever the engine read off the wire: std::string for
    // text frames, Bytes for binary ones.
    virtual void on_message_received(const std::any& message,
                                     const std::string& message_id,
                                     const std::string& destination,
                                     const Headers& headers) = 0;

    virtual void on_error(const std::string& brief_description,
                          const std::optional<std::string>& full_description,
                          const std::optional<std::string>& receipt_id,
                          ErrorType type) = 0;

    virtual void on_receipt(const std::string& /*receipt_id*/) {}
    virtual void on_socket_event(const std::string& /*name*/,
                                 const std::string& /*description*/) {}
};

} // namespace stomp
