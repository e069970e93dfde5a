#pragma once
#include "stomp/Event.hpp"
#include "stomp/IPayloadType.hpp"
#include "stomp/IStompEngine.hpp"
#include "stomp/JsonDecoder.hpp"
#include "stomp/Types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/*
StompSession:
  Facade over a STOMP engine. The public half is admission control plus
  state bookkeeping (connect/disconnect/subscribe/unsubscribe/send); the
  IStompDelegate half turns engine callbacks into Events for the handler.

  [application] --commands--> StompSession --commands--> IStompEngine
  [application] <--Events---- StompSession <--callbacks-- IStompEngine

  Not thread safe: operations and engine callbacks are expected to be
  serialized on one context. Only the state projections may be read from
  anywhere.
*/

namespace stomp {

class StompSession;

using EventHandler = std::function<void(StompSession&, const Event&)>;

struct SessionConfig {
    std::string endpoint;                       // ws:// or wss:// URL of the broker
    Headers     connection_headers;
    std::chrono::milliseconds connection_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds auto_ping_interval{std::chrono::seconds(10)};
    std::vector<PayloadTypePtr> payload_types;  // tried in order, first match wins
    JsonDecoder  decoder;
    EventHandler event_handler = [](StompSession&, const Event&) {};
};

class StompSession : public IStompDelegate {
public:
    StompSession(std::unique_ptr<IStompEngine> engine, SessionConfig config);
    ~StompSession() override;

    StompSession(const StompSession&) = delete;
    StompSession& operator=(const StompSession&) = delete;

    // No-op while connecting. Throws AlreadyConnectedError when fully connected.
    void connect();

    // force: tear down without a STOMP DISCONNECT and report Disconnected now.
    // Otherwise Disconnected arrives once the engine reports the socket closed.
    void disconnect(bool force = false);

    // All three throw NotConnectedError unless fully connected.
    void subscribe(const std::string& destination);
    void unsubscribe(const std::string& destination);
    void send(const nlohmann::json& payload, const std::string& destination);

    bool is_connected_via_stomp() const { return state_ == ConnectionState::FullyConnected; }
    bool is_connecting() const { return state_ == ConnectionState::Connecting; }
    ConnectionState state() const { return state_; }

    // Replaces the previous handler.
    void set_event_handler(EventHandler handler);

    const SessionConfig& config() const { return config_; }

    // ---- IStompDelegate ----

    void on_connect(ConnectType type) override;
    void on_disconnect(DisconnectType type) override;
    void on_message_received(const std::any& message,
                             const std::string& message_id,
                             const std::string& destination,
                             const Headers& headers) override;
    void on_error(const std::string& brief_description,
                  const std::optional<std::string>& full_description,
                  const std::optional<std::string>& receipt_id,
                  ErrorType type) override;
    void on_receipt(const std::string& receipt_id) override;
    void on_socket_event(const std::string& name, const std::string& description) override;

private:
    void emit(const Event& ev);
    void register_with_engine();
    void release_engine_callbacks();

    std::unique_ptr<IStompEngine> engine_;
    SessionConfig config_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> registered_{false};    // engine currently holds our delegate pointer
};

} // namespace stomp
