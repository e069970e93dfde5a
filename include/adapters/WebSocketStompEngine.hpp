#pragma once
#include "adapters/StompFrame.hpp"
#include "stomp/IStompEngine.hpp"
#include "stomp/Types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

/*
WebSocketStompEngine:
  IStompEngine over a websocketpp client. The asio loop runs on one thread
  owned by the engine; every command is posted onto that loop and every
  delegate callback is delivered from it.

  Commands:   session --post--> [ws thread] --frames--> broker
  Callbacks:  broker --frames--> [ws thread] --delegate--> session

  The engine never reconnects by itself. A StompSession drops its delegate
  on socket loss, so a new connection is always started by the session's
  connect(); the auto-reconnect flag is accepted and ignored.
*/

namespace adapter {

typedef websocketpp::client<websocketpp::config::asio_client> WebSocketClientType;

class WebSocketStompEngine : public stomp::IStompEngine {
public:
    explicit WebSocketStompEngine(std::string endpoint, stomp::Headers connection_headers = {});
    ~WebSocketStompEngine() override;

    WebSocketStompEngine(const WebSocketStompEngine&) = delete;
    WebSocketStompEngine& operator=(const WebSocketStompEngine&) = delete;

    void set_delegate(stomp::IStompDelegate* delegate) override;

    void connect(std::chrono::milliseconds timeout, bool auto_reconnect) override;
    void disconnect(bool force) override;

    void subscribe(const std::string& destination) override;
    void unsubscribe(const std::string& destination) override;
    void send(const nlohmann::json& body, const std::string& destination) override;

    void enable_auto_ping(std::chrono::milliseconds interval) override;
    void set_auto_reconnect(bool enabled) override;

private:
    std::string endpoint_;
    stomp::Headers connection_headers_;

    WebSocketClientType ws_client_;
    std::unique_ptr<std::thread> ws_thread_;

    // Guarded by delegate_mutex_. Recursive because a delegate may clear
    // itself from inside a callback.
    std::recursive_mutex delegate_mutex_;
    stomp::IStompDelegate* delegate_{nullptr};

    // Everything below is touched only on the ws thread.
    websocketpp::connection_hdl hdl_;
    bool socket_open_{false};
    bool connection_pending_{false};
    bool close_on_open_{false};             // disconnect() arrived mid-handshake
    std::chrono::milliseconds timeout_{std::chrono::seconds(10)};
    std::chrono::milliseconds ping_interval_{0};
    WebSocketClientType::timer_ptr ping_timer_;
    WebSocketClientType::timer_ptr disconnect_timer_;
    std::map<std::string, std::string> subscriptions_;   // destination -> subscription id
    unsigned subscription_counter_{0};
    unsigned receipt_counter_{0};
    std::string disconnect_receipt_;
    std::string rx_buffer_;

    template <typename Fn>
    void post(Fn&& fn);

    template <typename Fn>
    void notify(Fn&& fn);

    void ensure_running();
    void open_connection();
    void close_socket(websocketpp::close::status::value code, const std::string& reason);
    void schedule_ping();
    void cancel_timers();
    void send_frame(const StompFrame& frame);
    void handle_frame(const StompFrame& frame, bool binary);

    void on_socket_open(websocketpp::connection_hdl hdl);
    void on_socket_close(websocketpp::connection_hdl hdl);
    void on_socket_fail(websocketpp::connection_hdl hdl);
    void on_socket_message(websocketpp::connection_hdl hdl, WebSocketClientType::message_ptr msg);
    void on_socket_lost();
};

} // namespace adapter
