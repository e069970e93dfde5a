#include "adapters/WebSocketStompEngine.hpp"
#include <any>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>
#include <websocketpp/uri.hpp>

namespace adapter {

namespace {

bool same_connection(const websocketpp::connection_hdl& a, const websocketpp::connection_hdl& b) {
    return !a.owner_before(b) && !b.owner_before(a);
}

} // namespace

WebSocketStompEngine::WebSocketStompEngine(std::string endpoint, stomp::Headers connection_headers)
    : endpoint_(std::move(endpoint)),
      connection_headers_(std::move(connection_headers)) {
    // websocketpp logs every frame by default
    ws_client_.clear_access_channels(websocketpp::log::alevel::all);
    ws_client_.clear_error_channels(websocketpp::log::elevel::all);

    ws_client_.init_asio();

    ws_client_.set_open_handler([this](websocketpp::connection_hdl hdl) {
        on_socket_open(hdl);
    });
    ws_client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
        on_socket_close(hdl);
    });
    ws_client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        on_socket_fail(hdl);
    });
    ws_client_.set_message_handler([this](websocketpp::connection_hdl hdl,
                                          WebSocketClientType::message_ptr msg) {
        on_socket_message(hdl, msg);
    });
}

WebSocketStompEngine::~WebSocketStompEngine() {
    set_delegate(nullptr);
    if (ws_thread_) {
        ws_client_.stop_perpetual();
        ws_client_.stop();
        if (ws_thread_->joinable()) ws_thread_->join();
    }
}

void WebSocketStompEngine::set_delegate(stomp::IStompDelegate* delegate) {
    // blocks until an in-flight callback has returned
    std::lock_guard<std::recursive_mutex> lock(delegate_mutex_);
    delegate_ = delegate;
}

template <typename Fn>
void WebSocketStompEngine::post(Fn&& fn) {
    websocketpp::lib::asio::post(ws_client_.get_io_service(), std::forward<Fn>(fn));
}

template <typename Fn>
void WebSocketStompEngine::notify(Fn&& fn) {
    std::lock_guard<std::recursive_mutex> lock(delegate_mutex_);
    if (!delegate_) return;
    try {
        fn(*delegate_);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocketStompEngine] delegate threw: " << e.what() << "\n";
    }
}

void WebSocketStompEngine::ensure_running() {
    if (ws_thread_) return;

    // keep run() alive while no connection exists
    ws_client_.start_perpetual();
    ws_thread_ = std::make_unique<std::thread>([this]() {
        try {
            ws_client_.run();
        } catch (const std::exception& e) {
            std::cerr << "[WebSocketStompEngine] io loop error: " << e.what() << "\n";
        }
    });
}

// ---- commands (caller thread) ----

void WebSocketStompEngine::connect(std::chrono::milliseconds timeout, bool /*auto_reconnect*/) {
    ensure_running();
    post([this, timeout]() {
        timeout_ = timeout;
        if (socket_open_ || connection_pending_) return;
        open_connection();
    });
}

void WebSocketStompEngine::disconnect(bool force) {
    post([this, force]() {
        if (!socket_open_) {
            // websocketpp cannot close a handshake in progress
            if (connection_pending_) close_on_open_ = true;
            return;
        }

        if (force) {
            cancel_timers();
            close_socket(websocketpp::close::status::going_away, "forced disconnect");
            return;
        }

        if (!disconnect_receipt_.empty()) return;   // already disconnecting
        disconnect_receipt_ = "disconnect-" + std::to_string(++receipt_counter_);
        send_frame(StompFrame::disconnect(disconnect_receipt_));

        // brokers are not obliged to answer; close anyway after the timeout
        disconnect_timer_ = ws_client_.set_timer(timeout_.count(),
            [this](const websocketpp::lib::error_code& ec) {
                if (ec || !socket_open_ || disconnect_receipt_.empty()) return;
                std::cerr << "[WebSocketStompEngine] no DISCONNECT receipt, closing socket\n";
                disconnect_receipt_.clear();
                close_socket(websocketpp::close::status::normal, "STOMP disconnect timeout");
            });
    });
}

void WebSocketStompEngine::subscribe(const std::string& destination) {
    post([this, destination]() {
        if (!socket_open_) return;
        if (subscriptions_.count(destination)) return;

        std::string id = "sub-" + std::to_string(++subscription_counter_);
        subscriptions_[destination] = id;
        send_frame(StompFrame::subscribe(destination, id));
        std::cout << "[WebSocketStompEngine] subscribed to " << destination
                  << " (id=" << id << ")\n";
    });
}

void WebSocketStompEngine::unsubscribe(const std::string& destination) {
    post([this, destination]() {
        auto it = subscriptions_.find(destination);
        if (it == subscriptions_.end()) return;

        if (socket_open_) {
            send_frame(StompFrame::unsubscribe(it->second));
        }
        subscriptions_.erase(it);
        std::cout << "[WebSocketStompEngine] unsubscribed from " << destination << "\n";
    });
}

void WebSocketStompEngine::send(const nlohmann::json& body, const std::string& destination) {
    // invalid UTF-8 in a string becomes U+FFFD instead of throwing
    std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    post([this, destination, payload = std::move(payload)]() {
        if (!socket_open_) {
            std::cerr << "[WebSocketStompEngine] dropping SEND to " << destination
                      << ": socket closed\n";
            return;
        }
        send_frame(StompFrame::send(destination, payload, "application/json;charset=UTF-8"));
    });
}

void WebSocketStompEngine::enable_auto_ping(std::chrono::milliseconds interval) {
    post([this, interval]() {
        ping_interval_ = interval;
        if (ping_timer_) ping_timer_->cancel();
        schedule_ping();
    });
}

void WebSocketStompEngine::set_auto_reconnect(bool /*enabled*/) {
    // nothing to cancel: no reconnect is ever scheduled
}

// ---- ws thread ----

void WebSocketStompEngine::open_connection() {
    close_on_open_ = false;
    rx_buffer_.clear();

    websocketpp::lib::error_code ec;
    WebSocketClientType::connection_ptr con = ws_client_.get_connection(endpoint_, ec);
    if (!ec) {
        con->add_subprotocol("v12.stomp", ec);
    }
    if (!ec) {
        con->add_subprotocol("v11.stomp", ec);
    }
    if (ec) {
        // a bad endpoint does not get better with retries
        std::cerr << "[WebSocketStompEngine] cannot open " << endpoint_ << ": " << ec.message() << "\n";
        const std::string reason = ec.message();
        notify([&](stomp::IStompDelegate& d) {
            d.on_error("Could not open websocket", reason, std::nullopt, stomp::ErrorType::FromSocket);
        });
        notify([](stomp::IStompDelegate& d) { d.on_disconnect(stomp::DisconnectType::FromSocket); });
        return;
    }

    con->set_open_handshake_timeout(static_cast<long>(timeout_.count()));
    hdl_ = con->get_handle();
    connection_pending_ = true;

    std::cout << "[WebSocketStompEngine] connecting to " << endpoint_ << "\n";
    ws_client_.connect(con);
}

void WebSocketStompEngine::close_socket(websocketpp::close::status::value code, const std::string& reason) {
    websocketpp::lib::error_code ec;
    ws_client_.close(hdl_, code, reason, ec);
    if (ec) {
        std::cerr << "[WebSocketStompEngine] close failed: " << ec.message() << "\n";
    }
}

void WebSocketStompEngine::schedule_ping() {
    if (ping_interval_.count() <= 0 || !socket_open_) return;

    ping_timer_ = ws_client_.set_timer(static_cast<long>(ping_interval_.count()),
        [this](const websocketpp::lib::error_code& ec) {
            if (ec || !socket_open_) return;
            websocketpp::lib::error_code send_ec;
            ws_client_.send(hdl_, std::string("\n"), websocketpp::frame::opcode::text, send_ec);
            if (send_ec) {
                std::cerr << "[WebSocketStompEngine] heart-beat failed: " << send_ec.message() << "\n";
            }
            schedule_ping();
        });
}

void WebSocketStompEngine::cancel_timers() {
    if (ping_timer_) {
        ping_timer_->cancel();
        ping_timer_.reset();
    }
    if (disconnect_timer_) {
        disconnect_timer_->cancel();
        disconnect_timer_.reset();
    }
}

void WebSocketStompEngine::send_frame(const StompFrame& frame) {
    websocketpp::lib::error_code ec;
    ws_client_.send(hdl_, frame.serialize(), websocketpp::frame::opcode::text, ec);
    if (ec) {
        std::cerr << "[WebSocketStompEngine] failed to send " << frame.command()
                  << ": " << ec.message() << "\n";
        const std::string reason = ec.message();
        notify([&](stomp::IStompDelegate& d) {
            d.on_error("Failed to send " + frame.command() + " frame", reason,
                       std::nullopt, stomp::ErrorType::FromSocket);
        });
    }
}

void WebSocketStompEngine::on_socket_open(websocketpp::connection_hdl hdl) {
    if (!same_connection(hdl, hdl_)) return;

    connection_pending_ = false;
    socket_open_ = true;

    if (close_on_open_) {
        close_on_open_ = false;
        close_socket(websocketpp::close::status::going_away, "disconnect requested while connecting");
        return;
    }

    std::cout << "[WebSocketStompEngine] websocket open: " << endpoint_ << "\n";
    notify([this](stomp::IStompDelegate& d) { d.on_socket_event("open", endpoint_); });
    notify([](stomp::IStompDelegate& d) { d.on_connect(stomp::ConnectType::ToSocketEndpoint); });

    websocketpp::uri uri(endpoint_);
    std::vector<StompFrame::Header> extra(connection_headers_.begin(), connection_headers_.end());
    send_frame(StompFrame::connect(uri.get_valid() ? uri.get_host() : endpoint_, extra));
}

void WebSocketStompEngine::on_socket_close(websocketpp::connection_hdl hdl) {
    if (!same_connection(hdl, hdl_)) return;
    std::cout << "[WebSocketStompEngine] websocket closed: " << endpoint_ << "\n";
    on_socket_lost();
}

void WebSocketStompEngine::on_socket_fail(websocketpp::connection_hdl hdl) {
    if (!same_connection(hdl, hdl_)) return;

    std::string reason = "unknown failure";
    websocketpp::lib::error_code ec;
    WebSocketClientType::connection_ptr con = ws_client_.get_con_from_hdl(hdl, ec);
    if (con) {
        reason = con->get_ec().message();
    }
    std::cerr << "[WebSocketStompEngine] websocket failed: " << reason << "\n";

    notify([&](stomp::IStompDelegate& d) {
        d.on_error("WebSocket connection failed", reason, std::nullopt, stomp::ErrorType::FromSocket);
    });
    on_socket_lost();
}

void WebSocketStompEngine::on_socket_lost() {
    socket_open_ = false;
    connection_pending_ = false;
    close_on_open_ = false;
    cancel_timers();
    subscriptions_.clear();
    disconnect_receipt_.clear();
    rx_buffer_.clear();

    notify([this](stomp::IStompDelegate& d) { d.on_socket_event("close", endpoint_); });
    notify([](stomp::IStompDelegate& d) { d.on_disconnect(stomp::DisconnectType::FromSocket); });
}

void WebSocketStompEngine::on_socket_message(websocketpp::connection_hdl hdl,
                                             WebSocketClientType::message_ptr msg) {
    if (!same_connection(hdl, hdl_)) return;

    const bool binary = msg->get_opcode() == websocketpp::frame::opcode::binary;
    rx_buffer_ += msg->get_payload();

    try {
        while (auto frame = StompFrame::extract(rx_buffer_)) {
            handle_frame(*frame, binary);
        }
    } catch (const std::exception& e) {
        // resync on the next websocket message
        rx_buffer_.clear();
        std::cerr << "[WebSocketStompEngine] malformed frame: " << e.what() << "\n";
        const std::string reason = e.what();
        notify([&](stomp::IStompDelegate& d) {
            d.on_error("Malformed STOMP frame", reason, std::nullopt, stomp::ErrorType::FromStomp);
        });
    }
}

void WebSocketStompEngine::handle_frame(const StompFrame& frame, bool binary) {
    const std::string& command = frame.command();

    if (command == "CONNECTED") {
        std::cout << "[WebSocketStompEngine] STOMP connected (version="
                  << frame.header("version").value_or("1.0") << ")\n";
        notify([](stomp::IStompDelegate& d) { d.on_connect(stomp::ConnectType::ToStomp); });
    } else if (command == "MESSAGE") {
        std::any body;
        if (binary) {
            body = stomp::Bytes(frame.body().begin(), frame.body().end());
        } else {
            body = frame.body();
        }
        // repeated headers: the map keeps the first, as STOMP requires
        stomp::Headers headers(frame.headers().begin(), frame.headers().end());
        const std::string message_id = frame.header("message-id").value_or("");
        const std::string destination = frame.header("destination").value_or("");
        notify([&](stomp::IStompDelegate& d) {
            d.on_message_received(body, message_id, destination, headers);
        });
    } else if (command == "RECEIPT") {
        const std::string receipt_id = frame.header("receipt-id").value_or("");
        if (!disconnect_receipt_.empty() && receipt_id == disconnect_receipt_) {
            disconnect_receipt_.clear();
            if (disconnect_timer_) {
                disconnect_timer_->cancel();
                disconnect_timer_.reset();
            }
            notify([](stomp::IStompDelegate& d) { d.on_disconnect(stomp::DisconnectType::FromStomp); });
            close_socket(websocketpp::close::status::normal, "STOMP disconnect");
        } else {
            notify([&](stomp::IStompDelegate& d) { d.on_receipt(receipt_id); });
        }
    } else if (command == "ERROR") {
        std::optional<std::string> full_description;
        if (!frame.body().empty()) full_description = frame.body();
        const std::string brief = frame.header("message").value_or("Unknown STOMP error");
        const std::optional<std::string> receipt_id = frame.header("receipt-id");
        std::cerr << "[WebSocketStompEngine] STOMP error: " << brief << "\n";
        notify([&](stomp::IStompDelegate& d) {
            d.on_error(brief, full_description, receipt_id, stomp::ErrorType::FromStomp);
        });
    } else {
        std::cout << "[WebSocketStompEngine] ignoring unexpected frame: " << command << "\n";
    }
}

} // namespace adapter
