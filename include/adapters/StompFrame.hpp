#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adapter {

/**
 * StompFrame
 *
 * STOMP 1.2 frame: command, headers in wire order, body.
 * Header values are escaped on serialize and unescaped on extract, except on
 * CONNECT/CONNECTED, which STOMP 1.2 sends unescaped.
 */
class StompFrame {
public:
    using Header = std::pair<std::string, std::string>;

    StompFrame() = default;
    StompFrame(std::string command, std::vector<Header> headers, std::string body = "");

    const std::string& command() const { return command_; }
    const std::vector<Header>& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    // first occurrence wins for repeated headers
    std::optional<std::string> header(const std::string& name) const;
    void add_header(std::string name, std::string value);

    std::string serialize() const;

    /**
     * Remove one complete frame from the front of a stream buffer.
     * Leading heart-beat EOLs are consumed. Returns std::nullopt and leaves the
     * remaining bytes in place when no complete frame is buffered yet.
     * Throws std::runtime_error on a malformed frame.
     */
    static std::optional<StompFrame> extract(std::string& buffer);

    // ---- client frame builders ----

    static StompFrame connect(const std::string& host, const std::vector<Header>& extra_headers);
    static StompFrame subscribe(const std::string& destination, const std::string& subscription_id);
    static StompFrame unsubscribe(const std::string& subscription_id);
    static StompFrame send(const std::string& destination, const std::string& body,
                           const std::string& content_type);
    static StompFrame disconnect(const std::string& receipt_id);

private:
    std::string command_;
    std::vector<Header> headers_;
    std::string body_;

    bool escapes_headers() const;
    static std::string escape(const std::string& value);
    static std::string unescape(const std::string& value);
};

} // namespace adapter
