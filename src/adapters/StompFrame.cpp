#include "adapters/StompFrame.hpp"
#include <stdexcept>

namespace adapter {

StompFrame::StompFrame(std::string command, std::vector<Header> headers, std::string body)
    : command_(std::move(command)), headers_(std::move(headers)), body_(std::move(body)) {}

std::optional<std::string> StompFrame::header(const std::string& name) const {
    for (const auto& [key, value] : headers_) {
        if (key == name) return value;
    }
    return std::nullopt;
}

void StompFrame::add_header(std::string name, std::string value) {
    headers_.emplace_back(std::move(name), std::move(value));
}

bool StompFrame::escapes_headers() const {
    return command_ != "CONNECT" && command_ != "CONNECTED";
}

std::string StompFrame::serialize() const {
    std::string out;
    out.reserve(command_.size() + body_.size() + 64);
    out += command_;
    out += '\n';

    const bool escaped = escapes_headers();
    for (const auto& [key, value] : headers_) {
        out += escaped ? escape(key) : key;
        out += ':';
        out += escaped ? escape(value) : value;
        out += '\n';
    }

    out += '\n';
    out += body_;
    out += '\0';
    return out;
}

std::optional<StompFrame> StompFrame::extract(std::string& buffer) {
    // heart-beats are bare EOLs between frames
    size_t start = 0;
    while (start < buffer.size() && (buffer[start] == '\n' || buffer[start] == '\r')) {
        ++start;
    }
    if (start > 0) buffer.erase(0, start);
    if (buffer.empty()) return std::nullopt;

    // command and headers end at the first blank line
    size_t header_end = std::string::npos;
    size_t body_start = 0;
    for (size_t i = buffer.find('\n'); i != std::string::npos; i = buffer.find('\n', i + 1)) {
        if (i + 1 < buffer.size() && buffer[i + 1] == '\n') {
            header_end = i;
            body_start = i + 2;
            break;
        }
        if (i + 2 < buffer.size() && buffer[i + 1] == '\r' && buffer[i + 2] == '\n') {
            header_end = i;
            body_start = i + 3;
            break;
        }
    }
    if (header_end == std::string::npos) return std::nullopt;

    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= header_end) {
        size_t eol = buffer.find('\n', pos);
        if (eol == std::string::npos || eol > header_end) eol = header_end;
        std::string line = buffer.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        pos = eol + 1;
    }
    if (lines.empty() || lines[0].empty()) {
        throw std::runtime_error("STOMP frame without a command");
    }

    StompFrame frame;
    frame.command_ = lines[0];
    const bool escaped = frame.escapes_headers();
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("malformed STOMP header line: '" + line + "'");
        }
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        if (escaped) {
            key = unescape(key);
            value = unescape(value);
        }
        frame.headers_.emplace_back(std::move(key), std::move(value));
    }

    size_t body_end = std::string::npos;
    if (auto length = frame.header("content-length")) {
        size_t content_length = 0;
        try {
            content_length = std::stoul(*length);
        } catch (const std::exception&) {
            throw std::runtime_error("invalid content-length '" + *length + "'");
        }
        // body plus the terminating NUL must be buffered
        if (buffer.size() < body_start + content_length + 1) return std::nullopt;
        body_end = body_start + content_length;
        if (buffer[body_end] != '\0') {
            throw std::runtime_error("STOMP body longer than its content-length");
        }
    } else {
        body_end = buffer.find('\0', body_start);
        if (body_end == std::string::npos) return std::nullopt;
    }

    frame.body_ = buffer.substr(body_start, body_end - body_start);
    buffer.erase(0, body_end + 1);
    return frame;
}

std::string StompFrame::escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case ':':  out += "\\c"; break;
            default:   out += ch; break;
        }
    }
    return out;
}

std::string StompFrame::unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '\\') {
            out += value[i];
            continue;
        }
        if (i + 1 >= value.size()) {
            throw std::runtime_error("dangling escape in STOMP header");
        }
        switch (value[++i]) {
            case '\\': out += '\\'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 'c':  out += ':'; break;
            default:
                throw std::runtime_error(std::string("undefined STOMP escape '\\") + value[i] + "'");
        }
    }
    return out;
}

// Client-side frame builders
StompFrame StompFrame::connect(const std::string& host, const std::vector<Header>& extra_headers) {
    std::vector<Header> headers{
        {"accept-version", "1.1,1.2"},
        {"host", host},
        {"heart-beat", "0,0"},
    };
    headers.insert(headers.end(), extra_headers.begin(), extra_headers.end());
    return StompFrame("CONNECT", std::move(headers));
}

StompFrame StompFrame::subscribe(const std::string& destination, const std::string& subscription_id) {
    return StompFrame("SUBSCRIBE", {
        {"id", subscription_id},
        {"destination", destination},
        {"ack", "auto"},
    });
}

StompFrame StompFrame::unsubscribe(const std::string& subscription_id) {
    return StompFrame("UNSUBSCRIBE", {{"id", subscription_id}});
}

StompFrame StompFrame::send(const std::string& destination, const std::string& body,
                            const std::string& content_type) {
    return StompFrame("SEND", {
        {"destination", destination},
        {"content-type", content_type},
        {"content-length", std::to_string(body.size())},
    }, body);
}

StompFrame StompFrame::disconnect(const std::string& receipt_id) {
    return StompFrame("DISCONNECT", {{"receipt", receipt_id}});
}

} // namespace adapter
