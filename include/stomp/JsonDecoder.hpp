#pragma once
#include "stomp/Types.hpp"
#include <nlohmann/json.hpp>

namespace stomp {

/**
 * JsonDecoder
 *
 * Decoder settings shared by every candidate payload type of a session.
 * Default-constructed it parses strict JSON.
 */
class JsonDecoder {
public:
    using json = nlohmann::json;

    JsonDecoder() = default;
    explicit JsonDecoder(bool ignore_comments) : ignore_comments_(ignore_comments) {}

    bool ignore_comments() const { return ignore_comments_; }

    json parse(const Bytes& bytes) const {
        return json::parse(bytes.begin(), bytes.end(), nullptr, true, ignore_comments_);
    }

    /**
     * Parse `bytes` and convert through T's from_json.
     * Throws nlohmann::json::exception (or whatever from_json throws) on mismatch.
     */
    template <typename T>
    T decode(const Bytes& bytes) const {
        return parse(bytes).template get<T>();
    }

private:
    bool ignore_comments_{false};
};

} // namespace stomp
