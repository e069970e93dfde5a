#pragma once
#include "stomp/JsonDecoder.hpp"
#include "stomp/Types.hpp"
#include <any>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace stomp {

// One candidate shape an inbound body may decode into.
class IPayloadType {
public:
    virtual ~IPayloadType() = default;

    virtual const std::string& name() const = 0;

    // std::nullopt when `bytes` is not this type. Never throws.
    virtual std::optional<std::any> try_decode(const Bytes& bytes,
                                               const JsonDecoder& decoder) const = 0;
};

/**
 * JsonPayloadType<T>
 *
 * Candidate for any T with an nlohmann from_json (hand written or generated by
 * NLOHMANN_DEFINE_TYPE_*). A from_json that rejects the document by throwing
 * any std::exception counts as a mismatch.
 */
template <typename T>
class JsonPayloadType : public IPayloadType {
public:
    explicit JsonPayloadType(std::string name) : name_(std::move(name)) {}

    const std::string& name() const override { return name_; }

    std::optional<std::any> try_decode(const Bytes& bytes,
                                       const JsonDecoder& decoder) const override {
        try {
            return std::any(decoder.decode<T>(bytes));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

private:
    std::string name_;
};

using PayloadTypePtr = std::shared_ptr<const IPayloadType>;

template <typename T>
PayloadTypePtr payload_type(std::string name) {
    return std::make_shared<JsonPayloadType<T>>(std::move(name));
}

} // namespace stomp
