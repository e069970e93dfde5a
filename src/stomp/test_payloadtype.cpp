/*
 * Candidate payload types and the JSON decoder they share.
 */

#include "stomp/IPayloadType.hpp"
#include "stomp/JsonDecoder.hpp"
#include "test_support.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

struct Order {
    std::string symbol;
    double qty{0.0};
    std::vector<std::string> tags;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Order, symbol, qty, tags)

stomp::Bytes bytes_of(const std::string& text) {
    return stomp::Bytes(text.begin(), text.end());
}

} // namespace

void test_decode_success() {
    std::cout << "[TEST] JsonPayloadType decodes a matching document\n";
    auto type = stomp::payload_type<Order>("Order");
    stomp::JsonDecoder decoder;

    auto decoded = type->try_decode(bytes_of(R"({"symbol":"BTCUSD","qty":0.5,"tags":["a","b"]})"), decoder);
    TEST_CHECK(decoded.has_value());
    const Order* order = std::any_cast<Order>(&*decoded);
    TEST_CHECK(order != nullptr);
    TEST_CHECK(order->symbol == "BTCUSD");
    TEST_CHECK(order->qty == 0.5);
    TEST_CHECK(order->tags.size() == 2);
    TEST_CHECK(type->name() == "Order");
}

void test_decode_mismatches() {
    std::cout << "[TEST] JsonPayloadType reports mismatches as nullopt\n";
    auto type = stomp::payload_type<Order>("Order");
    stomp::JsonDecoder decoder;

    // missing field
    TEST_CHECK(!type->try_decode(bytes_of(R"({"symbol":"BTCUSD","qty":0.5})"), decoder));
    // wrong field type
    TEST_CHECK(!type->try_decode(bytes_of(R"({"symbol":7,"qty":0.5,"tags":[]})"), decoder));
    // not an object
    TEST_CHECK(!type->try_decode(bytes_of("[1,2,3]"), decoder));
    // not json
    TEST_CHECK(!type->try_decode(bytes_of("{symbol:"), decoder));
    TEST_CHECK(!type->try_decode(stomp::Bytes{}, decoder));
}

void test_extra_fields_are_ignored() {
    std::cout << "[TEST] unknown fields do not prevent a match\n";
    auto type = stomp::payload_type<Order>("Order");
    stomp::JsonDecoder decoder;

    auto decoded = type->try_decode(
        bytes_of(R"({"symbol":"X","qty":1,"tags":[],"venue":"kraken"})"), decoder);
    TEST_CHECK(decoded.has_value());
}

void test_decoder_comment_option() {
    std::cout << "[TEST] comments need ignore_comments\n";
    auto type = stomp::payload_type<Order>("Order");
    const auto body = bytes_of("/* order */ {\"symbol\":\"X\",\"qty\":1,\"tags\":[]}");

    TEST_CHECK(!type->try_decode(body, stomp::JsonDecoder()));
    TEST_CHECK(type->try_decode(body, stomp::JsonDecoder(true)).has_value());
}

void test_decoder_throws_on_mismatch() {
    std::cout << "[TEST] JsonDecoder::decode throws nlohmann exceptions\n";
    stomp::JsonDecoder decoder;

    bool threw = false;
    try {
        decoder.decode<Order>(bytes_of(R"({"symbol":"X"})"));
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    TEST_CHECK(threw);

    TEST_CHECK(decoder.parse(bytes_of(R"({"a":1})"))["a"] == 1);
}

int main() {
    test_decode_success();
    test_decode_mismatches();
    test_extra_fields_are_ignored();
    test_decoder_comment_option();
    test_decoder_throws_on_mismatch();

    std::cout << "[TEST] all payload type tests passed\n";
    return 0;
}
