#pragma once
#include <stdexcept>
#include <string>

namespace stomp {

class StompSessionError : public std::runtime_error {
public:
    explicit StompSessionError(const std::string& what_arg)
        : std::runtime_error(what_arg) {}
};

// connect() while the STOMP layer is already up; disconnect first
class AlreadyConnectedError : public StompSessionError {
public:
    AlreadyConnectedError()
        : StompSessionError("session is already connected via STOMP.") {}
};

// subscribe/unsubscribe/send before the STOMP layer is up
class NotConnectedError : public StompSessionError {
public:
    NotConnectedError()
        : StompSessionError("session is not connected via STOMP.") {}

    explicit NotConnectedError(const std::string& operation)
        : StompSessionError("cannot " + operation + ": session is not connected via STOMP.") {}
};

} // namespace stomp
