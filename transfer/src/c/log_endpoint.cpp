#include <zmq.h>

#include "log_endpoint.hpp"

namespace cbor_stream {

LogEndpoint::LogEndpoint(): context(nullptr), socket(nullptr) {

}

LogEndpoint::~LogEndpoint() {
    if (this->socket) ::zmq_close(this->socket);
    if (this->context) ::zmq_ctx_term(this->context);
}

auto LogEndpoint::connect(const std::string& endpoint) -> bool {
    this->context = ::zmq_ctx_new();
    if (! this->context) return false;

    this->socket = ::zmq_socket(this->context, ZMQ_PUSH);
    if (! this->socket) return false;

    // do not block process exit on undelivered log records
    int linger = 0;
    if (::zmq_setsockopt(this->socket, ZMQ_LINGER, &linger, sizeof(linger)) != 0) return false;

    return ::zmq_connect(this->socket, endpoint.c_str()) == 0;
}

auto LogEndpoint::channelSocket() const -> std::optional<void *> {
    if (! this->socket) return std::nullopt;
    return this->socket;
}

}
