#include <format>
#include <zmq.h>

#include <magic_enum/magic_enum.hpp>

#include "log_channel.hpp"
#include "log_encode_support.hpp"

namespace cbor_stream {

LogChannel::LogChannel(std::optional<void *> socket, const std::string& id, const std::string& from, std::ostream& out)
    : socket(socket), id(id), from(from), out(&out)
{

}

static auto sendInternal(void *socket, const std::string& from, const std::vector<char>& content) -> bool;

auto LogChannel::streamChannel(std::ostream& out, const std::string& from) -> LogChannel {
    return LogChannel(std::nullopt, "", from, out);
}

auto LogChannel::clone() -> LogChannel {
    return LogChannel(this->socket, this->id, this->from, *this->out);
}

auto LogChannel::info(const std::string& message) -> void {
    this->log(LogLevel::info, message);
}

auto LogChannel::warn(const std::string& message) -> void {
    this->log(LogLevel::warn, message);
}

auto LogChannel::err(const std::string& message) -> void {
    this->log(LogLevel::err, message);
}

auto LogChannel::debug(const std::string& message) -> void {
    this->log(LogLevel::debug, message);
}

auto LogChannel::log(LogLevel level, const std::string& message) -> void {
    if (! this->socket) {
        *this->out << std::format("log/level: {}, message: {}, from: {}", magic_enum::enum_name(level), message, this->from) << std::endl;
    }
    else {
        if (! sendInternal(this->socket.value(), this->from, encodeLogRecord(level, this->id, message))) {
            *this->out << std::format("log/level: {}, message: {}, from: {} (send failed: {})", magic_enum::enum_name(level), message, this->from, ::zmq_strerror(::zmq_errno())) << std::endl;
        }
    }
}

static auto sendInternal(void *socket, const std::string& from, const std::vector<char>& content) -> bool {
    event_type: {
        auto event_type = std::string("log");
        if (::zmq_send(socket, event_type.data(), event_type.length(), ZMQ_SNDMORE) < 0) return false;
    }
    from: {
        if (::zmq_send(socket, from.data(), from.length(), ZMQ_SNDMORE) < 0) return false;
    }
    payload: {
        if (::zmq_send(socket, content.data(), content.size(), ZMQ_SNDMORE) < 0) return false;
    }

    return ::zmq_send(socket, "", 0, 0) >= 0;
}

}
