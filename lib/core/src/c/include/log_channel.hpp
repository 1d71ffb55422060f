#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cbor_stream {

enum class LogLevel {
    err,
    warn,
    info,
    debug,
};

class LogChannel {
public:
    LogChannel(std::optional<void *> socket, const std::string& id, const std::string& from, std::ostream& out = std::cout);
public:
    static auto streamChannel(std::ostream& out, const std::string& from) -> LogChannel;
    auto clone() -> LogChannel;
public:
    auto info(const std::string& message) -> void;
    auto warn(const std::string& message) -> void;
    auto err(const std::string& message) -> void;
    auto debug(const std::string& message) -> void;
    auto log(LogLevel level, const std::string& message) -> void;
private:
    std::optional<void *> socket;
    std::string id;
    std::string from;
    std::ostream *out;
};

}
