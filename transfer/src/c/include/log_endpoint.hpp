#pragma once

#include <optional>
#include <string>

namespace cbor_stream {

// ZeroMQ PUSH socket for `--log-endpoint`, owning its own context.
class LogEndpoint {
public:
    LogEndpoint();
    ~LogEndpoint();
    LogEndpoint(const LogEndpoint&) = delete;
    auto operator=(const LogEndpoint&) -> LogEndpoint& = delete;
public:
    auto connect(const std::string& endpoint) -> bool;
    auto channelSocket() const -> std::optional<void *>;
private:
    void *context;
    void *socket;
};

}
