#include <format>
#include <iostream>
#include <zmq.h>

#include "json_transfer.hpp"
#include "log_channel.hpp"
#include "log_endpoint.hpp"

using namespace cbor_stream;

auto main(int argc, char *argv[]) -> int {
    auto options = parseTransferOptions(std::vector<std::string>(argv + 1, argv + argc));
    if (! options) {
        std::cerr << transferUsage() << std::endl;
        return static_cast<int>(TransferResultCode::usage_error);
    }

    LogEndpoint endpoint;
    if (options->log_endpoint && (! endpoint.connect(options->log_endpoint.value()))) {
        std::cerr << std::format("Cannot connect log endpoint `{}`: {}", options->log_endpoint.value(), ::zmq_strerror(::zmq_errno())) << std::endl;
        return static_cast<int>(TransferResultCode::usage_error);
    }

    LogChannel channel(endpoint.channelSocket(), options->input_path, "json2cbor", std::cerr);

    return static_cast<int>(runTransfer(options.value(), channel));
}
