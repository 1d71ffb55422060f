#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cbor_stream_writer.hpp"
#include "log_channel.hpp"

namespace cbor_stream {

enum class TransferResultCode {
    no_error = 0,
    usage_error,
    invalid_json,
    encode_failed,
};

struct TransferOptions {
    std::string input_path;
    std::string output_path;
    bool indefinite;
    std::optional<std::string> log_endpoint;
};

auto parseTransferOptions(const std::vector<std::string>& args) -> std::optional<TransferOptions>;
auto transferUsage() -> std::string;

// Streams `doc` through `writer` as a single top-level item.
auto transferJson(Writer& writer, const nlohmann::json& doc, bool indefinite) -> void;

// Reads `options.input_path`, writes `options.output_path` ("-" for stdin/stdout) and reports failures to `channel`.
auto runTransfer(const TransferOptions& options, LogChannel& channel) -> TransferResultCode;

}
