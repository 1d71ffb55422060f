#pragma once

#include <string>
#include <vector>

#include "log_channel.hpp"

namespace cbor_stream {

auto encodeLogRecord(LogLevel log_level, const std::string& id, const std::string& message) -> std::vector<char>;

}
