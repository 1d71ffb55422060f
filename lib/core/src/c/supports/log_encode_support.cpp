#include <magic_enum/magic_enum.hpp>

#include "cbor_encode.hpp"
#include "cbor_stream_writer.hpp"
#include "log_encode_support.hpp"

namespace cbor_stream {

auto encodeLogRecord(LogLevel log_level, const std::string& id, const std::string& message) -> std::vector<char> {
    CborEncoder payload_encoder;
    Writer writer(payload_encoder);

    auto record = writer.map(3);

    log_level: {
        record->write("level", magic_enum::enum_name(log_level));
    }
    id: {
        record->write("id", id);
    }
    message: {
        record->write("message", message);
    }

    record.close();

    return payload_encoder.rawBuffer();
}

}
