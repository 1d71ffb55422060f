#include <format>
#include <string>

#include <magic_enum/magic_enum.hpp>

#include "cbor/encoder.h"

#include "cbor_encode.hpp"
#include "cbor_writer_errors.hpp"

namespace cbor_stream {

struct CborTypes {
    static const uint64_t PINTEGER = 0;
    static const uint64_t NINTEGER = 1;
    static const uint64_t BITES = 2;
    static const uint64_t STRING = 3;
};

const size_t MAX_BUFFER_SIZE = 9;

static auto ensureEncoded(cbor_error_t err, std::string_view item) -> void {
    if (err != CBOR_SUCCESS) {
        throw EncodeError(std::format("Failed to encode {} ({})", item, magic_enum::enum_name(err)));
    }
}

static auto cborHeader(uint64_t id, uint64_t len) -> std::string {
    cbor_writer_t writer;
    uint8_t buf[MAX_BUFFER_SIZE] = {};
    cbor_writer_init(&writer, buf, MAX_BUFFER_SIZE);

    ensureEncoded(cbor_encode_unsigned_integer(&writer, len), "header");

    writer.buf[0] |= ((id & 0b0111) << 5);

    return std::string(reinterpret_cast<char*>(writer.buf), writer.bufidx);
}

template <typename Fn>
static auto encodeSingle(Fn&& fn, std::string_view item) -> std::string {
    cbor_writer_t writer;
    uint8_t buf[MAX_BUFFER_SIZE] = {};
    cbor_writer_init(&writer, buf, MAX_BUFFER_SIZE);

    ensureEncoded(fn(&writer), item);

    return std::string(reinterpret_cast<char*>(writer.buf), writer.bufidx);
}

auto CborEncoder::encodeBool(bool value) -> std::vector<char> {
    auto data = encodeSingle([value](cbor_writer_t *w) { return cbor_encode_bool(w, value); }, "bool");
    return std::vector<char>(data.begin(), data.end());
}

auto CborEncoder::append(const char *data, size_t len) -> void {
    if (! this->out) {
        this->buf.insert(this->buf.end(), data, data + len);
        return;
    }

    this->out->write(data, static_cast<std::streamsize>(len));
    if (! *this->out) {
        throw EncodeError(std::format("Failed to write {} byte(s) to output stream", len));
    }
}

auto CborEncoder::addUInt(uint64_t value) -> void {
    auto data = cborHeader(CborTypes::PINTEGER, value);
    this->append(data.data(), data.size());
}

auto CborEncoder::addInt(int64_t value) -> void {
    if (value >= 0) {
        this->addUInt(static_cast<uint64_t>(value));
        return;
    }

    // -1 - n without overflowing on INT64_MIN
    auto data = cborHeader(CborTypes::NINTEGER, static_cast<uint64_t>(-(value + 1)));
    this->append(data.data(), data.size());
}

auto CborEncoder::addString(std::string_view value) -> void {
    header: {
        auto header = cborHeader(CborTypes::STRING, value.size());
        this->append(header.data(), header.size());
    }
    payload: {
        this->append(value.data(), value.size());
    }
}

auto CborEncoder::addBinary(const Bytes& value) -> void {
    header: {
        auto header = cborHeader(CborTypes::BITES, value.size());
        this->append(header.data(), header.size());
    }
    payload: {
        this->append(reinterpret_cast<const char*>(value.data()), value.size());
    }
}

auto CborEncoder::addBool(bool value) -> void {
    auto data = CborEncoder::encodeBool(value);
    this->append(data.data(), data.size());
}

auto CborEncoder::addNull() -> void {
    auto data = encodeSingle([](cbor_writer_t *w) { return cbor_encode_null(w); }, "null");
    this->append(data.data(), data.size());
}

auto CborEncoder::addUndefined() -> void {
    auto data = encodeSingle([](cbor_writer_t *w) { return cbor_encode_undefined(w); }, "undefined");
    this->append(data.data(), data.size());
}

auto CborEncoder::addSimple(uint8_t value) -> void {
    auto data = encodeSingle([value](cbor_writer_t *w) { return cbor_encode_simple(w, value); }, "simple value");
    this->append(data.data(), data.size());
}

auto CborEncoder::addFloat(float value) -> void {
    auto data = encodeSingle([value](cbor_writer_t *w) { return cbor_encode_float(w, value); }, "float");
    this->append(data.data(), data.size());
}

auto CborEncoder::addDouble(double value) -> void {
    auto data = encodeSingle([value](cbor_writer_t *w) { return cbor_encode_double(w, value); }, "double");
    this->append(data.data(), data.size());
}

namespace {
    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
}

auto CborEncoder::encode(const Value& value) -> void {
    std::visit(overloaded {
        [this](std::nullptr_t) { this->addNull(); },
        [this](Undefined) { this->addUndefined(); },
        [this](bool v) { this->addBool(v); },
        [this](uint64_t v) { this->addUInt(v); },
        [this](int64_t v) { this->addInt(v); },
        [this](float v) { this->addFloat(v); },
        [this](double v) { this->addDouble(v); },
        [this](const std::string& v) { this->addString(v); },
        [this](const Bytes& v) { this->addBinary(v); },
        [this](SimpleValue v) { this->addSimple(v.value); },
    }, value.get());
}

auto CborEncoder::encodeLength(ContainerKind kind, uint64_t length) -> void {
    auto header = cborHeader(static_cast<uint64_t>(kind), length);
    this->append(header.data(), header.size());
}

auto CborEncoder::encodeIndefinite(ContainerKind kind) -> void {
    auto data = (kind == ContainerKind::Array)
        ? encodeSingle([](cbor_writer_t *w) { return cbor_encode_array_indefinite(w); }, "indefinite array")
        : encodeSingle([](cbor_writer_t *w) { return cbor_encode_map_indefinite(w); }, "indefinite map")
    ;
    this->append(data.data(), data.size());
}

auto CborEncoder::encodeBreak() -> void {
    auto data = encodeSingle([](cbor_writer_t *w) { return cbor_encode_break(w); }, "break");
    this->append(data.data(), data.size());
}

auto CborEncoder::rawBuffer() const -> std::vector<char> {
    return this->buf;
}

}
