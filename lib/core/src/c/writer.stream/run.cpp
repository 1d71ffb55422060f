#ifndef DISABLE_CATCH2_TEST

#include <format>

#include <magic_enum/magic_enum.hpp>

#include "run.hpp"

using namespace cbor_stream;

namespace {
    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
}

auto describeValue(const Value& value) -> std::string {
    return std::visit(overloaded {
        [](std::nullptr_t) { return std::string("null"); },
        [](Undefined) { return std::string("undefined"); },
        [](bool v) { return std::string(v ? "true" : "false"); },
        [](uint64_t v) { return std::format("{}", v); },
        [](int64_t v) { return std::format("{}", v); },
        [](float v) { return std::format("{}f", v); },
        [](double v) { return std::format("{}", v); },
        [](const std::string& v) { return std::format("\"{}\"", v); },
        [](const Bytes& v) {
            return std::format("h'{}'", toHex(std::vector<char>(v.begin(), v.end())));
        },
        [](SimpleValue v) { return std::format("simple({})", v.value); },
    }, value.get());
}

auto toHex(const std::vector<char>& bytes) -> std::string {
    std::string buf;
    for (auto c: bytes) {
        buf.append(std::format("{:02x}", static_cast<uint8_t>(c)));
    }

    return buf;
}

auto bytesKey(std::string_view key) -> Value {
    return Value(Bytes(key.begin(), key.end()));
}

auto RecordingEncoder::encode(const Value& value) -> void {
    this->calls.push_back(std::format("encode({})", describeValue(value)));
}

auto RecordingEncoder::encodeLength(ContainerKind kind, uint64_t length) -> void {
    this->calls.push_back(std::format("header({}, {})", magic_enum::enum_name(kind), length));
}

auto RecordingEncoder::encodeIndefinite(ContainerKind kind) -> void {
    this->calls.push_back(std::format("indefinite({})", magic_enum::enum_name(kind)));
}

auto RecordingEncoder::encodeBreak() -> void {
    this->calls.push_back("break");
}

auto ProtocolErrorMatcher::match(const WriterProtocolError& ex) const -> bool {
    return ex.code() == this->code;
}

auto ProtocolErrorMatcher::describe() const -> std::string {
    return std::format("is WriterProtocolError({})", magic_enum::enum_name(this->code));
}

auto isProtocolError(WriterErrorCode code) -> ProtocolErrorMatcher {
    return ProtocolErrorMatcher(code);
}

auto encodeEntry(MapWriter& writer, const Value& key, const Node& node) -> void {
    if (auto *v = std::get_if<Value>(&node.item)) {
        writer.write(key, *v);
    }
    else if (auto *v = std::get_if<Fixed>(&node.item)) {
        auto scope = writer.array(key, v->items.size());
        for (auto& child: v->items) encodeNode(scope.writer(), child);
        scope.close();
    }
    else if (auto *v = std::get_if<Variable>(&node.item)) {
        auto scope = writer.array(key);
        for (auto& child: v->items) encodeNode(scope.writer(), child);
        scope.close();
    }
    else if (auto *v = std::get_if<FixedMap>(&node.item)) {
        auto scope = writer.map(key, v->entries.size());
        for (auto& [child_key, child]: v->entries) encodeEntry(scope.writer(), child_key, child);
        scope.close();
    }
    else if (auto *v = std::get_if<VariableMap>(&node.item)) {
        auto scope = writer.map(key);
        for (auto& [child_key, child]: v->entries) encodeEntry(scope.writer(), child_key, child);
        scope.close();
    }
}

auto encodeToHex(const Node& node) -> std::string {
    CborEncoder encoder;
    Writer writer(encoder);

    encodeNode(writer, node);

    return toHex(encoder.rawBuffer());
}

#endif
