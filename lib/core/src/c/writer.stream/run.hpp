#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <catch2/matchers/catch_matchers.hpp>

#include "cbor_encode.hpp"
#include "cbor_stream_writer.hpp"

// Records every encoder call in order instead of producing bytes.
class RecordingEncoder: public cbor_stream::PrimitiveEncoder {
public:
    auto encode(const cbor_stream::Value& value) -> void override;
    auto encodeLength(cbor_stream::ContainerKind kind, uint64_t length) -> void override;
    auto encodeIndefinite(cbor_stream::ContainerKind kind) -> void override;
    auto encodeBreak() -> void override;
public:
    std::vector<std::string> calls;
};

auto describeValue(const cbor_stream::Value& value) -> std::string;
auto toHex(const std::vector<char>& bytes) -> std::string;
auto bytesKey(std::string_view key) -> cbor_stream::Value;

class ProtocolErrorMatcher: public Catch::Matchers::MatcherBase<cbor_stream::WriterProtocolError> {
public:
    explicit ProtocolErrorMatcher(cbor_stream::WriterErrorCode code): code(code) {}
public:
    auto match(const cbor_stream::WriterProtocolError& ex) const -> bool override;
    auto describe() const -> std::string override;
private:
    cbor_stream::WriterErrorCode code;
};

auto isProtocolError(cbor_stream::WriterErrorCode code) -> ProtocolErrorMatcher;

// Test document tree: Fixed/FixedMap are written with a definite length, Variable/VariableMap indefinite.
struct Node;

using NodeList = std::vector<Node>;
using NodeEntries = std::vector<std::pair<cbor_stream::Value, Node>>;

struct Fixed { NodeList items; };
struct Variable { NodeList items; };
struct FixedMap { NodeEntries entries; };
struct VariableMap { NodeEntries entries; };

struct Node {
    template <typename T> requires std::constructible_from<cbor_stream::Value, T>
    Node(T v): item(cbor_stream::Value(v)) {}
    Node(Fixed v): item(std::move(v)) {}
    Node(Variable v): item(std::move(v)) {}
    Node(FixedMap v): item(std::move(v)) {}
    Node(VariableMap v): item(std::move(v)) {}
public:
    std::variant<cbor_stream::Value, Fixed, Variable, FixedMap, VariableMap> item;
};

template <cbor_stream::SequenceWriter W>
auto encodeNode(W& writer, const Node& node) -> void;
auto encodeEntry(cbor_stream::MapWriter& writer, const cbor_stream::Value& key, const Node& node) -> void;

auto encodeToHex(const Node& node) -> std::string;

template <cbor_stream::SequenceWriter W>
auto encodeNode(W& writer, const Node& node) -> void {
    if (auto *v = std::get_if<cbor_stream::Value>(&node.item)) {
        writer.write(*v);
    }
    else if (auto *v = std::get_if<Fixed>(&node.item)) {
        auto scope = writer.array(v->items.size());
        for (auto& child: v->items) encodeNode(scope.writer(), child);
        scope.close();
    }
    else if (auto *v = std::get_if<Variable>(&node.item)) {
        auto scope = writer.array();
        for (auto& child: v->items) encodeNode(scope.writer(), child);
        scope.close();
    }
    else if (auto *v = std::get_if<FixedMap>(&node.item)) {
        auto scope = writer.map(v->entries.size());
        for (auto& [key, child]: v->entries) encodeEntry(scope.writer(), key, child);
        scope.close();
    }
    else if (auto *v = std::get_if<VariableMap>(&node.item)) {
        auto scope = writer.map();
        for (auto& [key, child]: v->entries) encodeEntry(scope.writer(), key, child);
        scope.close();
    }
}
