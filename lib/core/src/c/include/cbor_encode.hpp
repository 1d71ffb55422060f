#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "cbor_value.hpp"

namespace cbor_stream {

// values are the CBOR major types
enum class ContainerKind: uint64_t {
    Array = 4,
    Map = 5,
};

class PrimitiveEncoder {
public:
    virtual ~PrimitiveEncoder() = default;
public:
    virtual auto encode(const Value& value) -> void = 0;
    virtual auto encodeLength(ContainerKind kind, uint64_t length) -> void = 0;
    virtual auto encodeIndefinite(ContainerKind kind) -> void = 0;
    virtual auto encodeBreak() -> void = 0;
};

class CborEncoder: public PrimitiveEncoder {
    std::vector<char> buf;
    std::ostream *out;
public:
    CborEncoder(): buf(), out(nullptr) {}
    explicit CborEncoder(std::ostream& out): buf(), out(&out) {}
public:
    auto encode(const Value& value) -> void override;
    auto encodeLength(ContainerKind kind, uint64_t length) -> void override;
    auto encodeIndefinite(ContainerKind kind) -> void override;
    auto encodeBreak() -> void override;
public:
    auto addUInt(uint64_t value) -> void;
    auto addInt(int64_t value) -> void;
    auto addString(std::string_view value) -> void;
    auto addBinary(const Bytes& value) -> void;
    auto addBool(bool value) -> void;
    auto addNull() -> void;
    auto addUndefined() -> void;
    auto addSimple(uint8_t value) -> void;
    auto addFloat(float value) -> void;
    auto addDouble(double value) -> void;
public:
    auto static encodeBool(bool value) -> std::vector<char>;
public:
    auto rawBuffer() const -> std::vector<char>;
private:
    auto append(const char *data, size_t len) -> void;
};

}
