#pragma once

#include <cstdint>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace cbor_stream {

using Bytes = std::vector<uint8_t>;

// major type 7, argument 0..255 (20..23 are reserved for false/true/null/undefined)
struct SimpleValue {
    uint8_t value;
};

struct Undefined {};

class Value {
public:
    using Storage = std::variant<
        std::nullptr_t, Undefined, bool,
        uint64_t, int64_t,
        float, double,
        std::string, Bytes, SimpleValue
    >;
public:
    Value(std::nullptr_t): storage(nullptr) {}
    Value(Undefined v): storage(v) {}
    Value(bool v): storage(v) {}
    Value(float v): storage(v) {}
    Value(double v): storage(v) {}
    Value(const char *v): storage(std::string(v)) {}
    Value(std::string_view v): storage(std::string(v)) {}
    Value(std::string v): storage(std::move(v)) {}
    Value(Bytes v): storage(std::move(v)) {}
    Value(SimpleValue v): storage(v) {}

    template <std::integral T> requires (!std::same_as<T, bool>)
    Value(T v): storage(fromIntegral(v)) {}
public:
    auto get() const -> const Storage& { return this->storage; }
private:
    template <std::integral T>
    static auto fromIntegral(T v) -> Storage {
        if constexpr (std::is_signed_v<T>) {
            if (v < 0) return Storage(static_cast<int64_t>(v));
        }
        return Storage(static_cast<uint64_t>(v));
    }
private:
    Storage storage;
};

}
