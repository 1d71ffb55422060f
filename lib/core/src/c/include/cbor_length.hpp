#pragma once

#include <cstdint>
#include <concepts>
#include <format>
#include <optional>
#include <type_traits>
#include <variant>

#include "cbor_writer_errors.hpp"

namespace cbor_stream {

struct Indefinite {};

struct Definite {
    uint64_t count;
};

class Length {
public:
    Length(): tag(Indefinite{}) {}
    Length(std::nullopt_t): tag(Indefinite{}) {}

    template <std::integral T> requires (!std::same_as<T, bool>)
    Length(T count): tag(validate(count)) {}
public:
    static auto indefinite() -> Length { return Length(); }
    static auto definite(uint64_t count) -> Length { return Length(count); }
public:
    auto isIndefinite() const -> bool { return std::holds_alternative<Indefinite>(this->tag); }
    auto count() const -> std::optional<uint64_t> {
        if (auto *d = std::get_if<Definite>(&this->tag)) return d->count;
        return std::nullopt;
    }
private:
    template <std::integral T>
    static auto validate(T count) -> Definite {
        if constexpr (std::is_signed_v<T>) {
            if (count < 0) {
                throw ConfigurationError(std::format("Length must be a non-negative integer or absent (got: {})", count));
            }
        }
        return Definite{ static_cast<uint64_t>(count) };
    }
private:
    std::variant<Indefinite, Definite> tag;
};

}
