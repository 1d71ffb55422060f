#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <optional>
#include <utility>

#include "cbor_encode.hpp"
#include "cbor_length.hpp"
#include "cbor_value.hpp"
#include "cbor_writer_errors.hpp"
#include "log_channel.hpp"

namespace cbor_stream {

enum class ScopeState {Unopened, Open, Closed};

// Bookkeeping for one container instance, shared by the scope guard and the nested writer.
class ContainerState {
public:
    // `parent_children` counts the open scopes of the enclosing container (or writer).
    ContainerState(PrimitiveEncoder& encoder, ContainerKind kind, const Length& length, LogChannel *log, std::size_t *parent_children);
public:
    // Emits the definite header or the indefinite start marker.
    auto open() -> void;
    // Takes one element (array) or one key/value pair (map) slot.
    auto commit() -> void;
    // Emits the break token (indefinite) or checks that every declared slot was used (definite).
    auto close() -> void;
public:
    auto capacity() const -> std::optional<uint64_t> { return this->remaining; }
    auto state() const -> ScopeState { return this->scope_state; }
    auto encoder() -> PrimitiveEncoder& { return *this->encoder_ref; }
    auto logChannel() -> LogChannel * { return this->log; }
    auto childCounter() -> std::size_t * { return &this->open_children; }
private:
    auto protocolError(WriterErrorCode code) const -> WriterProtocolError;
private:
    PrimitiveEncoder *encoder_ref;
    ContainerKind container_kind;
    Length container_length;
    std::optional<uint64_t> remaining;
    ScopeState scope_state;
    LogChannel *log;
    std::size_t open_children;
    std::size_t *parent_children;
};

// RAII handle for one open container.
// The header is written by the constructor, the exit discipline runs in close() or the destructor.
// When destroyed during stack unwinding, an exit failure is logged and the in-flight exception wins.
template <typename W>
class ContainerScope {
public:
    ContainerScope(PrimitiveEncoder& encoder, ContainerKind kind, const Length& length, LogChannel *log, std::size_t *parent_children);
    ContainerScope(const ContainerScope&) = delete;
    ContainerScope(ContainerScope&&) = delete;
    auto operator=(const ContainerScope&) -> ContainerScope& = delete;
    auto operator=(ContainerScope&&) -> ContainerScope& = delete;
    ~ContainerScope() noexcept(false);
public:
    auto operator->() -> W * { return &this->nested; }
    auto writer() -> W& { return this->nested; }
    auto state() const -> ScopeState { return this->container.state(); }
    auto close() -> void;
private:
    ContainerState container;
    W nested;
    int uncaught_on_enter;
};

class MapWriter;

class ArrayWriter {
public:
    explicit ArrayWriter(ContainerState& container): container(&container) {}
    ArrayWriter(const ArrayWriter&) = delete;
    auto operator=(const ArrayWriter&) -> ArrayWriter& = delete;
public:
    auto write(const Value& value) -> void;
    auto array(const Length& length = Length::indefinite()) -> ContainerScope<ArrayWriter>;
    auto map(const Length& length = Length::indefinite()) -> ContainerScope<MapWriter>;

    template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
    auto array(const Length& length, Fn&& body) -> void;
    template <typename Fn> requires std::invocable<Fn, MapWriter&>
    auto map(const Length& length, Fn&& body) -> void;
public:
    auto capacity() const -> std::optional<uint64_t> { return this->container->capacity(); }
private:
    ContainerState *container;
};

class MapWriter {
public:
    explicit MapWriter(ContainerState& container): container(&container) {}
    MapWriter(const MapWriter&) = delete;
    auto operator=(const MapWriter&) -> MapWriter& = delete;
public:
    auto write(const Value& key, const Value& value) -> void;
    auto array(const Value& key, const Length& length = Length::indefinite()) -> ContainerScope<ArrayWriter>;
    auto map(const Value& key, const Length& length = Length::indefinite()) -> ContainerScope<MapWriter>;

    template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
    auto array(const Value& key, const Length& length, Fn&& body) -> void;
    template <typename Fn> requires std::invocable<Fn, MapWriter&>
    auto map(const Value& key, const Length& length, Fn&& body) -> void;
public:
    auto capacity() const -> std::optional<uint64_t> { return this->container->capacity(); }
private:
    ContainerState *container;
};

class Writer {
public:
    explicit Writer(PrimitiveEncoder& encoder, LogChannel *log = nullptr): encoder(&encoder), log(log), open_children(0) {}
    Writer(const Writer&) = delete;
    auto operator=(const Writer&) -> Writer& = delete;
public:
    auto write(const Value& value) -> void;
    auto array(const Length& length = Length::indefinite()) -> ContainerScope<ArrayWriter>;
    auto map(const Length& length = Length::indefinite()) -> ContainerScope<MapWriter>;

    template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
    auto array(const Length& length, Fn&& body) -> void;
    template <typename Fn> requires std::invocable<Fn, MapWriter&>
    auto map(const Length& length, Fn&& body) -> void;
private:
    auto ensureNoOpenChild() const -> void;
private:
    PrimitiveEncoder *encoder;
    LogChannel *log;
    std::size_t open_children;
};

// Writers that take plain values (top level and array scopes).
template <typename W>
concept SequenceWriter = requires(W& w, const Value& value, const Length& length) {
    w.write(value);
    w.array(length);
    w.map(length);
};

// --------------------------------------------------------------------------------------------------------------

template <typename W>
ContainerScope<W>::ContainerScope(PrimitiveEncoder& encoder, ContainerKind kind, const Length& length, LogChannel *log, std::size_t *parent_children)
    : container(encoder, kind, length, log, parent_children), nested(this->container), uncaught_on_enter(std::uncaught_exceptions())
{
    this->container.open();
}

template <typename W>
ContainerScope<W>::~ContainerScope() noexcept(false) {
    if (this->container.state() != ScopeState::Open) return;

    if (std::uncaught_exceptions() <= this->uncaught_on_enter) {
        this->container.close();
        return;
    }

    try {
        this->container.close();
    }
    catch (const std::exception& ex) {
        auto message = std::format("Exit failure suppressed while unwinding: {}", ex.what());

        if (auto *log = this->container.logChannel()) {
            log->warn(message);
        }
        else {
            LogChannel::streamChannel(std::cerr, "cbor_stream").warn(message);
        }
    }
}

template <typename W>
auto ContainerScope<W>::close() -> void {
    this->container.close();
}

template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
auto ArrayWriter::array(const Length& length, Fn&& body) -> void {
    auto scope = this->array(length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

template <typename Fn> requires std::invocable<Fn, MapWriter&>
auto ArrayWriter::map(const Length& length, Fn&& body) -> void {
    auto scope = this->map(length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
auto MapWriter::array(const Value& key, const Length& length, Fn&& body) -> void {
    auto scope = this->array(key, length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

template <typename Fn> requires std::invocable<Fn, MapWriter&>
auto MapWriter::map(const Value& key, const Length& length, Fn&& body) -> void {
    auto scope = this->map(key, length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

template <typename Fn> requires std::invocable<Fn, ArrayWriter&>
auto Writer::array(const Length& length, Fn&& body) -> void {
    auto scope = this->array(length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

template <typename Fn> requires std::invocable<Fn, MapWriter&>
auto Writer::map(const Length& length, Fn&& body) -> void {
    auto scope = this->map(length);
    std::forward<Fn>(body)(scope.writer());
    scope.close();
}

}
