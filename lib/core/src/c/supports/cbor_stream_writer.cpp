#include <format>

#include <magic_enum/magic_enum.hpp>

#include "cbor_stream_writer.hpp"

namespace cbor_stream {

ContainerState::ContainerState(PrimitiveEncoder& encoder, ContainerKind kind, const Length& length, LogChannel *log, std::size_t *parent_children)
    : encoder_ref(&encoder), container_kind(kind), container_length(length), remaining(length.count()), scope_state(ScopeState::Unopened), log(log),
      open_children(0), parent_children(parent_children)
{

}

auto ContainerState::protocolError(WriterErrorCode code) const -> WriterProtocolError {
    auto declared = this->container_length.count()
        ? std::format("{}", this->container_length.count().value())
        : std::string("indefinite")
    ;

    switch (code) {
    case WriterErrorCode::capacity_exceeded:
        return WriterProtocolError(code, std::format("capacity exceeded ({}, length: {})", magic_enum::enum_name(this->container_kind), declared));
    case WriterErrorCode::insufficient_elements:
        return WriterProtocolError(code, std::format("insufficient elements ({}, length: {}, missing: {})", magic_enum::enum_name(this->container_kind), declared, this->remaining.value_or(0)));
    case WriterErrorCode::child_open:
        return WriterProtocolError(code, std::format("nested container is open ({}, length: {}, open: {})", magic_enum::enum_name(this->container_kind), declared, this->open_children));
    case WriterErrorCode::writer_closed:
    default:
        return WriterProtocolError(code, std::format("writer is closed ({}, length: {})", magic_enum::enum_name(this->container_kind), declared));
    }
}

auto ContainerState::open() -> void {
    if (this->scope_state != ScopeState::Unopened) {
        throw this->protocolError(WriterErrorCode::writer_closed);
    }

    if (auto count = this->container_length.count()) {
        this->encoder_ref->encodeLength(this->container_kind, count.value());
    }
    else {
        this->encoder_ref->encodeIndefinite(this->container_kind);
    }

    this->scope_state = ScopeState::Open;
    if (this->parent_children) ++*this->parent_children;
}

auto ContainerState::commit() -> void {
    if (this->scope_state != ScopeState::Open) {
        throw this->protocolError(WriterErrorCode::writer_closed);
    }
    if (this->open_children > 0) {
        throw this->protocolError(WriterErrorCode::child_open);
    }
    if (! this->remaining) return;

    if (this->remaining.value() == 0) {
        throw this->protocolError(WriterErrorCode::capacity_exceeded);
    }

    --this->remaining.value();
}

auto ContainerState::close() -> void {
    if (this->scope_state != ScopeState::Open) {
        throw this->protocolError(WriterErrorCode::writer_closed);
    }
    if (this->open_children > 0) {
        throw this->protocolError(WriterErrorCode::child_open);
    }

    // closed before the length check, exit runs at most once
    this->scope_state = ScopeState::Closed;
    if (this->parent_children) --*this->parent_children;

    if (this->container_length.isIndefinite()) {
        this->encoder_ref->encodeBreak();
        return;
    }

    if (this->remaining.value_or(0) > 0) {
        throw this->protocolError(WriterErrorCode::insufficient_elements);
    }
}

// --------------------------------------------------------------------------------------------------------------

auto ArrayWriter::write(const Value& value) -> void {
    this->container->commit();
    this->container->encoder().encode(value);
}

auto ArrayWriter::array(const Length& length) -> ContainerScope<ArrayWriter> {
    this->container->commit();
    return ContainerScope<ArrayWriter>(this->container->encoder(), ContainerKind::Array, length, this->container->logChannel(), this->container->childCounter());
}

auto ArrayWriter::map(const Length& length) -> ContainerScope<MapWriter> {
    this->container->commit();
    return ContainerScope<MapWriter>(this->container->encoder(), ContainerKind::Map, length, this->container->logChannel(), this->container->childCounter());
}

// --------------------------------------------------------------------------------------------------------------

auto MapWriter::write(const Value& key, const Value& value) -> void {
    this->container->commit();

    auto& encoder = this->container->encoder();
    encoder.encode(key);
    encoder.encode(value);
}

auto MapWriter::array(const Value& key, const Length& length) -> ContainerScope<ArrayWriter> {
    this->container->commit();
    this->container->encoder().encode(key);

    return ContainerScope<ArrayWriter>(this->container->encoder(), ContainerKind::Array, length, this->container->logChannel(), this->container->childCounter());
}

auto MapWriter::map(const Value& key, const Length& length) -> ContainerScope<MapWriter> {
    this->container->commit();
    this->container->encoder().encode(key);

    return ContainerScope<MapWriter>(this->container->encoder(), ContainerKind::Map, length, this->container->logChannel(), this->container->childCounter());
}

// --------------------------------------------------------------------------------------------------------------

auto Writer::ensureNoOpenChild() const -> void {
    if (this->open_children > 0) {
        throw WriterProtocolError(WriterErrorCode::child_open, std::format("nested container is open (top level, open: {})", this->open_children));
    }
}

auto Writer::write(const Value& value) -> void {
    this->ensureNoOpenChild();
    this->encoder->encode(value);
}

auto Writer::array(const Length& length) -> ContainerScope<ArrayWriter> {
    this->ensureNoOpenChild();
    return ContainerScope<ArrayWriter>(*this->encoder, ContainerKind::Array, length, this->log, &this->open_children);
}

auto Writer::map(const Length& length) -> ContainerScope<MapWriter> {
    this->ensureNoOpenChild();
    return ContainerScope<MapWriter>(*this->encoder, ContainerKind::Map, length, this->log, &this->open_children);
}

}
