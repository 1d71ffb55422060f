#pragma once

#include <stdexcept>
#include <string>

namespace cbor_stream {

enum class WriterErrorCode {
    capacity_exceeded,
    insufficient_elements,
    writer_closed,
    child_open,
};

// invalid length passed to array()/map()
class ConfigurationError: public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message): std::invalid_argument(message) {}
};

// misuse of an open (or closed) container scope
class WriterProtocolError: public std::logic_error {
public:
    WriterProtocolError(WriterErrorCode code, const std::string& message): std::logic_error(message), error_code(code) {}
public:
    auto code() const noexcept -> WriterErrorCode { return this->error_code; }
private:
    WriterErrorCode error_code;
};

// primitive encoder or sink failure
class EncodeError: public std::runtime_error {
public:
    explicit EncodeError(const std::string& message): std::runtime_error(message) {}
};

}
