#pragma once

#include "codec/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mrpc {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// I/O failure on the stream, or bytes that can no longer be framed.
/// Fatal to the endpoint that observes it.
class TransportError : public Error {
public:
    using Error::Error;
};

class ClosedError : public TransportError {
public:
    ClosedError() : TransportError("mrpc: connection closed") {}
};

/// Malformed envelope or a response for an id nobody is waiting on.
class ProtocolError : public Error {
public:
    using Error::Error;
};

/// A local value has no MessagePack representation.
class EncodeError : public Error {
public:
    using Error::Error;
};

/// The wire value cannot be converted to the requested C++ type.
class ConvertError : public Error {
public:
    ConvertError(codec::Type wire_type, std::string requested_type);

    codec::Type wire_type() const { return wire_type_; }
    const std::string& requested_type() const { return requested_type_; }

private:
    codec::Type wire_type_;
    std::string requested_type_;
};

enum class ErrorKind : int {
    exception = 0,
    validation = 1,
    unknown = -1,
};

const char* error_kind_name(ErrorKind kind);

/// Error reported by the peer (or raised by a local handler to be reported).
class ApplicationError : public Error {
public:
    ApplicationError(ErrorKind kind, std::string message);
    ApplicationError(std::string method, ErrorKind kind, std::string message);

    ErrorKind kind() const { return kind_; }
    const std::string& method() const { return method_; }
    const std::string& message() const { return message_; }

private:
    std::string method_;
    ErrorKind kind_;
    std::string message_;
};

class BatchError : public Error {
public:
    BatchError(std::size_t index, ApplicationError error);

    /// Zero-based index of the call that failed.
    std::size_t index() const { return index_; }
    const ApplicationError& error() const { return error_; }

private:
    std::size_t index_;
    ApplicationError error_;
};

class ProcessError : public Error {
public:
    using Error::Error;
};

} // namespace mrpc
