#include "errors.hpp"

#include <utility>

namespace mrpc {

namespace {

std::string application_message(const std::string& method, ErrorKind kind, const std::string& message) {
    std::string text = "mrpc:";
    if (!method.empty()) {
        text += method;
        text += " ";
    }
    text += error_kind_name(kind);
    text += ": ";
    text += message;
    return text;
}

} // namespace

ConvertError::ConvertError(codec::Type wire_type, std::string requested_type)
    : Error(std::string("mrpc: cannot convert ") + codec::type_name(wire_type) + " to " + requested_type),
      wire_type_(wire_type),
      requested_type_(std::move(requested_type)) {}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::exception:
        return "exception";
    case ErrorKind::validation:
        return "validation";
    case ErrorKind::unknown:
        break;
    }
    return "error";
}

ApplicationError::ApplicationError(ErrorKind kind, std::string message)
    : ApplicationError(std::string(), kind, std::move(message)) {}

ApplicationError::ApplicationError(std::string method, ErrorKind kind, std::string message)
    : Error(application_message(method, kind, message)),
      method_(std::move(method)),
      kind_(kind),
      message_(std::move(message)) {}

BatchError::BatchError(std::size_t index, ApplicationError error)
    : Error(error.what()), index_(index), error_(std::move(error)) {}

} // namespace mrpc
