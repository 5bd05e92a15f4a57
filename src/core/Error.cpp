#include "qlink/core/Error.hpp"

#include <sstream>
#include <utility>

namespace qlink {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Protocol:   return "protocol";
        case ErrorKind::Malformed:  return "malformed";
        case ErrorKind::Cancelled:  return "cancelled";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, std::string message, std::error_code cause)
: kind_(kind)
, message_(std::move(message))
, cause_(cause)
{}

Error Error::connection(std::string message, std::error_code cause) {
    return Error(ErrorKind::Connection, std::move(message), cause);
}

Error Error::timeout(std::string message, std::error_code cause) {
    return Error(ErrorKind::Timeout, std::move(message), cause);
}

Error Error::protocol(int code, std::string message) {
    Error error(ErrorKind::Protocol, std::move(message));
    error.protocolCode_ = code;
    return error;
}

Error Error::malformed(std::string message) {
    return Error(ErrorKind::Malformed, std::move(message));
}

Error Error::cancelled(std::string message) {
    return Error(ErrorKind::Cancelled, std::move(message));
}

std::string Error::describe() const {
    std::ostringstream os;
    os << toString(kind_) << ": " << message_;
    if (kind_ == ErrorKind::Protocol) {
        os << " (error code " << protocolCode_ << ")";
    }
    if (cause_) {
        os << " (" << cause_.message() << ")";
    }
    return os.str();
}

} // namespace qlink
