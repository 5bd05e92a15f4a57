#pragma once

#include "qlink/core/Expected.hpp"

#include <string>
#include <system_error>

namespace qlink {

/**
 * @brief Failure categories surfaced by the transport, session and facade.
 *
 * `Connection`, `Timeout` and `Protocol` cover the controller being
 * unreachable, too slow, or answering with its error sentinel. `Malformed`
 * marks replies the codec cannot interpret and `Cancelled` marks exchanges
 * aborted through CommandSession::cancel().
 */
enum class ErrorKind {
    Connection,
    Timeout,
    Protocol,
    Malformed,
    Cancelled
};

const char* toString(ErrorKind kind);

class Error {
public:
    Error(ErrorKind kind, std::string message, std::error_code cause = {});

    static Error connection(std::string message, std::error_code cause = {});
    static Error timeout(std::string message, std::error_code cause = {});
    static Error protocol(int code, std::string message);
    static Error malformed(std::string message);
    static Error cancelled(std::string message);

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const std::error_code& cause() const { return cause_; }

    /// Numeric code reported by the controller. Zero unless kind() is Protocol.
    int protocolCode() const { return protocolCode_; }

    bool is(ErrorKind kind) const { return kind_ == kind; }

    /// "timeout: read timed out after 60000ms (Connection timed out)"
    std::string describe() const;

private:
    ErrorKind kind_;
    std::string message_;
    std::error_code cause_;
    int protocolCode_ = 0;
};

template <typename T>
using Result = expected<T, Error>;

} // namespace qlink
