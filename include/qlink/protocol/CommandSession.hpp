#pragma once
#include "qlink/core/Error.hpp"
#include "qlink/net/TcpClient.hpp"
#include "qlink/protocol/CommandResponse.hpp"
#include "qlink/protocol/QLinkConfig.hpp"
#include "qlink/protocol/WireCodec.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qlink::protocol {

struct SessionOptions {
    std::string host;
    unsigned short port = config::DEFAULT_PORT;
    std::chrono::milliseconds connectTimeout = config::DEFAULT_CONNECT_TIMEOUT;
    std::chrono::milliseconds readTimeout = config::DEFAULT_READ_TIMEOUT;
    std::chrono::milliseconds writeTimeout = config::DEFAULT_WRITE_TIMEOUT;
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

/**
 * @brief Request/response client for a controller's host command port.
 *
 * The protocol carries no request identifiers, so replies are paired with
 * requests purely by order. The session therefore runs one exchange at a time:
 *
 * - The connection lock guards the Disconnected -> Connecting -> Connected
 *   transition. Concurrent callers that find the session disconnected queue
 *   on it and then observe the outcome of a single connect attempt.
 * - The exchange lock guards write-request-then-read-reply. A caller waiting
 *   on it is blocked until the exchange ahead of it completes, fails or times
 *   out. It is always released before an error reaches the caller.
 *
 * The exchange lock may take the connection lock (to reconnect after a
 * previous exchange dropped the link); the reverse never happens.
 *
 * Unsolicited event lines interleaved in the stream are discarded. A lone
 * `257` line fails the exchange with ErrorKind::Protocol and leaves the
 * connection up. Any other failure closes the connection; the next request
 * reopens it. Nothing is retried here.
 *
 * Calls block the calling thread; they must not be made from the NetService
 * I/O thread.
 */
class CommandSession {
public:
    explicit CommandSession(SessionOptions options);
    explicit CommandSession(std::string host, unsigned short port = config::DEFAULT_PORT);
    ~CommandSession();

    // non-copyable / non-movable
    CommandSession(const CommandSession&) = delete;
    CommandSession& operator=(const CommandSession&) = delete;
    CommandSession(CommandSession&&) = delete;
    CommandSession& operator=(CommandSession&&) = delete;

    /// Open the connection now instead of on first use. No-op when connected.
    Result<void> connect();

    void close();                        // idempotent

    /**
     * @brief Abort the exchange currently waiting on the controller, if any.
     *
     * The aborted call fails with ErrorKind::Cancelled and the connection is
     * closed, since a partial reply may still be in flight.
     */
    void cancel();

    ConnectionState state() const { return state_.load(); }
    bool isConnected() const { return state() == ConnectionState::Connected; }

    const SessionOptions& options() const { return options_; }
    const std::string& host() const { return options_.host; }
    unsigned short port() const { return options_.port; }

    /// Number of successful connects since construction.
    std::size_t connectCount() const { return connectCount_.load(); }

    /**
     * @brief Send one request line and return the accepted reply lines.
     *
     * @param request   Request text without line terminator.
     * @param dataLines Number of data lines expected before the terminal line.
     * @return `dataLines + 1` trimmed lines, terminal line last.
     */
    Result<std::vector<std::string>> rawRequest(std::string_view request, std::size_t dataLines = 0);

    /**
     * @brief Encode @p command with @p params, send it and decode the reply.
     * @param forceQuotes Quote every string parameter, not only those with whitespace.
     */
    Result<CommandResponse> sendCommand(std::string_view command,
                                        const std::vector<Param>& params = {},
                                        bool forceQuotes = false,
                                        std::size_t dataLines = 0);

    template <typename... Params>
    Result<CommandResponse> command(std::string_view name, Params&&... params) {
        return sendCommand(name, std::vector<Param>{Param(std::forward<Params>(params))...});
    }

private:
    Result<void> connectLocked();
    Result<std::vector<std::string>> exchange(std::string_view request, std::size_t dataLines);
    void dropConnection(const Error& reason);
    std::string describeEndpoint() const;

    SessionOptions options_;
    net::TcpClient transport_;

    std::mutex connectionMutex_;
    std::mutex exchangeMutex_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::uint64_t> activeTicket_{0};      // 0 while no exchange runs
    std::atomic<std::size_t> connectCount_{0};
};

} // namespace qlink::protocol
