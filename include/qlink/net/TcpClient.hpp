#pragma once
#include "qlink/net/NetConfig.hpp"
#include "qlink/net/NetService.hpp"
#include "qlink/core/Error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace qlink::net {

/**
 * @brief One TCP connection to a fixed host and port, with deadlines on every operation.
 *
 * Highlights:
 * - `open()` resolves and connects within the connect timeout; it is a no-op
 *   while the connection is up.
 * - `write()` blocks until the message has been handed to the OS send buffer.
 * - `read_until()` blocks until a delimiter arrives and returns the bytes up to
 *   and including it. Bytes after the delimiter stay buffered for the next call.
 * - Asio failures are translated into `qlink::Error`: timeouts become
 *   `Timeout`, cancellation becomes `Cancelled`, a line longer than the buffer
 *   limit becomes `Malformed`, everything else becomes `Connection`.
 *
 * All socket work runs on a strand of the shared `NetService` loop. The
 * caller must not be the I/O thread.
 */
class TcpClient {
public:
    TcpClient(std::string host, unsigned short port);
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;
    TcpClient(TcpClient&&) = delete;
    TcpClient& operator=(TcpClient&&) = delete;

    void setConnectTimeout(duration timeout) { connectTimeout_ = sanitize(timeout); }
    duration connectTimeout() const { return connectTimeout_; }

    void setWriteTimeout(duration timeout) { writeTimeout_ = sanitize(timeout); }
    duration writeTimeout() const { return writeTimeout_; }

    /// Largest line (delimiter included) read_until() will buffer.
    void setBufferLimit(std::size_t bytes) { bufferLimit_ = bytes; }
    std::size_t bufferLimit() const { return bufferLimit_; }

    const std::string& host() const { return host_; }
    unsigned short port() const { return port_; }

    Result<void> open();

    // idempotent; safe on a never-opened client
    void close();

    /**
     * @brief Start a new unit of cancellable work and return its ticket.
     *
     * Reads and writes issued after this call belong to the new ticket. A
     * cancel aimed at an older ticket is ignored.
     */
    std::uint64_t newTicket();

    /**
     * @brief Abort the work belonging to @p ticket.
     *
     * A pending read or write fails with `ErrorKind::Cancelled`, as does every
     * later read or write issued under the same ticket. No-op when @p ticket
     * is no longer current.
     */
    void cancel(std::uint64_t ticket);

    /// Cancel the current ticket and any resolve or connect in progress.
    void cancel();

    /// True if never opened, closed, or broken by a fatal error.
    bool closed() const { return !open_.load(); }

    Result<void> write(std::string_view message);
    Result<std::string> read_until(std::string_view delimiter, duration timeout);

private:
    template <typename StartAsync>
    error_code run_cancellable(duration timeout, StartAsync start_async);
    bool cancelledLocked() const { return cancelledTicket_ == currentTicket_; }
    bool cancelRequested() const {
        std::lock_guard lock(opMutex_);
        return cancelledLocked();
    }
    error_code connect_one(const tcp::endpoint& endpoint, duration timeout);
    void setLowLatency();
    void shutdownSocket();
    Error translate(const error_code& ec, std::string_view what, duration timeout) const;
    std::string describeEndpoint() const;

    std::string host_;
    unsigned short port_;
    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    tcp::resolver resolver_;
    // Shared with in-flight read handlers so a late completion never writes to freed memory.
    std::shared_ptr<std::string> rxBuffer_;
    std::size_t bufferLimit_ = 65536;
    duration connectTimeout_{30000};
    duration writeTimeout_{10000};
    std::atomic<bool> open_{false};

    // Guards the cancel state together with starting and cancelling socket
    // operations, so a cancel either sees the pending op or the op sees the cancel.
    mutable std::mutex opMutex_;
    std::uint64_t currentTicket_ = 0;
    std::uint64_t cancelledTicket_ = ~std::uint64_t{0};
};

} // namespace qlink::net
