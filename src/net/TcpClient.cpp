#include "qlink/net/TcpClient.hpp"

#include "qlink/net/Deadline.hpp"
#include "qlink/net/Resolve.hpp"
#include "qlink/log/Log.hpp"

#include <chrono>
#include <utility>

namespace qlink::net {

TcpClient::TcpClient(std::string host, unsigned short port)
: host_(std::move(host))
, port_(port)
, io_(shared_io_context())
, strand_(asio::make_strand(*io_))
, socket_(strand_)
, resolver_(strand_)
, rxBuffer_(std::make_shared<std::string>())
{}

TcpClient::~TcpClient() {
    close();
}

template <typename StartAsync>
error_code TcpClient::run_cancellable(duration timeout, StartAsync start_async) {
    return with_deadline(socket_.get_executor(), timeout,
        [&](auto completion){
            bool cancelled = false;
            {
                std::lock_guard lock(opMutex_);
                cancelled = cancelledLocked();
                if (!cancelled) {
                    start_async(completion);
                }
            }
            // Completed outside the lock: the deadline handler takes opMutex_
            // while holding the deadline state.
            if (cancelled) {
                completion(error_code(asio::error::operation_aborted));
            }
        },
        [&]{
            std::lock_guard lock(opMutex_);
            error_code ignore;
            socket_.cancel(ignore);
        });
}

Result<void> TcpClient::open() {
    if (!closed()) {
        return {};
    }

    newTicket();
    // Whatever a previous connection left behind belongs to an exchange that is over.
    rxBuffer_ = std::make_shared<std::string>();

    const auto deadline = std::chrono::steady_clock::now() + connectTimeout_;

    tcp::resolver::results_type endpoints;
    if (auto ec = resolve(resolver_, host_, std::to_string(port_), connectTimeout_, endpoints); ec) {
        return unexpected(translate(ec, "resolve " + describeEndpoint(), connectTimeout_));
    }

    error_code last = asio::error::host_not_found;
    for (const auto& entry : endpoints) {
        const auto remaining = std::chrono::duration_cast<duration>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= duration::zero()) {
            last = asio::error::timed_out;
            break;
        }
        last = connect_one(entry.endpoint(), remaining);
        if (!last || last == asio::error::operation_aborted) break;
        logDebug("[TcpClient] connect to ", entry.endpoint(), " failed: ", last.message(), "\n");
    }

    if (last) {
        shutdownSocket();
        return unexpected(translate(last, "connect to " + describeEndpoint(), connectTimeout_));
    }

    setLowLatency();
    open_ = true;
    return {};
}

void TcpClient::close() {
    const bool wasOpen = open_.exchange(false);
    if (wasOpen) {
        logDebug("[TcpClient] close() ", describeEndpoint(), "\n");
    }
    shutdownSocket();
}

std::uint64_t TcpClient::newTicket() {
    std::lock_guard lock(opMutex_);
    return ++currentTicket_;
}

void TcpClient::cancel(std::uint64_t ticket) {
    std::lock_guard lock(opMutex_);
    if (ticket != currentTicket_) {
        return;
    }
    cancelledTicket_ = ticket;
    error_code ec;
    socket_.cancel(ec);
}

void TcpClient::cancel() {
    std::lock_guard lock(opMutex_);
    cancelledTicket_ = currentTicket_;
    error_code ec;
    socket_.cancel(ec);
    resolver_.cancel();
}

Result<void> TcpClient::write(std::string_view message) {
    if (closed()) {
        return unexpected(Error::connection("not connected to " + describeEndpoint()));
    }
    auto payload = std::make_shared<std::string>(message);
    auto ec = run_cancellable(writeTimeout_,
        [&](auto completion){
            asio::async_write(socket_, asio::buffer(*payload),
                [payload, completion](const error_code& op_ec, std::size_t){
                    completion(op_ec);
                });
        });
    if (ec) {
        return unexpected(translate(ec, "write to " + describeEndpoint(), writeTimeout_));
    }
    return {};
}

Result<std::string> TcpClient::read_until(std::string_view delimiter, duration timeout) {
    if (closed()) {
        return unexpected(Error::connection("not connected to " + describeEndpoint()));
    }
    const auto effectiveTimeout = sanitize(timeout);
    auto buffer = rxBuffer_;
    auto transferred = std::make_shared<std::size_t>(0);
    const std::string delim(delimiter);

    auto ec = run_cancellable(effectiveTimeout,
        [&](auto completion){
            asio::async_read_until(socket_, asio::dynamic_buffer(*buffer, bufferLimit_), delim,
                [buffer, transferred, completion](const error_code& op_ec, std::size_t n){
                    *transferred = n;
                    completion(op_ec);
                });
        });
    if (ec) {
        return unexpected(translate(ec, "read from " + describeEndpoint(), effectiveTimeout));
    }

    std::string line = buffer->substr(0, *transferred);
    buffer->erase(0, *transferred);
    return line;
}

error_code TcpClient::connect_one(const tcp::endpoint& endpoint, duration timeout) {
    {
        std::lock_guard lock(opMutex_);
        error_code ignore;
        socket_.close(ignore);
        socket_ = tcp::socket(strand_);
    }
    return run_cancellable(timeout,
        [&](auto completion){ socket_.async_connect(endpoint, completion); });
}

void TcpClient::setLowLatency() {
    std::lock_guard lock(opMutex_);
    error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
    socket_.set_option(asio::socket_base::keep_alive(true), ec);
}

void TcpClient::shutdownSocket() {
    std::lock_guard lock(opMutex_);
    if (!socket_.is_open()) return;
    error_code ec;
    // cancel -> shutdown -> close, so pending handlers complete with operation_aborted.
    socket_.cancel(ec);
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

Error TcpClient::translate(const error_code& ec, std::string_view what, duration timeout) const {
    std::string message(what);
    if (ec == asio::error::timed_out) {
        message += " timed out after " + std::to_string(timeout.count()) + "ms";
        return Error::timeout(std::move(message), ec);
    }
    if (ec == asio::error::operation_aborted && cancelRequested()) {
        return Error::cancelled(message + " cancelled");
    }
    if (ec == asio::error::not_found) {
        return Error::malformed(message + ": line exceeds "
                                + std::to_string(bufferLimit_) + " byte buffer");
    }
    if (ec == asio::error::eof) {
        return Error::connection(message + ": connection closed by peer", ec);
    }
    return Error::connection(message + " failed", ec);
}

std::string TcpClient::describeEndpoint() const {
    return host_ + ":" + std::to_string(port_);
}

} // namespace qlink::net
