#pragma once
#include "qlink/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace qlink::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every session in the process shares this loop. Socket, resolver and timer
 * completions all run on the background thread while callers block inside
 * `with_deadline` (see Deadline.hpp) until their operation settles.
 *
 * Lifetime notes:
 * - Destroy sessions before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 * - Never block on a session from inside a completion handler: the I/O thread
 *   would wait on itself.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

std::shared_ptr<asio::io_context> shared_io_context();

} // namespace qlink::net
