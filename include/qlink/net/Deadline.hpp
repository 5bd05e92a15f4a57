#pragma once
#include "qlink/net/NetConfig.hpp"
#include "qlink/log/Log.hpp"

#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Arm an `asio::steady_timer`, then start the async operation on the same
 *   executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call returns synchronously with the operation's status,
 *   or `asio::error::timed_out` when the timer won.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they never touch
 *   destroyed synchronisation primitives if they run after this function
 *   returns. Anything else the operation writes to must be owned the same way.
 * - On timeout `cancel()` runs while the state mutex is held, so the waiting
 *   caller cannot return (and release what `cancel()` refers to) first.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running on another
 *   thread while we block.
 */
namespace qlink::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    duration timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    timer->expires_after(sanitize(timeout));
    timer->async_wait([st, cancel, timeout](const std::error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            // Cancelled because the operation finished first.
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
            logDebug("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
            cancel();
        }
        st->cv.notify_one();
    });

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // the timer already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace qlink::net
