#pragma once
#include "ecp/net/NetConfig.hpp"
#include "ecp/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Post one handler that arms an `asio::steady_timer` and then starts the
 *   async operation, both on the I/O thread.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously.
 * - On expiry the result is `asio::error::timed_out`.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>`, so a handler that runs
 *   after this function returned never touches a dead mutex.
 * - `cancel()` runs on the I/O thread before the waiter is released, so the
 *   caller may destroy the socket as soon as this returns.
 * - Anything the async operation writes must live in storage the handler
 *   owns (see `UdpSocket::recv_from`), not in the caller's frame.
 *
 * Requirements:
 * - The associated `asio::io_context` must be running on another thread
 *   (see `NetService`). Otherwise the wait never completes.
 */
namespace ecp::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
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

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return; // deadline already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    // Arm the timer and start the operation together on the I/O thread, so the
    // timer and the socket are only ever touched there. The caller's frame
    // outlives this handler: `done` cannot be set before it has run.
    asio::post(ex, [&start_async, op_handler, st, timer, cancel, timeout]() {
        timer->expires_after(timeout);
        timer->async_wait([st, cancel, timeout](const std::error_code& tec) {
            if (tec == asio::error::operation_aborted) {
                return; // operation finished first
            }
            {
                std::lock_guard<std::mutex> lk(st->m);
                if (st->done) return;
            }
            // Handlers share one I/O thread, so the operation cannot complete
            // between the check above and the cancel below.
            cancel();
            {
                std::lock_guard<std::mutex> lk(st->m);
                st->ec = asio::error::timed_out;
                st->done = true;
            }
            logDebug("[with_deadline] timed out after ", timeout.count(), "ms\n");
            st->cv.notify_one();
        });
        start_async(op_handler);
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace ecp::net
