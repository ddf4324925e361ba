#pragma once

#include <chrono>
#include <cstddef>

#include <asio.hpp>

namespace pyremote {

using Clock = std::chrono::steady_clock;

/// Outcome of one deadline-bounded socket operation.
struct IoResult {
    asio::error_code ec;
    std::size_t bytes = 0;

    /// The deadline passed before the operation completed.
    [[nodiscard]] bool timed_out() const { return ec == asio::error::operation_aborted; }
};

/**
 * Drive `io` until the operation started on it completes or `deadline`
 * passes. On expiry `cancel` is invoked and the aborted handler is drained,
 * so the socket is left idle and reusable either way.
 */
template <typename CancelFn>
void run_until(asio::io_context& io, Clock::time_point deadline, CancelFn&& cancel) {
    io.restart();
    io.run_until(deadline);
    if (!io.stopped()) {
        cancel();
        io.run();
    }
}

/// One receive on a UDP or TCP socket, bounded by `deadline`.
template <typename Socket>
IoResult receive_some_until(asio::io_context& io, Socket& socket,
                            asio::mutable_buffer buffer, Clock::time_point deadline) {
    IoResult result;
    socket.async_receive(buffer, [&result](const asio::error_code& ec, std::size_t n) {
        result.ec = ec;
        result.bytes = n;
    });
    run_until(io, deadline, [&socket] { socket.cancel(); });
    return result;
}

/// Accept one connection into `socket`, bounded by `deadline`.
inline IoResult accept_until(asio::io_context& io, asio::ip::tcp::acceptor& acceptor,
                             asio::ip::tcp::socket& socket, Clock::time_point deadline) {
    IoResult result;
    acceptor.async_accept(socket, [&result](const asio::error_code& ec) {
        result.ec = ec;
    });
    run_until(io, deadline, [&acceptor] { acceptor.cancel(); });
    return result;
}

} // namespace pyremote
