#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace qlink::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `qlink::net::asio` as the standalone Asio namespace.
 * - `qlink::net::tcp` as the protocol alias used by the transport.
 * - `qlink::net::duration`, the unit every timeout in the library is expressed in.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
using duration = std::chrono::milliseconds;

inline duration sanitize(duration timeout) {
    return timeout.count() < 0 ? duration::zero() : timeout;
}

} // namespace qlink::net
