#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace qlink::protocol::config {

/**
 * @brief Constants that define the controller's host command protocol.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short DEFAULT_PORT = 10001;
constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{30000};
constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{60000};
constexpr std::chrono::milliseconds DEFAULT_WRITE_TIMEOUT{10000};
constexpr std::size_t RECEIVE_BUFFER_LIMIT = 65536;

// Framing ---------------------------------------------------------------------
constexpr std::string_view LINE_DELIMITER = "\r";
constexpr std::string_view REQUEST_TERMINATOR = "\r\n";
constexpr std::size_t REPLY_PREFIX_LENGTH = 2;          // "R:" in front of the echoed command

// Replies ---------------------------------------------------------------------
constexpr std::string_view ERROR_SENTINEL = "257";
constexpr std::array<std::string_view, 4> EVENT_PREFIXES = {"S:", "L:", "LE", "LC"};

// Loads -----------------------------------------------------------------------
constexpr int LEVEL_MIN = 0;
constexpr int LEVEL_MAX = 100;

} // namespace qlink::protocol::config
