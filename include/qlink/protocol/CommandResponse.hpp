#pragma once

#include "qlink/core/Error.hpp"

#include <string>
#include <vector>

namespace qlink::protocol {

/**
 * @brief Decoded reply to one command.
 *
 * `command` is the echoed command name with the two character reply prefix
 * removed, `args` are the remaining tokens of the terminal line and `data`
 * holds any accepted lines that preceded it, in arrival order.
 */
struct CommandResponse {
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> data;

    /// Build a response from the lines returned by CommandSession::rawRequest().
    static Result<CommandResponse> fromLines(std::vector<std::string> lines);
};

} // namespace qlink::protocol
