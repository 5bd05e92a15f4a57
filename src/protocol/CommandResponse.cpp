#include "qlink/protocol/CommandResponse.hpp"

#include "qlink/protocol/QLinkConfig.hpp"
#include "qlink/protocol/WireCodec.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace qlink::protocol {

Result<CommandResponse> CommandResponse::fromLines(std::vector<std::string> lines) {
    if (lines.empty()) {
        return unexpected(Error::malformed("reply has no terminal line"));
    }

    auto tokens = tokenize(lines.back());
    if (!tokens) {
        return unexpected(tokens.error());
    }
    if (tokens->empty()) {
        return unexpected(Error::malformed("terminal line is empty"));
    }

    CommandResponse response;
    const std::string& echoed = tokens->front();
    response.command = echoed.substr(std::min(config::REPLY_PREFIX_LENGTH, echoed.size()));
    response.args.assign(std::make_move_iterator(tokens->begin() + 1),
                         std::make_move_iterator(tokens->end()));
    lines.pop_back();
    response.data = std::move(lines);
    return response;
}

} // namespace qlink::protocol
