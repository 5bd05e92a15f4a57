/**
 * @brief Implements the command session: lazy connect, one-at-a-time exchanges, reply framing.
 */
#include "qlink/protocol/CommandSession.hpp"

#include "qlink/log/Log.hpp"

#include <utility>

namespace qlink::protocol {

namespace {

SessionOptions sanitize(SessionOptions options) {
    options.connectTimeout = net::sanitize(options.connectTimeout);
    options.readTimeout = net::sanitize(options.readTimeout);
    options.writeTimeout = net::sanitize(options.writeTimeout);
    return options;
}

// Render CR/LF visibly for the traffic log.
std::string printable(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\r') out += "\\r";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

std::string_view stripTerminator(std::string_view request) {
    while (!request.empty() && (request.back() == '\r' || request.back() == '\n')) {
        request.remove_suffix(1);
    }
    return request;
}

} // namespace

CommandSession::CommandSession(SessionOptions options)
: options_(sanitize(std::move(options)))
, transport_(options_.host, options_.port)
{
    transport_.setConnectTimeout(options_.connectTimeout);
    transport_.setWriteTimeout(options_.writeTimeout);
    transport_.setBufferLimit(config::RECEIVE_BUFFER_LIMIT);
}

CommandSession::CommandSession(std::string host, unsigned short port)
: CommandSession(SessionOptions{std::move(host), port})
{}

CommandSession::~CommandSession() {
    close();
}

Result<void> CommandSession::connect() {
    std::lock_guard lock(connectionMutex_);
    return connectLocked();
}

Result<void> CommandSession::connectLocked() {
    if (state_ == ConnectionState::Connected && !transport_.closed()) {
        return {};
    }

    state_ = ConnectionState::Connecting;
    auto opened = transport_.open();
    if (!opened) {
        state_ = ConnectionState::Disconnected;
        logError("[CommandSession] connect to ", describeEndpoint(), " failed: ",
                 opened.error().describe(), "\n");
        return opened;
    }

    state_ = ConnectionState::Connected;
    ++connectCount_;
    logInfo("[CommandSession] connected to ", describeEndpoint(), "\n");
    return {};
}

void CommandSession::close() {
    std::lock_guard lock(connectionMutex_);
    if (state_ != ConnectionState::Disconnected) {
        logInfo("[CommandSession] close() ", describeEndpoint(), "\n");
    }
    transport_.close();
    state_ = ConnectionState::Disconnected;
}

void CommandSession::cancel() {
    const auto ticket = activeTicket_.load();
    if (ticket == 0) {
        return;
    }
    logInfo("[CommandSession] cancelling pending exchange\n");
    // Stale once the exchange that owned it has finished; the transport ignores it then.
    transport_.cancel(ticket);
}

Result<std::vector<std::string>>
CommandSession::rawRequest(std::string_view request, std::size_t dataLines) {
    if (auto ready = connect(); !ready) {
        return unexpected(ready.error());
    }

    std::lock_guard exchangeLock(exchangeMutex_);

    // The exchange ahead of us may have dropped the connection while we waited.
    if (transport_.closed()) {
        if (auto ready = connect(); !ready) {
            return unexpected(ready.error());
        }
    }

    activeTicket_ = transport_.newTicket();
    auto lines = exchange(request, dataLines);
    activeTicket_ = 0;

    if (!lines && !lines.error().is(ErrorKind::Protocol)) {
        // Part of the reply may still be on the wire; never reuse the stream.
        dropConnection(lines.error());
    }
    return lines;
}

Result<CommandResponse>
CommandSession::sendCommand(std::string_view command,
                            const std::vector<Param>& params,
                            bool forceQuotes,
                            std::size_t dataLines) {
    std::string request(command);
    if (!params.empty()) {
        request += ' ';
        request += encodeParams(params, forceQuotes);
    }

    auto lines = rawRequest(request, dataLines);
    if (!lines) {
        return unexpected(lines.error());
    }
    return CommandResponse::fromLines(std::move(*lines));
}

Result<std::vector<std::string>>
CommandSession::exchange(std::string_view request, std::size_t dataLines) {
    std::string wire(stripTerminator(request));
    wire += config::REQUEST_TERMINATOR;

    logDebug("[CommandSession] TX ", printable(wire), "\n");
    if (auto written = transport_.write(wire); !written) {
        return unexpected(written.error());
    }

    std::vector<std::string> accepted;
    while (accepted.size() <= dataLines) {
        auto raw = transport_.read_until(config::LINE_DELIMITER, options_.readTimeout);
        if (!raw) {
            return unexpected(raw.error());
        }

        const auto line = trim(*raw);
        switch (classifyLine(line)) {
            case LineKind::Blank:
                continue;

            case LineKind::Error: {
                auto code = parseErrorCode(line);
                if (!code) {
                    return unexpected(code.error());
                }
                logError("[CommandSession] controller rejected \"", printable(stripTerminator(request)),
                         "\" with error code ", *code, "\n");
                return unexpected(Error::protocol(*code, "controller returned an error"));
            }

            case LineKind::Event:
                logDebug("[CommandSession] ignoring event: ", line, "\n");
                continue;

            case LineKind::Reply:
                logDebug("[CommandSession] RX ", line, "\n");
                accepted.emplace_back(line);
                break;
        }
    }

    return accepted;
}

void CommandSession::dropConnection(const Error& reason) {
    std::lock_guard lock(connectionMutex_);
    logError("[CommandSession] dropping connection to ", describeEndpoint(), ": ",
             reason.describe(), "\n");
    transport_.close();
    state_ = ConnectionState::Disconnected;
}

std::string CommandSession::describeEndpoint() const {
    return options_.host + ":" + std::to_string(options_.port);
}

} // namespace qlink::protocol
