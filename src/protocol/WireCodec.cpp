#include "qlink/protocol/WireCodec.hpp"
#include "qlink/protocol/QLinkConfig.hpp"

#include <algorithm>
#include <array>
#include <charconv>

namespace qlink::protocol {
namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool needsQuotes(const std::string& text) {
    return text.empty() || std::any_of(text.begin(), text.end(), isSpace);
}

std::string formatDecimal(double value) {
    // Shortest representation that reads back to the same double.
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buf.data(), end);
}

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string Param::encode(bool forceQuotes) const {
    if (const auto* text = std::get_if<std::string>(&value_)) {
        if (forceQuotes || needsQuotes(*text)) {
            return '"' + *text + '"';
        }
        return *text;
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value_)) {
        return std::to_string(*integer);
    }
    return formatDecimal(std::get<double>(value_));
}

std::string encodeParams(const std::vector<Param>& params, bool forceQuotes) {
    std::string out;
    for (const auto& param : params) {
        if (!out.empty()) {
            out += ' ';
        }
        out += param.encode(forceQuotes);
    }
    return out;
}

Result<std::vector<std::string>> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    bool inQuotes = false;

    for (char c : line) {
        if (inQuotes) {
            if (c == '"') {
                inQuotes = false;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            inToken = true;     // "" is still a token
            continue;
        }
        if (isSpace(c)) {
            if (inToken) {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
            continue;
        }
        current += c;
        inToken = true;
    }

    if (inQuotes) {
        return unexpected(Error::malformed("unterminated quote in \"" + std::string(line) + "\""));
    }
    if (inToken) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string_view trim(std::string_view line) {
    while (!line.empty() && isSpace(line.front())) line.remove_prefix(1);
    while (!line.empty() && isSpace(line.back())) line.remove_suffix(1);
    return line;
}

LineKind classifyLine(std::string_view line) {
    if (line.empty()) {
        return LineKind::Blank;
    }
    if (line == config::ERROR_SENTINEL) {
        return LineKind::Error;
    }
    for (auto prefix : config::EVENT_PREFIXES) {
        if (startsWith(line, prefix)) {
            return LineKind::Event;
        }
    }
    return LineKind::Reply;
}

Result<int> parseErrorCode(std::string_view line) {
    int code = 0;
    const auto* end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(line.data(), end, code);
    if (line.empty() || ec != std::errc{} || ptr != end) {
        return unexpected(Error::malformed("bad error code \"" + std::string(line) + "\""));
    }
    return code;
}

} // namespace qlink::protocol
