#pragma once

#include "qlink/core/Error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace qlink::protocol {

/**
 * @brief One request parameter: a string, an integer or a decimal number.
 *
 * Integers of any width convert implicitly, as do floating point values and
 * strings, so call sites can write `{contractor, level, 2.5}`.
 */
class Param {
public:
    using Value = std::variant<std::string, std::int64_t, double>;

    Param(std::string text) : value_(std::move(text)) {}
    Param(const char* text) : value_(std::string(text)) {}

    template <typename Integer,
              std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>, int> = 0>
    Param(Integer number) : value_(static_cast<std::int64_t>(number)) {}

    template <typename Floating,
              std::enable_if_t<std::is_floating_point_v<Floating>, int> = 0>
    Param(Floating number) : value_(static_cast<double>(number)) {}

    const Value& value() const { return value_; }

    /// Wire form: numbers as plain text, strings bare unless they need quoting.
    std::string encode(bool forceQuotes = false) const;

private:
    Value value_;
};

/**
 * Join the encoded parameters with single spaces. Strings are wrapped in
 * double quotes when they are empty, contain whitespace, or @p forceQuotes is
 * set. Embedded double quotes are not escaped: the protocol has no escape.
 */
std::string encodeParams(const std::vector<Param>& params, bool forceQuotes = false);

/**
 * Split a reply line into whitespace separated tokens. A double-quoted run is
 * part of one token (spaces included) with the quotes removed. A quote that
 * is never closed fails the whole line with ErrorKind::Malformed.
 */
Result<std::vector<std::string>> tokenize(std::string_view line);

/// Strip spaces, tabs, CR and LF from both ends.
std::string_view trim(std::string_view line);

enum class LineKind {
    Blank,      // nothing left after trimming
    Error,      // the controller's error sentinel
    Event,      // unsolicited status line, never part of a reply
    Reply       // data line or terminal line
};

/// Classify an already trimmed reply line.
LineKind classifyLine(std::string_view line);

/// Numeric code carried by an error line. Anything but a bare decimal is Malformed.
Result<int> parseErrorCode(std::string_view line);

} // namespace qlink::protocol
