#pragma once

#include "taskrunner/core/error.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace taskrunner {

// Splits a command template into argv the way a POSIX shell tokenizes words:
// blanks separate words, single quotes are literal, double quotes honor
// backslash escapes of \ " $ and `, and a bare backslash escapes the next
// character. No expansion is performed. An unterminated quote or a trailing
// backslash is a ParseError.
[[nodiscard]] auto split_shell_words(std::string_view text)
    -> Result<std::vector<std::string>>;

// Inverse of split_shell_words, for log output.
[[nodiscard]] auto join_shell_words(std::span<const std::string> words)
    -> std::string;

}  // namespace taskrunner
