#include "taskrunner/util/shell_words.hpp"

#include <cstdint>

namespace taskrunner {

namespace {

enum class Quote : std::uint8_t { None, Single, Double };

[[nodiscard]] constexpr auto is_blank(char c) noexcept -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

[[nodiscard]] constexpr auto escapable_in_double(char c) noexcept -> bool {
  return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
}

[[nodiscard]] auto needs_quoting(std::string_view word) -> bool {
  if (word.empty()) {
    return true;
  }
  for (char c : word) {
    bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '@' || c == '%' || c == '+' ||
                c == '=' || c == ':' || c == ',' || c == '.' || c == '/' ||
                c == '-' || c == '_';
    if (!safe) {
      return true;
    }
  }
  return false;
}

}  // namespace

auto split_shell_words(std::string_view text)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  auto quote = Quote::None;

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    switch (quote) {
      case Quote::Single:
        if (c == '\'') {
          quote = Quote::None;
        } else {
          current.push_back(c);
        }
        break;

      case Quote::Double:
        if (c == '"') {
          quote = Quote::None;
        } else if (c == '\\' && i + 1 < text.size() &&
                   escapable_in_double(text[i + 1])) {
          current.push_back(text[++i]);
        } else {
          current.push_back(c);
        }
        break;

      case Quote::None:
        if (is_blank(c)) {
          if (in_word) {
            words.push_back(std::move(current));
            current.clear();
            in_word = false;
          }
        } else if (c == '\'') {
          quote = Quote::Single;
          in_word = true;
        } else if (c == '"') {
          quote = Quote::Double;
          in_word = true;
        } else if (c == '\\') {
          if (i + 1 >= text.size()) {
            return fail(Error::ParseError);
          }
          current.push_back(text[++i]);
          in_word = true;
        } else {
          current.push_back(c);
          in_word = true;
        }
        break;
    }
  }

  if (quote != Quote::None) {
    return fail(Error::ParseError);
  }
  if (in_word) {
    words.push_back(std::move(current));
  }
  return ok(std::move(words));
}

auto join_shell_words(std::span<const std::string> words) -> std::string {
  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    if (!needs_quoting(word)) {
      out += word;
      continue;
    }
    out.push_back('\'');
    for (char c : word) {
      if (c == '\'') {
        out += "'\"'\"'";
      } else {
        out.push_back(c);
      }
    }
    out.push_back('\'');
  }
  return out;
}

}  // namespace taskrunner
