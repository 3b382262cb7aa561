#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "parley/common.hpp"
#include "parley/model.hpp"

namespace parley {

// A command trigger at the start of a message: either an exact,
// case-sensitive string or a regular expression that must match at offset 0.
class Prefix {
 public:
  static Prefix literal(std::string text) { return Prefix(std::move(text)); }

  // Throws std::regex_error for an invalid pattern.
  static Prefix regex(const std::string& pattern) { return Prefix(pattern, std::regex(pattern)); }

  bool is_regex() const { return regex_.has_value(); }
  const std::string& text() const { return text_; }

  // Returns what follows the prefix, or nothing if `content` does not start
  // with it.
  std::optional<std::string_view> strip(std::string_view content) const {
    if (!regex_) {
      if (content.substr(0, text_.size()) != text_) {
        return std::nullopt;
      }
      return content.substr(text_.size());
    }
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(content.begin(), content.end(), m, *regex_, std::regex_constants::match_continuous)) {
      return std::nullopt;
    }
    return content.substr(static_cast<std::size_t>(m.length(0)));
  }

 private:
  explicit Prefix(std::string text) : text_(std::move(text)) {}
  Prefix(std::string pattern, std::regex re) : text_(std::move(pattern)), regex_(std::move(re)) {}

  std::string text_;
  std::optional<std::regex> regex_;
};

// Strips a leading "<@ID>" or "<@!ID>" mention of `bot_id`.
inline std::optional<std::string_view> strip_mention(std::string_view content, UserId bot_id) {
  if (content.substr(0, 2) != "<@") {
    return std::nullopt;
  }
  std::string_view rest = content.substr(2);
  if (!rest.empty() && rest.front() == '!') {
    rest.remove_prefix(1);
  }
  const std::string id = std::to_string(bot_id);
  if (rest.substr(0, id.size()) != id) {
    return std::nullopt;
  }
  rest.remove_prefix(id.size());
  if (rest.empty() || rest.front() != '>') {
    return std::nullopt;
  }
  return rest.substr(1);
}

}  // namespace parley
