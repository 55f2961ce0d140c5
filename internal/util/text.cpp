#include "internal/util/text.hpp"

#include <cctype>

namespace strata::util {

namespace {

bool IsWordByte(unsigned char c) {
  return std::isalnum(c) != 0 || c >= 0x80;
}

bool IsContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

} // namespace

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsWordByte(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

std::size_t CountWords(std::string_view text) {
  std::size_t count   = 0;
  bool        in_word = false;
  for (char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

std::size_t CountSentences(std::string_view text) {
  std::size_t count   = 0;
  bool        pending = false;
  for (char ch : text) {
    if (ch == '.' || ch == '!' || ch == '?') {
      if (pending) ++count;
      pending = false;
    } else if (!std::isspace(static_cast<unsigned char>(ch))) {
      pending = true;
    }
  }
  if (pending) ++count;
  return count;
}

std::size_t Utf8Floor(std::string_view text, std::size_t pos) {
  if (pos >= text.size()) return text.size();
  while (pos > 0 && IsContinuation(static_cast<unsigned char>(text[pos]))) --pos;
  return pos;
}

std::string Utf8Prefix(std::string_view text, std::size_t max_bytes) {
  return std::string(text.substr(0, Utf8Floor(text, max_bytes)));
}

} // namespace strata::util
