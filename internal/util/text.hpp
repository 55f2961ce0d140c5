#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace strata::util {

// ASCII lower-casing; non-ASCII bytes pass through.
std::string ToLower(std::string_view s);

std::string_view Trim(std::string_view s);

/*
  Word tokens: maximal runs of ASCII alphanumerics or any non-ASCII byte,
  lower-cased. Punctuation and whitespace separate tokens.
*/
std::vector<std::string> Tokenize(std::string_view text);

std::size_t CountWords(std::string_view text);

// Sentence count by terminal punctuation; at least 1 for non-empty text.
std::size_t CountSentences(std::string_view text);

// Prefix of at most max_bytes that does not split a UTF-8 sequence.
std::string Utf8Prefix(std::string_view text, std::size_t max_bytes);

// Rounds a byte offset down to a UTF-8 boundary.
std::size_t Utf8Floor(std::string_view text, std::size_t pos);

} // namespace strata::util
