#include "chunker.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace strata::coordinator {

namespace {

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Largest position in (lo, pos] that follows whitespace, or 0 when there is none.
std::size_t WordCut(std::string_view text, std::size_t lo, std::size_t pos) {
  for (std::size_t i = pos; i > lo; --i) {
    if (IsSpace(text[i - 1])) return i;
  }
  return 0;
}

} // namespace

std::vector<Chunk> ChunkText(std::string_view text, std::size_t chunk_size, std::size_t overlap) {
  if (chunk_size == 0 || overlap >= chunk_size) {
    throw util::ValidationError("chunk overlap must be smaller than chunk size");
  }

  std::vector<Chunk> chunks;
  const std::size_t  n     = text.size();
  std::size_t        start = 0;
  while (start < n) {
    std::size_t end = std::min(n, start + chunk_size);
    if (end < n && !IsSpace(text[end])) {
      // back off to whitespace, but never below half a chunk
      if (const auto cut = WordCut(text, start + chunk_size / 2, end); cut > start) {
        end = cut;
      } else if (const auto snapped = util::Utf8Floor(text, end); snapped > start) {
        end = snapped;
      }
    }

    Chunk c;
    c.sequence     = static_cast<uint32_t>(chunks.size());
    c.start_offset = start;
    c.text         = text.substr(start, end - start);
    c.word_count   = util::CountWords(c.text);
    chunks.push_back(c);

    if (end == n) break;

    const std::size_t target = end > overlap ? end - overlap : 0;
    std::size_t       next   = WordCut(text, start, target);
    if (next <= start) next = util::Utf8Floor(text, target);
    if (next <= start) next = end;
    start = next;
  }
  return chunks;
}

} // namespace strata::coordinator
