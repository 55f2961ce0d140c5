#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace strata::coordinator {

struct Chunk {
  uint32_t         sequence     = 0;
  uint64_t         start_offset = 0;
  std::string_view text;
  uint64_t         word_count = 0;
};

/*
  Fixed-width chunking with overlap, measured in bytes. Chunk edges back
  off to the last whitespace in the second half of the window; text with
  no whitespace there is cut on a UTF-8 boundary instead. Consecutive
  chunks share at least `overlap` bytes, widened to a word start, so a
  phrase cut at one edge is whole in the neighbour. Chunks view into
  `text`; the caller keeps it alive.
*/
std::vector<Chunk> ChunkText(std::string_view text, std::size_t chunk_size, std::size_t overlap);

} // namespace strata::coordinator
