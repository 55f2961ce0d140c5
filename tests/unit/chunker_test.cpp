#include "internal/coordinator/chunker.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using strata::coordinator::ChunkText;

void TestShortTextIsOneChunk() {
  const std::string text   = "a short body";
  const auto        chunks = ChunkText(text, 1000, 200);
  assert(chunks.size() == 1);
  assert(chunks[0].text == text);
  assert(chunks[0].start_offset == 0);
  assert(chunks[0].word_count == 3);
}

void TestChunksOverlapAndCoverText() {
  const std::string text(2500, 'x');
  const auto        chunks = ChunkText(text, 1000, 200);

  // starts at 0, 800, 1600; the third reaches the end
  assert(chunks.size() == 3);
  assert(chunks[0].start_offset == 0);
  assert(chunks[1].start_offset == 800);
  assert(chunks[2].start_offset == 1600);
  assert(chunks[2].start_offset + chunks[2].text.size() == text.size());
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    assert(chunks[i].sequence == i);
    assert(chunks[i].text.size() <= 1000);
  }
}

void TestChunkEdgesFallOnWordBoundaries() {
  // words of varying length so fixed offsets land mid-word
  std::string text;
  for (int i = 0; text.size() < 5000; ++i) text += std::string(3 + i % 9, 'a' + i % 26) + ' ';

  const auto chunks = ChunkText(text, 1000, 200);
  assert(chunks.size() > 5);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto& c = chunks[i];
    assert(c.text.size() <= 1000);
    if (c.start_offset > 0) assert(text[c.start_offset - 1] == ' ');
    if (i + 1 < chunks.size()) {
      const auto end = c.start_offset + c.text.size();
      assert(text[end - 1] == ' ' || text[end] == ' ');
      assert(c.text.size() >= 500);
      // the neighbour repeats at least the configured overlap
      assert(chunks[i + 1].start_offset + 200 <= end);
      assert(chunks[i + 1].start_offset > c.start_offset);
    }
  }
  const auto& last = chunks.back();
  assert(last.start_offset + last.text.size() == text.size());
}

void TestChunkEdgesRespectUtf8() {
  // 3-byte characters; 1000 is not a multiple of 3
  std::string text;
  for (int i = 0; i < 800; ++i) text += "\xE2\x82\xAC";

  const auto chunks = ChunkText(text, 1000, 200);
  assert(chunks.size() > 1);
  for (const auto& c : chunks) {
    assert(c.start_offset % 3 == 0);
    assert(c.text.size() % 3 == 0);
  }
}

void TestOverlapMustBeSmallerThanChunk() {
  bool threw = false;
  try {
    (void)ChunkText("text", 100, 100);
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestShortTextIsOneChunk();
  TestChunksOverlapAndCoverText();
  TestChunkEdgesFallOnWordBoundaries();
  TestChunkEdgesRespectUtf8();
  TestOverlapMustBeSmallerThanChunk();

  std::cout << "strata_unit_chunker: pass\n";
  return 0;
}
