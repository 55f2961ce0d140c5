#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/embedding/embedder.hpp"

namespace strata::embedding {

/*
  Feature-hashing embedder.

  Each token (and each adjacent token pair) is hashed into one of
  `dimension` buckets with a hash-derived sign; the result is L2
  normalized. Deterministic and dependency free, so the same text always
  maps to the same point across processes.
*/
class HashingEmbedder final : public Embedder {
 public:
  explicit HashingEmbedder(uint32_t dimension = 384);

  std::vector<float> Embed(std::string_view text) const override;

  uint32_t Dimension() const override {
    return dimension_;
  }

  std::string Model() const override;

 private:
  uint32_t dimension_;
};

} // namespace strata::embedding
