#include "hashing_embedder.hpp"

#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"

namespace strata::embedding {

namespace {

constexpr uint64_t kBigramSeed = 0x9e3779b97f4a7c15ULL;

void AddFeature(std::vector<float>& v, uint64_t h, float weight) {
  const auto bucket = static_cast<std::size_t>(h % v.size());
  const float sign  = ((h >> 63) & 1U) != 0 ? -1.0F : 1.0F;
  v[bucket] += sign * weight;
}

} // namespace

HashingEmbedder::HashingEmbedder(uint32_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw util::ValidationError("embedding dimension must be positive");
  }
}

std::string HashingEmbedder::Model() const {
  return "hashing-v1-" + std::to_string(dimension_);
}

std::vector<float> HashingEmbedder::Embed(std::string_view text) const {
  std::vector<float> v(dimension_, 0.0F);

  const auto tokens = util::Tokenize(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    AddFeature(v, util::Fnv1a64(tokens[i]), 1.0F);
    if (i + 1 < tokens.size()) {
      const uint64_t h = util::Fnv1a64(tokens[i + 1], util::Fnv1a64(tokens[i], kBigramSeed));
      AddFeature(v, h, 0.5F);
    }
  }

  double norm = 0.0;
  for (float x : v) norm += static_cast<double>(x) * x;
  if (norm > 0.0) {
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (auto& x : v) x *= inv;
  }
  return v;
}

} // namespace strata::embedding
