#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata::embedding {

/*
  Text to dense vector.

  Implementations must be thread-safe: chunk uploads embed from the
  coordinator's worker pool and queries embed concurrently.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> Embed(std::string_view text) const = 0;

  virtual uint32_t Dimension() const = 0;

  virtual std::string Model() const = 0;
};

} // namespace strata::embedding
