#include "internal/vector/vector_store.hpp"

#include <cmath>

namespace strata::vector {

double Cosine(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0;
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 || nb == 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

bool MatchesFilter(const ChunkPayload& payload, const VectorFilter& filter) {
  if (!filter.domain.empty() && payload.domain != filter.domain) return false;
  if (!filter.content_type.empty() && payload.content_type != filter.content_type) return false;
  if (filter.created_after_ms != 0 && payload.ingested_at_ms < filter.created_after_ms) return false;
  if (filter.created_before_ms != 0 && payload.ingested_at_ms >= filter.created_before_ms) return false;
  return true;
}

} // namespace strata::vector
