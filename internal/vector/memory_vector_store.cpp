#include "internal/vector/memory_vector_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace strata::vector {

MemoryVectorStore::Collection& MemoryVectorStore::Get(const std::string& collection) {
  auto it = collections_.find(collection);
  if (it == collections_.end()) throw util::NotFound("vector collection not found: " + collection);
  return it->second;
}

void MemoryVectorStore::EnsureCollection(const std::string& collection, uint32_t dimension) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = collections_.try_emplace(collection);
  if (inserted) {
    it->second.dimension = dimension;
    return;
  }
  if (it->second.dimension != dimension) {
    throw util::InvalidState("collection " + collection + " has dimension " + std::to_string(it->second.dimension));
  }
}

void MemoryVectorStore::Upsert(const std::string& collection, const std::vector<VectorPoint>& points) {
  std::lock_guard lock(mutex_);
  auto&           c = Get(collection);
  for (const auto& p : points) {
    if (p.vector.size() != c.dimension) throw util::ValidationError("vector dimension mismatch for point " + p.id);
  }
  for (const auto& p : points) c.points[p.id] = p;
}

std::vector<ScoredPoint> MemoryVectorStore::Search(const std::string& collection, const std::vector<float>& query,
                                                   const VectorFilter& filter, std::size_t top_k) {
  std::lock_guard          lock(mutex_);
  auto&                    c = Get(collection);
  std::vector<ScoredPoint> scored;
  for (const auto& [id, p] : c.points) {
    if (!MatchesFilter(p.payload, filter)) continue;
    scored.push_back({id, Cosine(query, p.vector), p.payload});
  }
  auto by_score = [](const ScoredPoint& a, const ScoredPoint& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
  };
  if (scored.size() > top_k) {
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(top_k), scored.end(), by_score);
    scored.resize(top_k);
  } else {
    std::sort(scored.begin(), scored.end(), by_score);
  }
  return scored;
}

std::vector<VectorPoint> MemoryVectorStore::Retrieve(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard          lock(mutex_);
  auto&                    c = Get(collection);
  std::vector<VectorPoint> out;
  for (const auto& id : ids) {
    auto it = c.points.find(id);
    if (it != c.points.end()) out.push_back(it->second);
  }
  return out;
}

uint64_t MemoryVectorStore::DeletePoints(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard lock(mutex_);
  auto&           c       = Get(collection);
  uint64_t        removed = 0;
  for (const auto& id : ids) removed += c.points.erase(id);
  return removed;
}

uint64_t MemoryVectorStore::DeleteByBatch(const std::string& collection, const std::string& batch_id) {
  std::lock_guard lock(mutex_);
  auto&           c = Get(collection);
  return static_cast<uint64_t>(std::erase_if(c.points, [&](const auto& entry) { return entry.second.payload.batch_id == batch_id; }));
}

uint64_t MemoryVectorStore::Count(const std::string& collection) {
  std::lock_guard lock(mutex_);
  return Get(collection).points.size();
}

} // namespace strata::vector
