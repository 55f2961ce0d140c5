#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/vector/vector_store.hpp"

namespace strata::vector {

// In-process vector store; exhaustive cosine scan.
class MemoryVectorStore final : public VectorStore {
 public:
  void                     EnsureCollection(const std::string& collection, uint32_t dimension) override;
  void                     Upsert(const std::string& collection, const std::vector<VectorPoint>& points) override;
  std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& query, const VectorFilter& filter,
                                  std::size_t top_k) override;
  std::vector<VectorPoint> Retrieve(const std::string& collection, const std::vector<std::string>& ids) override;
  uint64_t                 DeletePoints(const std::string& collection, const std::vector<std::string>& ids) override;
  uint64_t                 DeleteByBatch(const std::string& collection, const std::string& batch_id) override;
  uint64_t                 Count(const std::string& collection) override;

 private:
  struct Collection {
    uint32_t                           dimension = 0;
    std::map<std::string, VectorPoint> points;
  };

  Collection& Get(const std::string& collection);

  std::mutex                        mutex_;
  std::map<std::string, Collection> collections_;
};

} // namespace strata::vector
