#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/vector/vector_store.hpp"

namespace strata::vector {

/*
  Vector store on a dedicated SQLite database.

  Embeddings are stored as float32 BLOBs; search filters on payload
  columns in SQL and scores candidates with cosine similarity.
*/
class SqliteVectorStore final : public VectorStore {
 public:
  explicit SqliteVectorStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Bootstrap();

  void                     EnsureCollection(const std::string& collection, uint32_t dimension) override;
  void                     Upsert(const std::string& collection, const std::vector<VectorPoint>& points) override;
  std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& query, const VectorFilter& filter,
                                  std::size_t top_k) override;
  std::vector<VectorPoint> Retrieve(const std::string& collection, const std::vector<std::string>& ids) override;
  uint64_t                 DeletePoints(const std::string& collection, const std::vector<std::string>& ids) override;
  uint64_t                 DeleteByBatch(const std::string& collection, const std::string& batch_id) override;
  uint64_t                 Count(const std::string& collection) override;

 private:
  uint32_t Dimension(const std::string& collection);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace strata::vector
