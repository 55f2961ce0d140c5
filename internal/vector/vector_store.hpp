#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace strata::vector {

/*
  Payload stored beside each chunk embedding.

  batch_id lets readers drop points whose batch is not the record's
  current vector_batch_id; start_offset allows reassembly of the body.
*/
struct ChunkPayload {
  std::string record_id;
  std::string batch_id;
  uint32_t    chunk_sequence = 0;
  uint64_t    word_count     = 0;
  uint64_t    start_offset   = 0;

  std::string domain;
  std::string content_type;
  uint64_t    ingested_at_ms = 0;

  std::string text;
};

struct VectorPoint {
  std::string        id;
  std::vector<float> vector;
  ChunkPayload       payload;
};

// Payload filter applied before scoring. Empty strings / zero bounds
// mean "no constraint".
struct VectorFilter {
  std::string domain;
  std::string content_type;
  uint64_t    created_after_ms  = 0;
  uint64_t    created_before_ms = 0;
};

struct ScoredPoint {
  std::string  id;
  double       score = 0.0; // cosine similarity
  ChunkPayload payload;
};

/*
  Vector store abstraction.

  Failures talking to the store surface as util::TransientStoreError.
  Upsert is idempotent on point id. Search results are ordered by
  score descending, then id.
*/
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  // Creates the collection if missing. InvalidState when it exists with
  // a different dimension.
  virtual void EnsureCollection(const std::string& collection, uint32_t dimension) = 0;

  virtual void Upsert(const std::string& collection, const std::vector<VectorPoint>& points) = 0;

  virtual std::vector<ScoredPoint> Search(const std::string& collection, const std::vector<float>& query, const VectorFilter& filter,
                                          std::size_t top_k) = 0;

  // Points in the order requested; missing ids are skipped.
  virtual std::vector<VectorPoint> Retrieve(const std::string& collection, const std::vector<std::string>& ids) = 0;

  virtual uint64_t DeletePoints(const std::string& collection, const std::vector<std::string>& ids) = 0;

  virtual uint64_t DeleteByBatch(const std::string& collection, const std::string& batch_id) = 0;

  virtual uint64_t Count(const std::string& collection) = 0;
};

// Cosine similarity; 0 when either side has zero norm or dimensions differ.
double Cosine(const std::vector<float>& a, const std::vector<float>& b);

bool MatchesFilter(const ChunkPayload& payload, const VectorFilter& filter);

} // namespace strata::vector
