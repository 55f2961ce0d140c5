#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedder.hpp"
#include "internal/schema/table_registry.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/worker_pool.hpp"
#include "internal/vector/vector_store.hpp"

namespace strata::legs {

// Location pointer columns of a content record.
struct Location {
  std::string blob_hash;
  std::string vector_batch_id;
  std::string vector_collection;
  uint32_t    chunk_count = 0;
  std::string table_name;
  std::string table_row_id;

  static Location Of(const db::model::ContentRecord& record);

  // Copies only the legs present in mask.
  void ApplyTo(db::model::ContentRecord& record, unsigned mask) const;

  // Legs this pointer references.
  unsigned Present() const;

  bool operator==(const Location&) const = default;
};

struct LegContext {
  std::string record_id;
  std::string content;
  std::string content_hash;
  std::string title;
  std::string domain;
  std::string content_type;
  uint64_t    now_ms = 0;
  // Chunk payload timestamp; 0 uses now_ms. Rewrites keep the record's
  // creation time so time-range filters stay stable.
  uint64_t ingested_at_ms = 0;
};

/*
  Outcome of writing a set of legs.

  Written legs are complete but unpublished: a vector batch is still
  PENDING until the consistency mapper marks it COMPLETE in the same
  transaction that publishes the pointer.
*/
struct WrittenLegs {
  unsigned requested = 0;
  unsigned written   = 0;

  Location                              location;
  std::vector<db::model::VectorMapping> mappings;
  std::string                           error;

  unsigned Failed() const {
    return requested & ~written;
  }
};

struct LegStoreOptions {
  std::string       collection;
  uint32_t          chunk_size    = 1000;
  uint32_t          chunk_overlap = 200;
  util::RetryPolicy retry;
};

/*
  Physical storage legs: blob, vector chunks, dynamic table row.

  Each leg is written with transient retries inside the call. A leg that
  still fails is reported in WrittenLegs, never thrown; a partially
  written vector batch is removed on the way out (or left PENDING for
  the orphan sweep if removal fails too).

  Vector store calls never run inside a relational transaction.
*/
class LegStore {
 public:
  LegStore(db::Repository& repo, vector::VectorStore& vectors, const embedding::Embedder& embedder,
           schema::TableRegistry& tables, util::WorkerPool& pool, LegStoreOptions options);

  WrittenLegs Write(unsigned legs, const LegContext& ctx);

  // Removes one leg. Throws on store failure so callers can defer it.
  void DeleteLeg(const std::string& record_id, unsigned leg, const std::string& ref, const std::string& collection);

  // Body from the first readable leg: blob, table row, then reassembled chunks.
  std::optional<std::string> ReadContent(const std::string& record_id, const Location& location);

  // True when every point id is retrievable from the collection.
  bool PointsPresent(const std::string& collection, const std::vector<std::string>& point_ids);

  const std::string& Collection() const {
    return options_.collection;
  }

  const embedding::Embedder& Embedder() const {
    return embedder_;
  }

 private:
  void WriteBlob(const LegContext& ctx, WrittenLegs& out);
  void WriteVectors(const LegContext& ctx, WrittenLegs& out);
  void WriteTableRow(const LegContext& ctx, WrittenLegs& out);
  void EnsureCollection();

  db::Repository&            repo_;
  vector::VectorStore&       vectors_;
  const embedding::Embedder& embedder_;
  schema::TableRegistry&     tables_;
  util::WorkerPool&          pool_;
  LegStoreOptions            options_;

  std::atomic<bool> collection_ready_{false};
};

} // namespace strata::legs
