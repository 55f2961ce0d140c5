#include "leg_store.hpp"

#include <exception>
#include <future>
#include <utility>

#include "internal/coordinator/chunker.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"
#include "internal/util/uuid.hpp"

namespace strata::legs {

using observability::IntField;
using observability::StringField;

Location Location::Of(const db::model::ContentRecord& r) {
  Location l;
  l.blob_hash         = r.blob_hash;
  l.vector_batch_id   = r.vector_batch_id;
  l.vector_collection = r.vector_collection;
  l.chunk_count       = r.chunk_count;
  l.table_name        = r.table_name;
  l.table_row_id      = r.table_row_id;
  return l;
}

void Location::ApplyTo(db::model::ContentRecord& r, unsigned mask) const {
  if (mask & model::kLegBlob) {
    r.blob_hash = blob_hash;
  }
  if (mask & model::kLegVectors) {
    r.vector_batch_id   = vector_batch_id;
    r.vector_collection = vector_collection;
    r.chunk_count       = chunk_count;
  }
  if (mask & model::kLegTableRow) {
    r.table_name   = table_name;
    r.table_row_id = table_row_id;
  }
}

unsigned Location::Present() const {
  unsigned mask = 0;
  if (!blob_hash.empty()) mask |= model::kLegBlob;
  if (!vector_batch_id.empty()) mask |= model::kLegVectors;
  if (!table_row_id.empty()) mask |= model::kLegTableRow;
  return mask;
}

LegStore::LegStore(db::Repository& repo, vector::VectorStore& vectors, const embedding::Embedder& embedder,
                   schema::TableRegistry& tables, util::WorkerPool& pool, LegStoreOptions options)
    : repo_(repo), vectors_(vectors), embedder_(embedder), tables_(tables), pool_(pool), options_(std::move(options)) {
}

WrittenLegs LegStore::Write(unsigned legs, const LegContext& ctx) {
  WrittenLegs out;
  out.requested = legs;

  using Writer = void (LegStore::*)(const LegContext&, WrittenLegs&);
  const std::pair<unsigned, Writer> writers[] = {
      {model::kLegBlob, &LegStore::WriteBlob},
      {model::kLegVectors, &LegStore::WriteVectors},
      {model::kLegTableRow, &LegStore::WriteTableRow},
  };

  for (const auto& [leg, writer] : writers) {
    if ((legs & leg) == 0) continue;
    try {
      (this->*writer)(ctx, out);
      out.written |= leg;
    } catch (const std::exception& e) {
      out.error = std::string(model::LegName(leg)) + ": " + e.what();
      STRATA_LOG_WARN("leg write failed", {StringField("record_id", ctx.record_id), StringField("leg", model::LegName(leg)),
                                           StringField("error", e.what())});
    }
  }
  return out;
}

void LegStore::WriteBlob(const LegContext& ctx, WrittenLegs& out) {
  db::model::BlobRecord blob;
  blob.owner_record_id = ctx.record_id;
  blob.content_hash    = ctx.content_hash.empty() ? util::Sha256Hex(ctx.content) : ctx.content_hash;
  blob.body            = ctx.content;
  blob.size_bytes      = ctx.content.size();
  blob.created_at_ms   = ctx.now_ms;

  util::RetryTransient(options_.retry, [&] {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.InsertBlob(*tx, blob), "insert blob");
    tx->Commit();
  });
  out.location.blob_hash = blob.content_hash;
}

void LegStore::EnsureCollection() {
  if (collection_ready_.load(std::memory_order_acquire)) return;
  util::RetryTransient(options_.retry, [&] { vectors_.EnsureCollection(options_.collection, embedder_.Dimension()); });
  collection_ready_.store(true, std::memory_order_release);
}

void LegStore::WriteVectors(const LegContext& ctx, WrittenLegs& out) {
  EnsureCollection();

  const auto chunks = coordinator::ChunkText(ctx.content, options_.chunk_size, options_.chunk_overlap);

  db::model::StagedBatch batch;
  batch.batch_id        = util::NewId();
  batch.record_id       = ctx.record_id;
  batch.collection      = options_.collection;
  batch.expected_chunks = static_cast<uint32_t>(chunks.size());
  batch.state           = strata::engine::v1::BATCH_STATE_PENDING;
  batch.created_at_ms   = ctx.now_ms;

  util::RetryTransient(options_.retry, [&] {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.InsertBatch(*tx, batch), "insert batch");
    tx->Commit();
  });

  std::vector<db::model::VectorMapping> mappings;
  std::vector<std::future<void>>        pending;
  mappings.reserve(chunks.size());
  pending.reserve(chunks.size());

  for (const auto& chunk : chunks) {
    db::model::VectorMapping m;
    m.record_id      = ctx.record_id;
    m.batch_id       = batch.batch_id;
    m.collection     = options_.collection;
    m.point_id       = util::NewId();
    m.dimension      = embedder_.Dimension();
    m.model          = embedder_.Model();
    m.chunk_sequence = chunk.sequence;
    mappings.push_back(m);

    vector::VectorPoint point;
    point.id                     = m.point_id;
    point.payload.record_id      = ctx.record_id;
    point.payload.batch_id       = batch.batch_id;
    point.payload.chunk_sequence = chunk.sequence;
    point.payload.word_count     = chunk.word_count;
    point.payload.start_offset   = chunk.start_offset;
    point.payload.domain         = ctx.domain;
    point.payload.content_type   = ctx.content_type;
    point.payload.ingested_at_ms = ctx.ingested_at_ms != 0 ? ctx.ingested_at_ms : ctx.now_ms;
    point.payload.text           = std::string(chunk.text);

    pending.push_back(pool_.Submit([this, point = std::move(point)]() mutable {
      point.vector = embedder_.Embed(point.payload.text);
      util::RetryTransient(options_.retry, [&] { vectors_.Upsert(options_.collection, {point}); });
    }));
  }

  // Every chunk is joined before deciding; the marker is never written
  // while an upload is still in flight.
  std::exception_ptr first_error;
  for (auto& f : pending) {
    try {
      f.get();
    } catch (const std::exception&) {
      if (!first_error) first_error = std::current_exception();
    }
  }

  if (first_error) {
    try {
      vectors_.DeleteByBatch(options_.collection, batch.batch_id);
      auto tx = repo_.Begin();
      db::ThrowIfDbError(repo_.DeleteBatch(*tx, batch.batch_id), "delete batch");
      tx->Commit();
    } catch (const std::exception& e) {
      STRATA_LOG_WARN("partial batch left for orphan sweep",
                      {StringField("batch_id", batch.batch_id), StringField("error", e.what())});
    }
    std::rethrow_exception(first_error);
  }

  out.location.vector_batch_id   = batch.batch_id;
  out.location.vector_collection = options_.collection;
  out.location.chunk_count       = batch.expected_chunks;
  out.mappings                   = std::move(mappings);

  STRATA_LOG_DEBUG("vector batch staged", {StringField("record_id", ctx.record_id), StringField("batch_id", batch.batch_id),
                                           IntField("chunks", static_cast<int64_t>(chunks.size()))});
}

void LegStore::WriteTableRow(const LegContext& ctx, WrittenLegs& out) {
  const auto descriptor = util::RetryTransient(options_.retry, [&] {
    return tables_.EnsureTable(ctx.domain, ctx.content_type, ctx.now_ms);
  });

  db::model::TableRow row;
  row.row_id        = util::NewId();
  row.record_id     = ctx.record_id;
  row.title         = ctx.title;
  row.body          = ctx.content;
  row.word_count    = util::CountWords(ctx.content);
  row.created_at_ms = ctx.now_ms;

  util::RetryTransient(options_.retry, [&] {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.InsertTableRow(*tx, descriptor.name, row), "insert row into " + descriptor.name);
    db::ThrowIfDbError(repo_.BumpTableUsage(*tx, descriptor.name, 1, 0), "bump usage " + descriptor.name);
    tx->Commit();
  });

  out.location.table_name   = descriptor.name;
  out.location.table_row_id = row.row_id;
}

void LegStore::DeleteLeg(const std::string& record_id, unsigned leg, const std::string& ref, const std::string& collection) {
  switch (leg) {
    case model::kLegBlob: {
      auto tx = repo_.Begin();
      db::ThrowIfDbError(repo_.DeleteBlob(*tx, record_id, ref), "delete blob");
      tx->Commit();
      return;
    }
    case model::kLegVectors: {
      vectors_.DeleteByBatch(collection, ref);
      auto tx  = repo_.Begin();
      auto res = repo_.DeleteBatch(*tx, ref);
      if (res.code != db::ErrorCode::NotFound) db::ThrowIfDbError(res, "delete batch");
      tx->Commit();
      return;
    }
    case model::kLegTableRow: {
      auto tx = repo_.Begin();
      db::ThrowIfDbError(repo_.DeleteTableRow(*tx, collection, ref), "delete row");
      auto bump = repo_.BumpTableUsage(*tx, collection, -1, 0);
      if (bump.code != db::ErrorCode::NotFound) db::ThrowIfDbError(bump, "bump usage");
      tx->Commit();
      return;
    }
    default:
      throw util::ValidationError("unknown leg " + std::to_string(leg));
  }
}

bool LegStore::PointsPresent(const std::string& collection, const std::vector<std::string>& point_ids) {
  if (point_ids.empty()) return true;
  return vectors_.Retrieve(collection, point_ids).size() == point_ids.size();
}

std::optional<std::string> LegStore::ReadContent(const std::string& record_id, const Location& location) {
  std::vector<db::model::VectorMapping> mappings;
  {
    auto tx = repo_.Begin();
    if (!location.blob_hash.empty()) {
      if (auto blob = repo_.GetBlob(*tx, record_id, location.blob_hash)) return blob->body;
    }
    if (!location.table_row_id.empty()) {
      if (auto row = repo_.GetTableRow(*tx, location.table_name, location.table_row_id)) return row->body;
    }
    if (location.vector_batch_id.empty()) return std::nullopt;
    mappings = repo_.ListVectorMappings(*tx, location.vector_batch_id);
    tx->Rollback();
  }
  if (mappings.empty()) return std::nullopt;

  std::vector<std::string> ids;
  ids.reserve(mappings.size());
  for (const auto& m : mappings) ids.push_back(m.point_id);

  const auto points = vectors_.Retrieve(location.vector_collection, ids);
  if (points.size() != ids.size()) return std::nullopt;

  // Chunks overlap; each contributes only the bytes past what is already assembled.
  std::string body;
  for (const auto& p : points) {
    const auto start = p.payload.start_offset;
    if (start > body.size()) return std::nullopt;
    const auto covered = body.size() - start;
    if (covered < p.payload.text.size()) body.append(p.payload.text, covered, std::string::npos);
  }
  return body;
}

} // namespace strata::legs
