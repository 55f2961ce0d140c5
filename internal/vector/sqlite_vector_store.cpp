#include "internal/vector/sqlite_vector_store.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace strata::vector {

using db::sqlite::Statement;

namespace {

constexpr const char* kPointColumns =
    "point_id,record_id,batch_id,chunk_sequence,word_count,start_offset,domain,content_type,ingested_at_ms,text,vector";

void Check(sqlite3* db, int rc, const char* what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return;
  if ((rc & 0xFF) == SQLITE_BUSY || (rc & 0xFF) == SQLITE_LOCKED) {
    throw util::TransientStoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
  throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

bool StepRow(sqlite3* db, Statement& st, const char* what) {
  const int rc = st.Step();
  if (rc == SQLITE_ROW) return true;
  Check(db, rc, what);
  return false;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const auto* t = static_cast<const char*>(sqlite3_column_blob(st, col));
  return t ? std::string(t, static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string{};
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

VectorPoint ReadPoint(sqlite3_stmt* st) {
  VectorPoint p;
  p.id                     = ColText(st, 0);
  p.payload.record_id      = ColText(st, 1);
  p.payload.batch_id       = ColText(st, 2);
  p.payload.chunk_sequence = static_cast<uint32_t>(ColU64(st, 3));
  p.payload.word_count     = ColU64(st, 4);
  p.payload.start_offset   = ColU64(st, 5);
  p.payload.domain         = ColText(st, 6);
  p.payload.content_type   = ColText(st, 7);
  p.payload.ingested_at_ms = ColU64(st, 8);
  p.payload.text           = ColText(st, 9);

  const auto* blob  = sqlite3_column_blob(st, 10);
  const int   bytes = sqlite3_column_bytes(st, 10);
  p.vector.resize(static_cast<std::size_t>(bytes) / sizeof(float));
  if (blob && !p.vector.empty()) std::memcpy(p.vector.data(), blob, p.vector.size() * sizeof(float));
  return p;
}

} // namespace

SqliteVectorStore::SqliteVectorStore(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void SqliteVectorStore::Bootstrap() {
  std::lock_guard lock(db_->Mutex());
  db_->Exec("CREATE TABLE IF NOT EXISTS vector_collections (name TEXT PRIMARY KEY, dimension INTEGER NOT NULL);");
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS vector_points ("
      " collection TEXT NOT NULL, point_id TEXT NOT NULL, record_id TEXT NOT NULL, batch_id TEXT NOT NULL,"
      " chunk_sequence INTEGER NOT NULL, word_count INTEGER NOT NULL, start_offset INTEGER NOT NULL,"
      " domain TEXT NOT NULL, content_type TEXT NOT NULL, ingested_at_ms INTEGER NOT NULL, text TEXT NOT NULL,"
      " vector BLOB NOT NULL, PRIMARY KEY (collection, point_id));");
  db_->Exec("CREATE INDEX IF NOT EXISTS vector_points_batch ON vector_points(collection, batch_id);");
}

uint32_t SqliteVectorStore::Dimension(const std::string& collection) {
  auto*     db = db_->Handle();
  Statement st(db, "SELECT dimension FROM vector_collections WHERE name=?;");
  BindText(st.get(), 1, collection);
  if (!StepRow(db, st, "vector collection lookup")) throw util::NotFound("vector collection not found: " + collection);
  return static_cast<uint32_t>(ColU64(st.get(), 0));
}

void SqliteVectorStore::EnsureCollection(const std::string& collection, uint32_t dimension) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  {
    Statement st(db, "INSERT INTO vector_collections(name, dimension) VALUES(?,?) ON CONFLICT(name) DO NOTHING;");
    BindText(st.get(), 1, collection);
    BindU64(st.get(), 2, dimension);
    Check(db, st.Step(), "create vector collection");
  }
  const auto existing = Dimension(collection);
  if (existing != dimension) {
    throw util::InvalidState("collection " + collection + " has dimension " + std::to_string(existing));
  }
}

void SqliteVectorStore::Upsert(const std::string& collection, const std::vector<VectorPoint>& points) {
  std::lock_guard lock(db_->Mutex());
  auto*           db        = db_->Handle();
  const auto      dimension = Dimension(collection);
  for (const auto& p : points) {
    if (p.vector.size() != dimension) throw util::ValidationError("vector dimension mismatch for point " + p.id);
  }

  db_->Exec("BEGIN IMMEDIATE;");
  try {
    Statement st(db,
                 "INSERT INTO vector_points(collection,point_id,record_id,batch_id,chunk_sequence,word_count,start_offset,"
                 "domain,content_type,ingested_at_ms,text,vector) VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
                 " ON CONFLICT(collection, point_id) DO UPDATE SET record_id=excluded.record_id, batch_id=excluded.batch_id,"
                 " chunk_sequence=excluded.chunk_sequence, word_count=excluded.word_count, start_offset=excluded.start_offset,"
                 " domain=excluded.domain, content_type=excluded.content_type, ingested_at_ms=excluded.ingested_at_ms,"
                 " text=excluded.text, vector=excluded.vector;");
    for (const auto& p : points) {
      sqlite3_reset(st.get());
      BindText(st.get(), 1, collection);
      BindText(st.get(), 2, p.id);
      BindText(st.get(), 3, p.payload.record_id);
      BindText(st.get(), 4, p.payload.batch_id);
      BindU64(st.get(), 5, p.payload.chunk_sequence);
      BindU64(st.get(), 6, p.payload.word_count);
      BindU64(st.get(), 7, p.payload.start_offset);
      BindText(st.get(), 8, p.payload.domain);
      BindText(st.get(), 9, p.payload.content_type);
      BindU64(st.get(), 10, p.payload.ingested_at_ms);
      BindText(st.get(), 11, p.payload.text);
      sqlite3_bind_blob(st.get(), 12, p.vector.data(), static_cast<int>(p.vector.size() * sizeof(float)), SQLITE_TRANSIENT);
      Check(db, st.Step(), "vector upsert");
    }
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    db_->Exec("ROLLBACK;");
    throw;
  }
}

std::vector<ScoredPoint> SqliteVectorStore::Search(const std::string& collection, const std::vector<float>& query,
                                                   const VectorFilter& filter, std::size_t top_k) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  Dimension(collection);

  std::string sql = std::string("SELECT ") + kPointColumns + " FROM vector_points WHERE collection=?";
  if (!filter.domain.empty()) sql += " AND domain=?";
  if (!filter.content_type.empty()) sql += " AND content_type=?";
  if (filter.created_after_ms != 0) sql += " AND ingested_at_ms>=?";
  if (filter.created_before_ms != 0) sql += " AND ingested_at_ms<?";
  sql += ";";

  Statement st(db, sql.c_str());
  int       idx = 1;
  BindText(st.get(), idx++, collection);
  if (!filter.domain.empty()) BindText(st.get(), idx++, filter.domain);
  if (!filter.content_type.empty()) BindText(st.get(), idx++, filter.content_type);
  if (filter.created_after_ms != 0) BindU64(st.get(), idx++, filter.created_after_ms);
  if (filter.created_before_ms != 0) BindU64(st.get(), idx++, filter.created_before_ms);

  std::vector<ScoredPoint> scored;
  while (StepRow(db, st, "vector search")) {
    auto p = ReadPoint(st.get());
    scored.push_back({p.id, Cosine(query, p.vector), std::move(p.payload)});
  }

  auto by_score = [](const ScoredPoint& a, const ScoredPoint& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
  };
  std::sort(scored.begin(), scored.end(), by_score);
  if (scored.size() > top_k) scored.resize(top_k);
  return scored;
}

std::vector<VectorPoint> SqliteVectorStore::Retrieve(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  Dimension(collection);

  const std::string        sql = std::string("SELECT ") + kPointColumns + " FROM vector_points WHERE collection=? AND point_id=?;";
  Statement                st(db, sql.c_str());
  std::vector<VectorPoint> out;
  for (const auto& id : ids) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, collection);
    BindText(st.get(), 2, id);
    if (StepRow(db, st, "vector retrieve")) out.push_back(ReadPoint(st.get()));
  }
  return out;
}

uint64_t SqliteVectorStore::DeletePoints(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  Dimension(collection);

  Statement st(db, "DELETE FROM vector_points WHERE collection=? AND point_id=?;");
  uint64_t  removed = 0;
  for (const auto& id : ids) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, collection);
    BindText(st.get(), 2, id);
    Check(db, st.Step(), "vector delete");
    removed += static_cast<uint64_t>(sqlite3_changes(db));
  }
  return removed;
}

uint64_t SqliteVectorStore::DeleteByBatch(const std::string& collection, const std::string& batch_id) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  Dimension(collection);

  Statement st(db, "DELETE FROM vector_points WHERE collection=? AND batch_id=?;");
  BindText(st.get(), 1, collection);
  BindText(st.get(), 2, batch_id);
  Check(db, st.Step(), "vector delete batch");
  return static_cast<uint64_t>(sqlite3_changes(db));
}

uint64_t SqliteVectorStore::Count(const std::string& collection) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();
  Dimension(collection);

  Statement st(db, "SELECT COUNT(*) FROM vector_points WHERE collection=?;");
  BindText(st.get(), 1, collection);
  return StepRow(db, st, "vector count") ? ColU64(st.get(), 0) : 0;
}

} // namespace strata::vector
