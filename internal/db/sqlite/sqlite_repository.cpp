#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <variant>

#include "internal/db/sql/codec.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace strata::db::sqlite {

using strata::db::ErrorCode;
using strata::db::Result;

namespace v1 = strata::engine::v1;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const auto* t = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   n = sqlite3_column_bytes(st, col);
  return t ? std::string(t, static_cast<std::size_t>(n)) : std::string{};
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

// Reads fail loudly; a read that cannot run is not "row absent".
bool StepRow(sqlite3* db, Statement& st) {
  const int rc = st.Step();
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw util::TransientStoreError(sqlite3_errmsg(db));
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

// ---------------------------------------------------------------------------
// Content record mapping
// ---------------------------------------------------------------------------

constexpr const char* kRecordColumns =
    "id,source_locator,title,author,domain,content_type,declared_size,text_size,content_hash,"
    "semantic_complexity,topic_coherence,information_density,query_potential,"
    "strategy,policy_version,confidence,reasoning,status,needs_review,"
    "blob_hash,vector_batch_id,vector_collection,chunk_count,table_name,table_row_id,"
    "preview,metadata_json,tags,query_count,last_queried_at_ms,access_frequency,"
    "scrape_count,version,created_at_ms,updated_at_ms";

// Binds every column except id, starting at idx. Returns the next index.
int BindRecordFields(sqlite3_stmt* st, int idx, const model::ContentRecord& r) {
  BindText(st, idx++, r.source_locator);
  BindText(st, idx++, r.title);
  BindText(st, idx++, r.author);
  BindText(st, idx++, r.domain);
  BindText(st, idx++, r.content_type);
  BindU64(st, idx++, r.declared_size);
  BindU64(st, idx++, r.text_size);
  BindText(st, idx++, r.content_hash);
  BindDouble(st, idx++, r.semantic_complexity);
  BindDouble(st, idx++, r.topic_coherence);
  BindDouble(st, idx++, r.information_density);
  BindDouble(st, idx++, r.query_potential);
  BindI32(st, idx++, static_cast<int>(r.strategy));
  BindU64(st, idx++, r.policy_version);
  BindDouble(st, idx++, r.confidence);
  BindText(st, idx++, sql::EncodeStringList(r.reasoning));
  BindI32(st, idx++, static_cast<int>(r.status));
  BindI32(st, idx++, r.needs_review ? 1 : 0);
  BindText(st, idx++, r.blob_hash);
  BindText(st, idx++, r.vector_batch_id);
  BindText(st, idx++, r.vector_collection);
  BindU64(st, idx++, r.chunk_count);
  BindText(st, idx++, r.table_name);
  BindText(st, idx++, r.table_row_id);
  BindText(st, idx++, r.preview);
  BindText(st, idx++, r.metadata_json);
  BindText(st, idx++, sql::EncodeStringList(r.tags));
  BindU64(st, idx++, r.query_count);
  BindU64(st, idx++, r.last_queried_at_ms);
  BindDouble(st, idx++, r.access_frequency);
  BindU64(st, idx++, r.scrape_count);
  BindU64(st, idx++, r.version);
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.updated_at_ms);
  return idx;
}

model::ContentRecord ReadRecord(sqlite3_stmt* st) {
  model::ContentRecord r;
  int                  c = 0;
  r.id                   = ColText(st, c++);
  r.source_locator       = ColText(st, c++);
  r.title                = ColText(st, c++);
  r.author               = ColText(st, c++);
  r.domain               = ColText(st, c++);
  r.content_type         = ColText(st, c++);
  r.declared_size        = ColU64(st, c++);
  r.text_size            = ColU64(st, c++);
  r.content_hash         = ColText(st, c++);
  r.semantic_complexity  = ColDouble(st, c++);
  r.topic_coherence      = ColDouble(st, c++);
  r.information_density  = ColDouble(st, c++);
  r.query_potential      = ColDouble(st, c++);
  r.strategy             = static_cast<v1::Strategy>(ColI32(st, c++));
  r.policy_version       = static_cast<uint32_t>(ColU64(st, c++));
  r.confidence           = ColDouble(st, c++);
  r.reasoning            = sql::DecodeStringList(ColText(st, c++));
  r.status               = static_cast<v1::RecordStatus>(ColI32(st, c++));
  r.needs_review         = ColI32(st, c++) != 0;
  r.blob_hash            = ColText(st, c++);
  r.vector_batch_id      = ColText(st, c++);
  r.vector_collection    = ColText(st, c++);
  r.chunk_count          = static_cast<uint32_t>(ColU64(st, c++));
  r.table_name           = ColText(st, c++);
  r.table_row_id         = ColText(st, c++);
  r.preview              = ColText(st, c++);
  r.metadata_json        = ColText(st, c++);
  r.tags                 = sql::DecodeStringList(ColText(st, c++));
  r.query_count          = ColU64(st, c++);
  r.last_queried_at_ms   = ColU64(st, c++);
  r.access_frequency     = ColDouble(st, c++);
  r.scrape_count         = ColU64(st, c++);
  r.version              = ColU64(st, c++);
  r.created_at_ms        = ColU64(st, c++);
  r.updated_at_ms        = ColU64(st, c++);
  return r;
}

// ---------------------------------------------------------------------------
// Filter push-down
// ---------------------------------------------------------------------------

using Param = std::variant<int64_t, std::string>;

struct WhereClause {
  std::string        sql;
  std::vector<Param> params;
};

WhereClause BuildWhere(const model::RecordFilter& f, const std::string& prefix) {
  WhereClause w;
  auto        add = [&](const std::string& condition, Param p) {
    w.sql += w.sql.empty() ? " WHERE " : " AND ";
    w.sql += prefix + condition;
    w.params.push_back(std::move(p));
  };
  if (!f.domain.empty()) add("domain = ?", f.domain);
  if (!f.content_type.empty()) add("content_type = ?", f.content_type);
  if (f.created_after_ms != 0) add("created_at_ms >= ?", static_cast<int64_t>(f.created_after_ms));
  if (f.created_before_ms != 0) add("created_at_ms < ?", static_cast<int64_t>(f.created_before_ms));
  if (f.strategy != v1::STRATEGY_UNSPECIFIED) add("strategy = ?", static_cast<int64_t>(f.strategy));
  if (f.status != v1::RECORD_STATUS_UNSPECIFIED) add("status = ?", static_cast<int64_t>(f.status));
  if (f.policy_version_below != 0) add("policy_version < ?", static_cast<int64_t>(f.policy_version_below));
  if (!f.table_name.empty()) add("table_name = ?", f.table_name);
  if (f.needs_review_only) add("needs_review = ?", int64_t{1});
  return w;
}

int BindParams(sqlite3_stmt* st, int idx, const std::vector<Param>& params) {
  for (const auto& p : params) {
    if (const auto* s = std::get_if<std::string>(&p)) {
      BindText(st, idx++, *s);
    } else {
      BindI64(st, idx++, std::get<int64_t>(p));
    }
  }
  return idx;
}

// FTS5 query: every token quoted, implicit AND.
std::string FtsQuery(const std::string& text) {
  std::string out;
  for (const auto& token : util::Tokenize(text)) {
    if (!out.empty()) out += ' ';
    out += '"' + token + '"';
  }
  return out;
}

// ---------------------------------------------------------------------------
// Other row mappings
// ---------------------------------------------------------------------------

constexpr const char* kDescriptorColumns =
    "name,version,domain,content_type,columns_json,indexes_json,ddl_json,state,row_count,query_count,created_at_ms,updated_at_ms";

model::TableDescriptor ReadDescriptor(sqlite3_stmt* st) {
  model::TableDescriptor d;
  d.name          = ColText(st, 0);
  d.version       = static_cast<uint32_t>(ColU64(st, 1));
  d.domain        = ColText(st, 2);
  d.content_type  = ColText(st, 3);
  d.columns       = sql::DecodeColumns(ColText(st, 4));
  d.indexes       = sql::DecodeIndexes(ColText(st, 5));
  d.ddl           = sql::DecodeStringList(ColText(st, 6));
  d.state         = static_cast<model::DescriptorState>(ColI32(st, 7));
  d.row_count     = ColU64(st, 8);
  d.query_count   = ColU64(st, 9);
  d.created_at_ms = ColU64(st, 10);
  d.updated_at_ms = ColU64(st, 11);
  return d;
}

constexpr const char* kRepairColumns =
    "record_id,missing_legs,content,attempts,next_attempt_at_ms,state,last_error,created_at_ms,updated_at_ms";

model::RepairTask ReadRepair(sqlite3_stmt* st) {
  model::RepairTask t;
  t.record_id          = ColText(st, 0);
  t.missing_legs       = static_cast<unsigned>(ColI32(st, 1));
  t.content            = ColText(st, 2);
  t.attempts           = static_cast<uint32_t>(ColU64(st, 3));
  t.next_attempt_at_ms = ColU64(st, 4);
  t.state              = static_cast<v1::RepairState>(ColI32(st, 5));
  t.last_error         = ColText(st, 6);
  t.created_at_ms      = ColU64(st, 7);
  t.updated_at_ms      = ColU64(st, 8);
  return t;
}

constexpr const char* kRecommendationColumns =
    "id,type,target,description,from_strategy,to_strategy,estimated_improvement_pct,confidence,status,detail,created_at_ms,updated_at_ms";

model::RecommendationRecord ReadRecommendation(sqlite3_stmt* st) {
  model::RecommendationRecord r;
  r.id                        = ColText(st, 0);
  r.type                      = static_cast<v1::RecommendationType>(ColI32(st, 1));
  r.target                    = ColText(st, 2);
  r.description               = ColText(st, 3);
  r.from_strategy             = static_cast<v1::Strategy>(ColI32(st, 4));
  r.to_strategy               = static_cast<v1::Strategy>(ColI32(st, 5));
  r.estimated_improvement_pct = ColDouble(st, 6);
  r.confidence                = ColDouble(st, 7);
  r.status                    = static_cast<v1::RecommendationStatus>(ColI32(st, 8));
  r.detail                    = ColText(st, 9);
  r.created_at_ms             = ColU64(st, 10);
  r.updated_at_ms             = ColU64(st, 11);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::Bootstrap() {
  std::lock_guard<std::mutex> lock(db_->Mutex());
  sql::RunMigrations([this](const std::string& statement) { db_->Exec(statement); }, sql::CoreSchema(sql::Dialect::kSqlite));
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Content records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::ContentRecord& r) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT INTO content_records(") + kRecordColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement st(db, sql.c_str());
  BindText(st.get(), 1, r.id);
  BindRecordFields(st.get(), 2, r);
  return Translate(db, st.Step());
}

std::optional<model::ContentRecord> SqliteRepository::GetRecord(Transaction& t, const std::string& id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM content_records WHERE id=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, id);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadRecord(st.get());
}

std::optional<model::ContentRecord> SqliteRepository::GetRecordByLocator(Transaction& t, const std::string& source_locator) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM content_records WHERE source_locator=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, source_locator);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadRecord(st.get());
}

std::vector<model::ContentRecord> SqliteRepository::ListRecords(Transaction& t, const model::RecordFilter& filter) {
  auto*             db    = TX(t).Handle();
  const auto        where = BuildWhere(filter, "");
  const std::string sql   = std::string("SELECT ") + kRecordColumns + " FROM content_records" + where.sql + " ORDER BY id;";
  Statement         st(db, sql.c_str());
  BindParams(st.get(), 1, where.params);

  std::vector<model::ContentRecord> out;
  while (StepRow(db, st)) out.push_back(ReadRecord(st.get()));
  return out;
}

uint64_t SqliteRepository::CountRecords(Transaction& t, const model::RecordFilter& filter) {
  auto*             db    = TX(t).Handle();
  const auto        where = BuildWhere(filter, "");
  const std::string sql   = "SELECT COUNT(*) FROM content_records" + where.sql + ";";
  Statement         st(db, sql.c_str());
  BindParams(st.get(), 1, where.params);
  return StepRow(db, st) ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::UpdateRecord(Transaction& t, const model::ContentRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  static constexpr const char* kSql =
      "UPDATE content_records SET source_locator=?,title=?,author=?,domain=?,content_type=?,declared_size=?,text_size=?,"
      "content_hash=?,semantic_complexity=?,topic_coherence=?,information_density=?,query_potential=?,strategy=?,"
      "policy_version=?,confidence=?,reasoning=?,status=?,needs_review=?,blob_hash=?,vector_batch_id=?,vector_collection=?,"
      "chunk_count=?,table_name=?,table_row_id=?,preview=?,metadata_json=?,tags=?,query_count=?,last_queried_at_ms=?,"
      "access_frequency=?,scrape_count=?,version=?,created_at_ms=?,updated_at_ms=? WHERE id=? AND version=?;";

  Statement st(db, kSql);
  int       idx = BindRecordFields(st.get(), 1, r);
  BindText(st.get(), idx++, r.id);
  BindU64(st.get(), idx, expected_version);

  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  if (!GetRecord(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  return Result::Err(ErrorCode::Conflict, "version mismatch");
}

Result SqliteRepository::MergeAccessStats(Transaction& t, const std::string& id, uint64_t query_delta, uint64_t last_queried_at_ms,
                                          double access_frequency) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE content_records SET query_count=query_count+?, last_queried_at_ms=MAX(last_queried_at_ms, ?),"
               " access_frequency=? WHERE id=?;");
  BindU64(st.get(), 1, query_delta);
  BindU64(st.get(), 2, last_queried_at_ms);
  BindDouble(st.get(), 3, access_frequency);
  BindText(st.get(), 4, id);
  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

std::vector<model::TextHit> SqliteRepository::SearchText(Transaction& t, const std::string& query, const model::RecordFilter& filter,
                                                         std::size_t limit) {
  const auto match = FtsQuery(query);
  if (match.empty() || limit == 0) return {};

  auto*             db    = TX(t).Handle();
  const auto        where = BuildWhere(filter, "c.");
  const std::string sql   = "SELECT c.id, bm25(content_search) AS score FROM content_search"
                            " JOIN content_records c ON c.seq = content_search.rowid"
                            " WHERE content_search MATCH ?" +
                          (where.sql.empty() ? std::string{} : " AND " + where.sql.substr(7)) + " ORDER BY score ASC, c.id ASC LIMIT ?;";

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, match);
  int idx = BindParams(st.get(), 2, where.params);
  BindU64(st.get(), idx, limit);

  std::vector<model::TextHit> hits;
  while (StepRow(db, st)) {
    // bm25() is lower-is-better
    hits.push_back({ColText(st.get(), 0), -ColDouble(st.get(), 1)});
  }
  return hits;
}

// ------------------------------------------------------------------
// Blobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertBlob(Transaction& t, const model::BlobRecord& b) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO content_blobs(owner_record_id,content_hash,body,size_bytes,chunks_json,created_at_ms)"
               " VALUES(?,?,?,?,?,?) ON CONFLICT(owner_record_id,content_hash) DO NOTHING;");
  BindText(st.get(), 1, b.owner_record_id);
  BindText(st.get(), 2, b.content_hash);
  BindText(st.get(), 3, b.body);
  BindU64(st.get(), 4, b.size_bytes);
  BindText(st.get(), 5, b.chunks_json);
  BindU64(st.get(), 6, b.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::BlobRecord> SqliteRepository::GetBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT owner_record_id,content_hash,body,size_bytes,chunks_json,created_at_ms FROM content_blobs"
               " WHERE owner_record_id=? AND content_hash=?;");
  BindText(st.get(), 1, owner_record_id);
  BindText(st.get(), 2, content_hash);
  if (!StepRow(db, st)) return std::nullopt;

  model::BlobRecord b;
  b.owner_record_id = ColText(st.get(), 0);
  b.content_hash    = ColText(st.get(), 1);
  b.body            = ColText(st.get(), 2);
  b.size_bytes      = ColU64(st.get(), 3);
  b.chunks_json     = ColText(st.get(), 4);
  b.created_at_ms   = ColU64(st.get(), 5);
  return b;
}

uint64_t SqliteRepository::CountBlobs(Transaction& t, const std::string& owner_record_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT COUNT(*) FROM content_blobs WHERE owner_record_id=?;");
  BindText(st.get(), 1, owner_record_id);
  return StepRow(db, st) ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::DeleteBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM content_blobs WHERE owner_record_id=? AND content_hash=?;");
  BindText(st.get(), 1, owner_record_id);
  BindText(st.get(), 2, content_hash);
  return Translate(db, st.Step());
}

uint64_t SqliteRepository::DeleteOrphanBlobs(Transaction& t, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "DELETE FROM content_blobs WHERE created_at_ms < ?"
               " AND NOT EXISTS (SELECT 1 FROM content_records c WHERE c.id = content_blobs.owner_record_id);");
  BindU64(st.get(), 1, cutoff_ms);
  if (st.Step() != SQLITE_DONE) throw std::runtime_error(std::string("orphan blob sweep: ") + sqlite3_errmsg(db));
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Batches + mappings
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, const model::StagedBatch& b) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO staged_batches(batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms)"
               " VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, b.batch_id);
  BindText(st.get(), 2, b.record_id);
  BindText(st.get(), 3, b.collection);
  BindU64(st.get(), 4, b.expected_chunks);
  BindI32(st.get(), 5, static_cast<int>(b.state));
  BindU64(st.get(), 6, b.created_at_ms);
  BindU64(st.get(), 7, b.completed_at_ms);
  return Translate(db, st.Step());
}

static model::StagedBatch ReadBatch(sqlite3_stmt* st) {
  model::StagedBatch b;
  b.batch_id        = ColText(st, 0);
  b.record_id       = ColText(st, 1);
  b.collection      = ColText(st, 2);
  b.expected_chunks = static_cast<uint32_t>(ColU64(st, 3));
  b.state           = static_cast<v1::BatchState>(ColI32(st, 4));
  b.created_at_ms   = ColU64(st, 5);
  b.completed_at_ms = ColU64(st, 6);
  return b;
}

std::optional<model::StagedBatch> SqliteRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms"
               " FROM staged_batches WHERE batch_id=?;");
  BindText(st.get(), 1, batch_id);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadBatch(st.get());
}

Result SqliteRepository::CompleteBatch(Transaction& t, const std::string& batch_id, uint64_t completed_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE staged_batches SET state=?, completed_at_ms=? WHERE batch_id=? AND state=?;");
  BindI32(st.get(), 1, v1::BATCH_STATE_COMPLETE);
  BindU64(st.get(), 2, completed_at_ms);
  BindText(st.get(), 3, batch_id);
  BindI32(st.get(), 4, v1::BATCH_STATE_PENDING);
  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 1) return Result::Ok();
  if (!GetBatch(t, batch_id)) return Result::Err(ErrorCode::NotFound, batch_id);
  return Result::Err(ErrorCode::Conflict, "batch not pending");
}

std::vector<model::StagedBatch> SqliteRepository::ListPendingBatches(Transaction& t, uint64_t created_before_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms"
               " FROM staged_batches WHERE state=? AND created_at_ms < ? ORDER BY batch_id;");
  BindI32(st.get(), 1, v1::BATCH_STATE_PENDING);
  BindU64(st.get(), 2, created_before_ms);
  std::vector<model::StagedBatch> out;
  while (StepRow(db, st)) out.push_back(ReadBatch(st.get()));
  return out;
}

Result SqliteRepository::DeleteBatch(Transaction& t, const std::string& batch_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM staged_batches WHERE batch_id=?;"); // mappings cascade
  BindText(st.get(), 1, batch_id);
  return Translate(db, st.Step());
}

Result SqliteRepository::InsertVectorMappings(Transaction& t, const std::vector<model::VectorMapping>& mappings) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO vector_mappings(batch_id,chunk_sequence,point_id,record_id,collection,dimension,model)"
               " VALUES(?,?,?,?,?,?,?);");
  for (const auto& m : mappings) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, m.batch_id);
    BindU64(st.get(), 2, m.chunk_sequence);
    BindText(st.get(), 3, m.point_id);
    BindText(st.get(), 4, m.record_id);
    BindText(st.get(), 5, m.collection);
    BindU64(st.get(), 6, m.dimension);
    BindText(st.get(), 7, m.model);
    auto res = Translate(db, st.Step());
    if (!res) return res;
  }
  return Result::Ok();
}

std::vector<model::VectorMapping> SqliteRepository::ListVectorMappings(Transaction& t, const std::string& batch_id) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT batch_id,chunk_sequence,point_id,record_id,collection,dimension,model"
               " FROM vector_mappings WHERE batch_id=? ORDER BY chunk_sequence;");
  BindText(st.get(), 1, batch_id);

  std::vector<model::VectorMapping> out;
  while (StepRow(db, st)) {
    model::VectorMapping m;
    m.batch_id       = ColText(st.get(), 0);
    m.chunk_sequence = static_cast<uint32_t>(ColU64(st.get(), 1));
    m.point_id       = ColText(st.get(), 2);
    m.record_id      = ColText(st.get(), 3);
    m.collection     = ColText(st.get(), 4);
    m.dimension      = static_cast<uint32_t>(ColU64(st.get(), 5));
    m.model          = ColText(st.get(), 6);
    out.push_back(std::move(m));
  }
  return out;
}

// ------------------------------------------------------------------
// Dynamic tables
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTableDescriptor(Transaction& t, const model::TableDescriptor& d) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT INTO table_descriptors(") + kDescriptorColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?)"
                          " ON CONFLICT(name) DO UPDATE SET version=excluded.version, domain=excluded.domain,"
                          " content_type=excluded.content_type, columns_json=excluded.columns_json,"
                          " indexes_json=excluded.indexes_json, ddl_json=excluded.ddl_json, state=excluded.state,"
                          " row_count=excluded.row_count, query_count=excluded.query_count,"
                          " updated_at_ms=excluded.updated_at_ms;";
  Statement st(db, sql.c_str());
  BindText(st.get(), 1, d.name);
  BindU64(st.get(), 2, d.version);
  BindText(st.get(), 3, d.domain);
  BindText(st.get(), 4, d.content_type);
  BindText(st.get(), 5, sql::EncodeColumns(d.columns));
  BindText(st.get(), 6, sql::EncodeIndexes(d.indexes));
  BindText(st.get(), 7, sql::EncodeStringList(d.ddl));
  BindI32(st.get(), 8, static_cast<int>(d.state));
  BindU64(st.get(), 9, d.row_count);
  BindU64(st.get(), 10, d.query_count);
  BindU64(st.get(), 11, d.created_at_ms);
  BindU64(st.get(), 12, d.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::TableDescriptor> SqliteRepository::GetTableDescriptor(Transaction& t, const std::string& name) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kDescriptorColumns + " FROM table_descriptors WHERE name=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, name);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadDescriptor(st.get());
}

std::vector<model::TableDescriptor> SqliteRepository::ListTableDescriptors(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kDescriptorColumns + " FROM table_descriptors ORDER BY name;";
  Statement         st(db, sql.c_str());
  std::vector<model::TableDescriptor> out;
  while (StepRow(db, st)) out.push_back(ReadDescriptor(st.get()));
  return out;
}

Result SqliteRepository::ApplyTableSchema(Transaction& t, const model::TableDescriptor& d) {
  auto* db = TX(t).Handle();
  for (const auto& statement : d.ddl) {
    char* err = nullptr;
    int   rc  = sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
      std::string msg = err ? err : "ddl failed";
      sqlite3_free(err);
      return Result::Err(ErrorCode::InternalError, d.name + ": " + msg);
    }
  }
  return Result::Ok();
}

Result SqliteRepository::InsertTableRow(Transaction& t, const std::string& table, const model::TableRow& row) {
  if (!sql::IsSafeIdentifier(table)) return Result::Err(ErrorCode::Unsupported, "bad table name: " + table);
  auto*             db  = TX(t).Handle();
  const std::string sql = "INSERT INTO " + table + "(row_id,record_id,title,body,word_count,created_at_ms) VALUES(?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::NotFound, "no such table: " + table);
  }
  sqlite3_finalize(raw);

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, row.row_id);
  BindText(st.get(), 2, row.record_id);
  BindText(st.get(), 3, row.title);
  BindText(st.get(), 4, row.body);
  BindU64(st.get(), 5, row.word_count);
  BindU64(st.get(), 6, row.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::TableRow> SqliteRepository::GetTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  if (!sql::IsSafeIdentifier(table)) return std::nullopt;
  auto*             db  = TX(t).Handle();
  const std::string sql = "SELECT row_id,record_id,title,body,word_count,created_at_ms FROM " + table + " WHERE row_id=?;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return std::nullopt; // table not created
  }
  sqlite3_finalize(raw);

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, row_id);
  if (!StepRow(db, st)) return std::nullopt;

  model::TableRow row;
  row.row_id        = ColText(st.get(), 0);
  row.record_id     = ColText(st.get(), 1);
  row.title         = ColText(st.get(), 2);
  row.body          = ColText(st.get(), 3);
  row.word_count    = ColU64(st.get(), 4);
  row.created_at_ms = ColU64(st.get(), 5);
  return row;
}

Result SqliteRepository::DeleteTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  if (!sql::IsSafeIdentifier(table)) return Result::Err(ErrorCode::Unsupported, "bad table name: " + table);
  auto*             db  = TX(t).Handle();
  const std::string sql = "DELETE FROM " + table + " WHERE row_id=?;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Ok();
  }
  sqlite3_finalize(raw);

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, row_id);
  return Translate(db, st.Step());
}

Result SqliteRepository::BumpTableUsage(Transaction& t, const std::string& name, int64_t rows_delta, uint64_t queries_delta) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE table_descriptors SET row_count=MAX(0, row_count+?), query_count=query_count+? WHERE name=?;");
  BindI64(st.get(), 1, rows_delta);
  BindU64(st.get(), 2, queries_delta);
  BindText(st.get(), 3, name);
  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, name);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Repair, garbage, incidents, annotations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRepairTask(Transaction& t, const model::RepairTask& task) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT INTO repair_tasks(") + kRepairColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?)"
                          " ON CONFLICT(record_id) DO UPDATE SET missing_legs=excluded.missing_legs, content=excluded.content,"
                          " attempts=excluded.attempts, next_attempt_at_ms=excluded.next_attempt_at_ms, state=excluded.state,"
                          " last_error=excluded.last_error, updated_at_ms=excluded.updated_at_ms;";
  Statement st(db, sql.c_str());
  BindText(st.get(), 1, task.record_id);
  BindU64(st.get(), 2, task.missing_legs);
  BindText(st.get(), 3, task.content);
  BindU64(st.get(), 4, task.attempts);
  BindU64(st.get(), 5, task.next_attempt_at_ms);
  BindI32(st.get(), 6, static_cast<int>(task.state));
  BindText(st.get(), 7, task.last_error);
  BindU64(st.get(), 8, task.created_at_ms);
  BindU64(st.get(), 9, task.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::RepairTask> SqliteRepository::GetRepairTask(Transaction& t, const std::string& record_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kRepairColumns + " FROM repair_tasks WHERE record_id=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, record_id);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadRepair(st.get());
}

std::vector<model::RepairTask> SqliteRepository::ListRepairTasks(Transaction& t, v1::RepairState state, uint64_t due_before_ms) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRepairColumns + " FROM repair_tasks WHERE 1=1";
  if (state != v1::REPAIR_STATE_UNSPECIFIED) sql += " AND state=?";
  if (due_before_ms != 0) sql += " AND next_attempt_at_ms <= ?";
  sql += " ORDER BY record_id;";

  Statement st(db, sql.c_str());
  int       idx = 1;
  if (state != v1::REPAIR_STATE_UNSPECIFIED) BindI32(st.get(), idx++, static_cast<int>(state));
  if (due_before_ms != 0) BindU64(st.get(), idx++, due_before_ms);

  std::vector<model::RepairTask> out;
  while (StepRow(db, st)) out.push_back(ReadRepair(st.get()));
  return out;
}

Result SqliteRepository::DeleteRepairTask(Transaction& t, const std::string& record_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM repair_tasks WHERE record_id=?;");
  BindText(st.get(), 1, record_id);
  return Translate(db, st.Step());
}

Result SqliteRepository::InsertGarbage(Transaction& t, const model::GarbageEntry& g) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO garbage_entries(id,record_id,leg,ref,collection,eligible_at_ms,created_at_ms)"
               " VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, g.id);
  BindText(st.get(), 2, g.record_id);
  BindU64(st.get(), 3, g.leg);
  BindText(st.get(), 4, g.ref);
  BindText(st.get(), 5, g.collection);
  BindU64(st.get(), 6, g.eligible_at_ms);
  BindU64(st.get(), 7, g.created_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::GarbageEntry> SqliteRepository::ListGarbage(Transaction& t, uint64_t eligible_before_ms) {
  auto*       db  = TX(t).Handle();
  std::string sql = "SELECT id,record_id,leg,ref,collection,eligible_at_ms,created_at_ms FROM garbage_entries";
  if (eligible_before_ms != 0) sql += " WHERE eligible_at_ms <= ?";
  sql += " ORDER BY id;";

  Statement st(db, sql.c_str());
  if (eligible_before_ms != 0) BindU64(st.get(), 1, eligible_before_ms);

  std::vector<model::GarbageEntry> out;
  while (StepRow(db, st)) {
    model::GarbageEntry g;
    g.id             = ColText(st.get(), 0);
    g.record_id      = ColText(st.get(), 1);
    g.leg            = static_cast<unsigned>(ColI32(st.get(), 2));
    g.ref            = ColText(st.get(), 3);
    g.collection     = ColText(st.get(), 4);
    g.eligible_at_ms = ColU64(st.get(), 5);
    g.created_at_ms  = ColU64(st.get(), 6);
    out.push_back(std::move(g));
  }
  return out;
}

Result SqliteRepository::DeleteGarbage(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM garbage_entries WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, st.Step());
}

Result SqliteRepository::InsertIncident(Transaction& t, const model::Incident& incident) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO incidents(id,record_id,kind,detail,created_at_ms) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, incident.id);
  BindText(st.get(), 2, incident.record_id);
  BindText(st.get(), 3, incident.kind);
  BindText(st.get(), 4, incident.detail);
  BindU64(st.get(), 5, incident.created_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::Incident> SqliteRepository::ListIncidents(Transaction& t, std::size_t limit) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,record_id,kind,detail,created_at_ms FROM incidents ORDER BY created_at_ms DESC, rowid DESC LIMIT ?;");
  BindI64(st.get(), 1, limit == 0 ? -1 : static_cast<int64_t>(limit));

  std::vector<model::Incident> out;
  while (StepRow(db, st)) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColText(st.get(), 3), ColU64(st.get(), 4)});
  }
  return out;
}

Result SqliteRepository::UpsertAnnotation(Transaction& t, const model::Annotation& a) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO annotations(record_id,agent,json,updated_at_ms) VALUES(?,?,?,?)"
               " ON CONFLICT(record_id,agent) DO UPDATE SET json=excluded.json, updated_at_ms=excluded.updated_at_ms;");
  BindText(st.get(), 1, a.record_id);
  BindText(st.get(), 2, a.agent);
  BindText(st.get(), 3, a.json);
  BindU64(st.get(), 4, a.updated_at_ms);
  auto res = Translate(db, st.Step());
  // foreign key failure means the record does not exist
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::NotFound, a.record_id);
  return res;
}

std::vector<model::Annotation> SqliteRepository::ListAnnotations(Transaction& t, const std::string& record_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT record_id,agent,json,updated_at_ms FROM annotations WHERE record_id=? ORDER BY agent;");
  BindText(st.get(), 1, record_id);

  std::vector<model::Annotation> out;
  while (StepRow(db, st)) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColU64(st.get(), 3)});
  }
  return out;
}

// ------------------------------------------------------------------
// Samples
// ------------------------------------------------------------------

Result SqliteRepository::InsertSamples(Transaction& t, const std::vector<model::PerformanceSample>& samples) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO performance_samples(signature,mode,domain,strategy,latency_ms,rows,partial,created_at_ms)"
               " VALUES(?,?,?,?,?,?,?,?);");
  for (const auto& s : samples) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, s.signature);
    BindI32(st.get(), 2, static_cast<int>(s.mode));
    BindText(st.get(), 3, s.domain);
    BindI32(st.get(), 4, static_cast<int>(s.strategy));
    BindDouble(st.get(), 5, s.latency_ms);
    BindU64(st.get(), 6, s.rows);
    BindI32(st.get(), 7, s.partial ? 1 : 0);
    BindU64(st.get(), 8, s.created_at_ms);
    auto res = Translate(db, st.Step());
    if (!res) return res;
  }
  return Result::Ok();
}

std::vector<model::PerformanceSample> SqliteRepository::ListSamples(Transaction& t, uint64_t since_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT signature,mode,domain,strategy,latency_ms,rows,partial,created_at_ms FROM performance_samples"
               " WHERE created_at_ms >= ? ORDER BY seq;");
  BindU64(st.get(), 1, since_ms);

  std::vector<model::PerformanceSample> out;
  while (StepRow(db, st)) {
    model::PerformanceSample s;
    s.signature     = ColText(st.get(), 0);
    s.mode          = static_cast<v1::QueryMode>(ColI32(st.get(), 1));
    s.domain        = ColText(st.get(), 2);
    s.strategy      = static_cast<v1::Strategy>(ColI32(st.get(), 3));
    s.latency_ms    = ColDouble(st.get(), 4);
    s.rows          = ColU64(st.get(), 5);
    s.partial       = ColI32(st.get(), 6) != 0;
    s.created_at_ms = ColU64(st.get(), 7);
    out.push_back(std::move(s));
  }
  return out;
}

Result SqliteRepository::DeleteSamplesBefore(Transaction& t, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM performance_samples WHERE created_at_ms < ?;");
  BindU64(st.get(), 1, cutoff_ms);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Recommendations
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("INSERT INTO recommendations(") + kRecommendationColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, r.id);
  BindI32(st.get(), 2, static_cast<int>(r.type));
  BindText(st.get(), 3, r.target);
  BindText(st.get(), 4, r.description);
  BindI32(st.get(), 5, static_cast<int>(r.from_strategy));
  BindI32(st.get(), 6, static_cast<int>(r.to_strategy));
  BindDouble(st.get(), 7, r.estimated_improvement_pct);
  BindDouble(st.get(), 8, r.confidence);
  BindI32(st.get(), 9, static_cast<int>(r.status));
  BindText(st.get(), 10, r.detail);
  BindU64(st.get(), 11, r.created_at_ms);
  BindU64(st.get(), 12, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::RecommendationRecord> SqliteRepository::GetRecommendation(Transaction& t, const std::string& id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kRecommendationColumns + " FROM recommendations WHERE id=?;";
  Statement         st(db, sql.c_str());
  BindText(st.get(), 1, id);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadRecommendation(st.get());
}

std::vector<model::RecommendationRecord> SqliteRepository::ListRecommendations(Transaction& t, v1::RecommendationStatus status) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRecommendationColumns + " FROM recommendations";
  if (status != v1::RECOMMENDATION_STATUS_UNSPECIFIED) sql += " WHERE status=?";
  sql += " ORDER BY created_at_ms, id;";

  Statement st(db, sql.c_str());
  if (status != v1::RECOMMENDATION_STATUS_UNSPECIFIED) BindI32(st.get(), 1, static_cast<int>(status));

  std::vector<model::RecommendationRecord> out;
  while (StepRow(db, st)) out.push_back(ReadRecommendation(st.get()));
  return out;
}

Result SqliteRepository::UpdateRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE recommendations SET status=?, detail=?, confidence=?, updated_at_ms=? WHERE id=?;");
  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindText(st.get(), 2, r.detail);
  BindDouble(st.get(), 3, r.confidence);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.id);
  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteRecommendationsBefore(Transaction& t, v1::RecommendationStatus status, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM recommendations WHERE status=? AND updated_at_ms < ?;");
  BindI32(st.get(), 1, static_cast<int>(status));
  BindU64(st.get(), 2, cutoff_ms);
  return Translate(db, st.Step());
}

std::optional<model::RecommendationRecord> SqliteRepository::FindPendingRecommendation(Transaction& t, v1::RecommendationType type,
                                                                                       const std::string& target) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kRecommendationColumns + " FROM recommendations WHERE type=? AND target=? AND status=?;";
  Statement         st(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(type));
  BindText(st.get(), 2, target);
  BindI32(st.get(), 3, v1::RECOMMENDATION_STATUS_PENDING);
  if (!StepRow(db, st)) return std::nullopt;
  return ReadRecommendation(st.get());
}

} // namespace strata::db::sqlite
