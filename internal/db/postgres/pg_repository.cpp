#include "pg_repository.hpp"

#include "internal/db/sql/codec.hpp"
#include "internal/db/sql/migrations.hpp"

namespace strata::db::postgres {

namespace v1 = strata::engine::v1;

namespace {

constexpr const char* kRecordColumns =
    "id,source_locator,title,author,domain,content_type,declared_size,text_size,content_hash,"
    "semantic_complexity,topic_coherence,information_density,query_potential,"
    "strategy,policy_version,confidence,reasoning::text,status,needs_review,"
    "blob_hash,vector_batch_id,vector_collection,chunk_count,table_name,table_row_id,"
    "preview,metadata_json,tags::text,query_count,last_queried_at_ms,access_frequency,"
    "scrape_count,version,created_at_ms,updated_at_ms";

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : f.as<std::string>();
}

model::ContentRecord ReadRecord(const pqxx::row& row) {
  model::ContentRecord r;
  int                  c = 0;
  r.id                   = Text(row[c++]);
  r.source_locator       = Text(row[c++]);
  r.title                = Text(row[c++]);
  r.author               = Text(row[c++]);
  r.domain               = Text(row[c++]);
  r.content_type         = Text(row[c++]);
  r.declared_size        = row[c++].as<uint64_t>();
  r.text_size            = row[c++].as<uint64_t>();
  r.content_hash         = Text(row[c++]);
  r.semantic_complexity  = row[c++].as<double>();
  r.topic_coherence      = row[c++].as<double>();
  r.information_density  = row[c++].as<double>();
  r.query_potential      = row[c++].as<double>();
  r.strategy             = static_cast<v1::Strategy>(row[c++].as<int>());
  r.policy_version       = row[c++].as<uint32_t>();
  r.confidence           = row[c++].as<double>();
  r.reasoning            = sql::DecodeStringList(Text(row[c++]));
  r.status               = static_cast<v1::RecordStatus>(row[c++].as<int>());
  r.needs_review         = row[c++].as<bool>();
  r.blob_hash            = Text(row[c++]);
  r.vector_batch_id      = Text(row[c++]);
  r.vector_collection    = Text(row[c++]);
  r.chunk_count          = row[c++].as<uint32_t>();
  r.table_name           = Text(row[c++]);
  r.table_row_id         = Text(row[c++]);
  r.preview              = Text(row[c++]);
  r.metadata_json        = Text(row[c++]);
  r.tags                 = sql::DecodeStringList(Text(row[c++]));
  r.query_count          = row[c++].as<uint64_t>();
  r.last_queried_at_ms   = row[c++].as<uint64_t>();
  r.access_frequency     = row[c++].as<double>();
  r.scrape_count         = row[c++].as<uint64_t>();
  r.version              = row[c++].as<uint64_t>();
  r.created_at_ms        = row[c++].as<uint64_t>();
  r.updated_at_ms        = row[c++].as<uint64_t>();
  return r;
}

std::string BuildWhere(pqxx::work& w, const model::RecordFilter& f) {
  std::string sql;
  auto        add = [&sql](const std::string& condition) {
    sql += sql.empty() ? " WHERE " : " AND ";
    sql += condition;
  };
  if (!f.domain.empty()) add("domain = " + w.quote(f.domain));
  if (!f.content_type.empty()) add("content_type = " + w.quote(f.content_type));
  if (f.created_after_ms != 0) add("created_at_ms >= " + std::to_string(f.created_after_ms));
  if (f.created_before_ms != 0) add("created_at_ms < " + std::to_string(f.created_before_ms));
  if (f.strategy != v1::STRATEGY_UNSPECIFIED) add("strategy = " + std::to_string(static_cast<int>(f.strategy)));
  if (f.status != v1::RECORD_STATUS_UNSPECIFIED) add("status = " + std::to_string(static_cast<int>(f.status)));
  if (f.policy_version_below != 0) add("policy_version < " + std::to_string(f.policy_version_below));
  if (!f.table_name.empty()) add("table_name = " + w.quote(f.table_name));
  if (f.needs_review_only) add("needs_review");
  return sql;
}

model::StagedBatch ReadBatch(const pqxx::row& row) {
  model::StagedBatch b;
  b.batch_id        = Text(row[0]);
  b.record_id       = Text(row[1]);
  b.collection      = Text(row[2]);
  b.expected_chunks = row[3].as<uint32_t>();
  b.state           = static_cast<v1::BatchState>(row[4].as<int>());
  b.created_at_ms   = row[5].as<uint64_t>();
  b.completed_at_ms = row[6].as<uint64_t>();
  return b;
}

constexpr const char* kDescriptorColumns =
    "name,version,domain,content_type,columns_json::text,indexes_json::text,ddl_json::text,state,row_count,query_count,"
    "created_at_ms,updated_at_ms";

model::TableDescriptor ReadDescriptor(const pqxx::row& row) {
  model::TableDescriptor d;
  d.name          = Text(row[0]);
  d.version       = row[1].as<uint32_t>();
  d.domain        = Text(row[2]);
  d.content_type  = Text(row[3]);
  d.columns       = sql::DecodeColumns(Text(row[4]));
  d.indexes       = sql::DecodeIndexes(Text(row[5]));
  d.ddl           = sql::DecodeStringList(Text(row[6]));
  d.state         = static_cast<model::DescriptorState>(row[7].as<int>());
  d.row_count     = row[8].as<uint64_t>();
  d.query_count   = row[9].as<uint64_t>();
  d.created_at_ms = row[10].as<uint64_t>();
  d.updated_at_ms = row[11].as<uint64_t>();
  return d;
}

constexpr const char* kRepairColumns =
    "record_id,missing_legs,content,attempts,next_attempt_at_ms,state,last_error,created_at_ms,updated_at_ms";

model::RepairTask ReadRepair(const pqxx::row& row) {
  model::RepairTask t;
  t.record_id          = Text(row[0]);
  t.missing_legs       = row[1].as<unsigned>();
  t.content            = Text(row[2]);
  t.attempts           = row[3].as<uint32_t>();
  t.next_attempt_at_ms = row[4].as<uint64_t>();
  t.state              = static_cast<v1::RepairState>(row[5].as<int>());
  t.last_error         = Text(row[6]);
  t.created_at_ms      = row[7].as<uint64_t>();
  t.updated_at_ms      = row[8].as<uint64_t>();
  return t;
}

constexpr const char* kRecommendationColumns =
    "id,type,target,description,from_strategy,to_strategy,estimated_improvement_pct,confidence,status,detail,created_at_ms,updated_at_ms";

model::RecommendationRecord ReadRecommendation(const pqxx::row& row) {
  model::RecommendationRecord r;
  r.id                        = Text(row[0]);
  r.type                      = static_cast<v1::RecommendationType>(row[1].as<int>());
  r.target                    = Text(row[2]);
  r.description               = Text(row[3]);
  r.from_strategy             = static_cast<v1::Strategy>(row[4].as<int>());
  r.to_strategy               = static_cast<v1::Strategy>(row[5].as<int>());
  r.estimated_improvement_pct = row[6].as<double>();
  r.confidence                = row[7].as<double>();
  r.status                    = static_cast<v1::RecommendationStatus>(row[8].as<int>());
  r.detail                    = Text(row[9]);
  r.created_at_ms             = row[10].as<uint64_t>();
  r.updated_at_ms             = row[11].as<uint64_t>();
  return r;
}

bool TableExists(pqxx::work& w, const std::string& table) {
  auto res = w.exec_params("SELECT to_regclass($1) IS NOT NULL;", table);
  return !res.empty() && res[0][0].as<bool>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Bootstrap() {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  sql::RunMigrations([&tx](const std::string& statement) { tx.exec(statement); }, sql::CoreSchema(sql::Dialect::kPostgres));
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Content records
// ------------------------------------------------------------------

// Conflicts use ON CONFLICT DO NOTHING so the transaction stays usable
// after a duplicate; a failed statement would abort it.
Result PgRepository::InsertRecord(Transaction& t, const model::ContentRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO content_records(id,source_locator,title,author,domain,content_type,declared_size,text_size,content_hash,"
        "semantic_complexity,topic_coherence,information_density,query_potential,strategy,policy_version,confidence,reasoning,"
        "status,needs_review,blob_hash,vector_batch_id,vector_collection,chunk_count,table_name,table_row_id,preview,"
        "metadata_json,tags,query_count,last_queried_at_ms,access_frequency,scrape_count,version,created_at_ms,updated_at_ms)"
        " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17::jsonb,$18,$19,$20,$21,$22,$23,$24,$25,$26,$27,"
        "$28::jsonb,$29,$30,$31,$32,$33,$34,$35) ON CONFLICT DO NOTHING;",
        r.id, r.source_locator, r.title, r.author, r.domain, r.content_type, r.declared_size, r.text_size, r.content_hash,
        r.semantic_complexity, r.topic_coherence, r.information_density, r.query_potential, static_cast<int>(r.strategy),
        r.policy_version, r.confidence, sql::EncodeStringList(r.reasoning), static_cast<int>(r.status), r.needs_review, r.blob_hash,
        r.vector_batch_id, r.vector_collection, r.chunk_count, r.table_name, r.table_row_id, r.preview, r.metadata_json,
        sql::EncodeStringList(r.tags), r.query_count, r.last_queried_at_ms, r.access_frequency, r.scrape_count, r.version,
        r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "record id or source_locator exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ContentRecord> PgRepository::GetRecord(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_record", id);
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

std::optional<model::ContentRecord> PgRepository::GetRecordByLocator(Transaction& t, const std::string& source_locator) {
  auto res = TX(t).Work().exec_prepared("get_record_by_locator", source_locator);
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

std::vector<model::ContentRecord> PgRepository::ListRecords(Transaction& t, const model::RecordFilter& filter) {
  auto& w   = TX(t).Work();
  auto  res = w.exec(std::string("SELECT ") + kRecordColumns + " FROM content_records" + BuildWhere(w, filter) + " ORDER BY id;");

  std::vector<model::ContentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRecord(row));
  return out;
}

uint64_t PgRepository::CountRecords(Transaction& t, const model::RecordFilter& filter) {
  auto& w   = TX(t).Work();
  auto  res = w.exec("SELECT COUNT(*) FROM content_records" + BuildWhere(w, filter) + ";");
  return res[0][0].as<uint64_t>();
}

Result PgRepository::UpdateRecord(Transaction& t, const model::ContentRecord& r, uint64_t expected_version) {
  try {
    auto& w = TX(t).Work();
    if (auto other = GetRecordByLocator(t, r.source_locator); other && other->id != r.id) {
      return Result::Err(ErrorCode::AlreadyExists, "source_locator exists");
    }
    auto res = w.exec_params(
        "UPDATE content_records SET source_locator=$1,title=$2,author=$3,domain=$4,content_type=$5,declared_size=$6,"
        "text_size=$7,content_hash=$8,semantic_complexity=$9,topic_coherence=$10,information_density=$11,query_potential=$12,"
        "strategy=$13,policy_version=$14,confidence=$15,reasoning=$16::jsonb,status=$17,needs_review=$18,blob_hash=$19,"
        "vector_batch_id=$20,vector_collection=$21,chunk_count=$22,table_name=$23,table_row_id=$24,preview=$25,"
        "metadata_json=$26,tags=$27::jsonb,query_count=$28,last_queried_at_ms=$29,access_frequency=$30,scrape_count=$31,"
        "version=$32,created_at_ms=$33,updated_at_ms=$34 WHERE id=$35 AND version=$36;",
        r.source_locator, r.title, r.author, r.domain, r.content_type, r.declared_size, r.text_size, r.content_hash,
        r.semantic_complexity, r.topic_coherence, r.information_density, r.query_potential, static_cast<int>(r.strategy),
        r.policy_version, r.confidence, sql::EncodeStringList(r.reasoning), static_cast<int>(r.status), r.needs_review, r.blob_hash,
        r.vector_batch_id, r.vector_collection, r.chunk_count, r.table_name, r.table_row_id, r.preview, r.metadata_json,
        sql::EncodeStringList(r.tags), r.query_count, r.last_queried_at_ms, r.access_frequency, r.scrape_count, r.version,
        r.created_at_ms, r.updated_at_ms, r.id, expected_version);
    if (res.affected_rows() == 1) return Result::Ok();
    if (!GetRecord(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Err(ErrorCode::Conflict, "version mismatch");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::MergeAccessStats(Transaction& t, const std::string& id, uint64_t query_delta, uint64_t last_queried_at_ms,
                                      double access_frequency) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE content_records SET query_count=query_count+$2, last_queried_at_ms=GREATEST(last_queried_at_ms, $3),"
        " access_frequency=$4 WHERE id=$1;",
        id, query_delta, last_queried_at_ms, access_frequency);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TextHit> PgRepository::SearchText(Transaction& t, const std::string& query, const model::RecordFilter& filter,
                                                     std::size_t limit) {
  if (query.empty() || limit == 0) return {};
  auto&       w     = TX(t).Work();
  std::string where = BuildWhere(w, filter);
  if (!where.empty()) where = " AND " + where.substr(7);

  auto res = w.exec_params("SELECT id, ts_rank_cd(search_vector, q) AS score"
                           " FROM content_records, plainto_tsquery('english', $1) q"
                           " WHERE search_vector @@ q" +
                               where + " ORDER BY score DESC, id ASC LIMIT $2;",
                           query, static_cast<int64_t>(limit));

  std::vector<model::TextHit> hits;
  hits.reserve(res.size());
  for (const auto& row : res) hits.push_back({Text(row[0]), row[1].as<double>()});
  return hits;
}

// ------------------------------------------------------------------
// Blobs
// ------------------------------------------------------------------

Result PgRepository::InsertBlob(Transaction& t, const model::BlobRecord& b) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO content_blobs(owner_record_id,content_hash,body,size_bytes,chunks_json,created_at_ms)"
        " VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(owner_record_id,content_hash) DO NOTHING;",
        b.owner_record_id, b.content_hash, b.body, b.size_bytes, b.chunks_json, b.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BlobRecord> PgRepository::GetBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  auto res = TX(t).Work().exec_prepared("get_blob", owner_record_id, content_hash);
  if (res.empty()) return std::nullopt;

  model::BlobRecord b;
  b.owner_record_id = Text(res[0][0]);
  b.content_hash    = Text(res[0][1]);
  b.body            = Text(res[0][2]);
  b.size_bytes      = res[0][3].as<uint64_t>();
  b.chunks_json     = Text(res[0][4]);
  b.created_at_ms   = res[0][5].as<uint64_t>();
  return b;
}

uint64_t PgRepository::CountBlobs(Transaction& t, const std::string& owner_record_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM content_blobs WHERE owner_record_id=$1;", owner_record_id);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  try {
    TX(t).Work().exec_params("DELETE FROM content_blobs WHERE owner_record_id=$1 AND content_hash=$2;", owner_record_id, content_hash);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::DeleteOrphanBlobs(Transaction& t, uint64_t cutoff_ms) {
  auto res = TX(t).Work().exec_params(
      "DELETE FROM content_blobs b WHERE b.created_at_ms < $1"
      " AND NOT EXISTS (SELECT 1 FROM content_records c WHERE c.id = b.owner_record_id);",
      cutoff_ms);
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Batches + mappings
// ------------------------------------------------------------------

Result PgRepository::InsertBatch(Transaction& t, const model::StagedBatch& b) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO staged_batches(batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms)"
        " VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT DO NOTHING;",
        b.batch_id, b.record_id, b.collection, b.expected_chunks, static_cast<int>(b.state), b.created_at_ms, b.completed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, b.batch_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StagedBatch> PgRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms FROM staged_batches WHERE batch_id=$1;",
      batch_id);
  if (res.empty()) return std::nullopt;
  return ReadBatch(res[0]);
}

Result PgRepository::CompleteBatch(Transaction& t, const std::string& batch_id, uint64_t completed_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("complete_batch", batch_id, static_cast<int>(v1::BATCH_STATE_COMPLETE), completed_at_ms,
                                          static_cast<int>(v1::BATCH_STATE_PENDING));
    if (res.affected_rows() == 1) return Result::Ok();
    if (!GetBatch(t, batch_id)) return Result::Err(ErrorCode::NotFound, batch_id);
    return Result::Err(ErrorCode::Conflict, "batch not pending");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StagedBatch> PgRepository::ListPendingBatches(Transaction& t, uint64_t created_before_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT batch_id,record_id,collection,expected_chunks,state,created_at_ms,completed_at_ms FROM staged_batches"
      " WHERE state=$1 AND created_at_ms < $2 ORDER BY batch_id;",
      static_cast<int>(v1::BATCH_STATE_PENDING), created_before_ms);
  std::vector<model::StagedBatch> out;
  for (const auto& row : res) out.push_back(ReadBatch(row));
  return out;
}

Result PgRepository::DeleteBatch(Transaction& t, const std::string& batch_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM staged_batches WHERE batch_id=$1;", batch_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertVectorMappings(Transaction& t, const std::vector<model::VectorMapping>& mappings) {
  try {
    auto& w = TX(t).Work();
    for (const auto& m : mappings) {
      if (!GetBatch(t, m.batch_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown batch " + m.batch_id);
      w.exec_params(
          "INSERT INTO vector_mappings(batch_id,chunk_sequence,point_id,record_id,collection,dimension,model)"
          " VALUES($1,$2,$3,$4,$5,$6,$7);",
          m.batch_id, m.chunk_sequence, m.point_id, m.record_id, m.collection, m.dimension, m.model);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::VectorMapping> PgRepository::ListVectorMappings(Transaction& t, const std::string& batch_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT batch_id,chunk_sequence,point_id,record_id,collection,dimension,model FROM vector_mappings"
      " WHERE batch_id=$1 ORDER BY chunk_sequence;",
      batch_id);
  std::vector<model::VectorMapping> out;
  for (const auto& row : res) {
    model::VectorMapping m;
    m.batch_id       = Text(row[0]);
    m.chunk_sequence = row[1].as<uint32_t>();
    m.point_id       = Text(row[2]);
    m.record_id      = Text(row[3]);
    m.collection     = Text(row[4]);
    m.dimension      = row[5].as<uint32_t>();
    m.model          = Text(row[6]);
    out.push_back(std::move(m));
  }
  return out;
}

// ------------------------------------------------------------------
// Dynamic tables
// ------------------------------------------------------------------

Result PgRepository::UpsertTableDescriptor(Transaction& t, const model::TableDescriptor& d) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO table_descriptors(name,version,domain,content_type,columns_json,indexes_json,ddl_json,state,row_count,"
        "query_count,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5::jsonb,$6::jsonb,$7::jsonb,$8,$9,$10,$11,$12)"
        " ON CONFLICT(name) DO UPDATE SET version=EXCLUDED.version, domain=EXCLUDED.domain, content_type=EXCLUDED.content_type,"
        " columns_json=EXCLUDED.columns_json, indexes_json=EXCLUDED.indexes_json, ddl_json=EXCLUDED.ddl_json,"
        " state=EXCLUDED.state, row_count=EXCLUDED.row_count, query_count=EXCLUDED.query_count,"
        " updated_at_ms=EXCLUDED.updated_at_ms;",
        d.name, d.version, d.domain, d.content_type, sql::EncodeColumns(d.columns), sql::EncodeIndexes(d.indexes),
        sql::EncodeStringList(d.ddl), static_cast<int>(d.state), d.row_count, d.query_count, d.created_at_ms, d.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TableDescriptor> PgRepository::GetTableDescriptor(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDescriptorColumns + " FROM table_descriptors WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;
  return ReadDescriptor(res[0]);
}

std::vector<model::TableDescriptor> PgRepository::ListTableDescriptors(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kDescriptorColumns + " FROM table_descriptors ORDER BY name;");
  std::vector<model::TableDescriptor> out;
  for (const auto& row : res) out.push_back(ReadDescriptor(row));
  return out;
}

Result PgRepository::ApplyTableSchema(Transaction& t, const model::TableDescriptor& d) {
  try {
    auto& w = TX(t).Work();
    for (const auto& statement : d.ddl) w.exec(statement);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertTableRow(Transaction& t, const std::string& table, const model::TableRow& row) {
  if (!sql::IsSafeIdentifier(table)) return Result::Err(ErrorCode::Unsupported, "bad table name: " + table);
  try {
    auto& w = TX(t).Work();
    if (!TableExists(w, table)) return Result::Err(ErrorCode::NotFound, "no such table: " + table);
    auto res = w.exec_params("INSERT INTO " + table +
                                 "(row_id,record_id,title,body,word_count,created_at_ms) VALUES($1,$2,$3,$4,$5,$6)"
                                 " ON CONFLICT DO NOTHING;",
                             row.row_id, row.record_id, row.title, row.body, row.word_count, row.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, row.row_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TableRow> PgRepository::GetTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  if (!sql::IsSafeIdentifier(table)) return std::nullopt;
  auto& w = TX(t).Work();
  if (!TableExists(w, table)) return std::nullopt;
  auto res = w.exec_params("SELECT row_id,record_id,title,body,word_count,created_at_ms FROM " + table + " WHERE row_id=$1;", row_id);
  if (res.empty()) return std::nullopt;

  model::TableRow out;
  out.row_id        = Text(res[0][0]);
  out.record_id     = Text(res[0][1]);
  out.title         = Text(res[0][2]);
  out.body          = Text(res[0][3]);
  out.word_count    = res[0][4].as<uint64_t>();
  out.created_at_ms = res[0][5].as<uint64_t>();
  return out;
}

Result PgRepository::DeleteTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  if (!sql::IsSafeIdentifier(table)) return Result::Err(ErrorCode::Unsupported, "bad table name: " + table);
  try {
    auto& w = TX(t).Work();
    if (!TableExists(w, table)) return Result::Ok();
    w.exec_params("DELETE FROM " + table + " WHERE row_id=$1;", row_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::BumpTableUsage(Transaction& t, const std::string& name, int64_t rows_delta, uint64_t queries_delta) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE table_descriptors SET row_count=GREATEST(0, row_count+$2), query_count=query_count+$3 WHERE name=$1;", name,
        rows_delta, queries_delta);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Repair, garbage, incidents, annotations
// ------------------------------------------------------------------

Result PgRepository::UpsertRepairTask(Transaction& t, const model::RepairTask& task) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO repair_tasks(record_id,missing_legs,content,attempts,next_attempt_at_ms,state,last_error,created_at_ms,"
        "updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)"
        " ON CONFLICT(record_id) DO UPDATE SET missing_legs=EXCLUDED.missing_legs, content=EXCLUDED.content,"
        " attempts=EXCLUDED.attempts, next_attempt_at_ms=EXCLUDED.next_attempt_at_ms, state=EXCLUDED.state,"
        " last_error=EXCLUDED.last_error, updated_at_ms=EXCLUDED.updated_at_ms;",
        task.record_id, task.missing_legs, task.content, task.attempts, task.next_attempt_at_ms, static_cast<int>(task.state),
        task.last_error, task.created_at_ms, task.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RepairTask> PgRepository::GetRepairTask(Transaction& t, const std::string& record_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRepairColumns + " FROM repair_tasks WHERE record_id=$1;", record_id);
  if (res.empty()) return std::nullopt;
  return ReadRepair(res[0]);
}

std::vector<model::RepairTask> PgRepository::ListRepairTasks(Transaction& t, v1::RepairState state, uint64_t due_before_ms) {
  std::string sql = std::string("SELECT ") + kRepairColumns + " FROM repair_tasks WHERE 1=1";
  if (state != v1::REPAIR_STATE_UNSPECIFIED) sql += " AND state=" + std::to_string(static_cast<int>(state));
  if (due_before_ms != 0) sql += " AND next_attempt_at_ms <= " + std::to_string(due_before_ms);
  sql += " ORDER BY record_id;";

  auto                           res = TX(t).Work().exec(sql);
  std::vector<model::RepairTask> out;
  for (const auto& row : res) out.push_back(ReadRepair(row));
  return out;
}

Result PgRepository::DeleteRepairTask(Transaction& t, const std::string& record_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM repair_tasks WHERE record_id=$1;", record_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertGarbage(Transaction& t, const model::GarbageEntry& g) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO garbage_entries(id,record_id,leg,ref,collection,eligible_at_ms,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7)"
        " ON CONFLICT DO NOTHING;",
        g.id, g.record_id, g.leg, g.ref, g.collection, g.eligible_at_ms, g.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, g.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GarbageEntry> PgRepository::ListGarbage(Transaction& t, uint64_t eligible_before_ms) {
  std::string sql = "SELECT id,record_id,leg,ref,collection,eligible_at_ms,created_at_ms FROM garbage_entries";
  if (eligible_before_ms != 0) sql += " WHERE eligible_at_ms <= " + std::to_string(eligible_before_ms);
  sql += " ORDER BY id;";

  auto                             res = TX(t).Work().exec(sql);
  std::vector<model::GarbageEntry> out;
  for (const auto& row : res) {
    model::GarbageEntry g;
    g.id             = Text(row[0]);
    g.record_id      = Text(row[1]);
    g.leg            = row[2].as<unsigned>();
    g.ref            = Text(row[3]);
    g.collection     = Text(row[4]);
    g.eligible_at_ms = row[5].as<uint64_t>();
    g.created_at_ms  = row[6].as<uint64_t>();
    out.push_back(std::move(g));
  }
  return out;
}

Result PgRepository::DeleteGarbage(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM garbage_entries WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertIncident(Transaction& t, const model::Incident& incident) {
  try {
    TX(t).Work().exec_params("INSERT INTO incidents(id,record_id,kind,detail,created_at_ms) VALUES($1,$2,$3,$4,$5);", incident.id,
                             incident.record_id, incident.kind, incident.detail, incident.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Incident> PgRepository::ListIncidents(Transaction& t, std::size_t limit) {
  std::string sql = "SELECT id,record_id,kind,detail,created_at_ms FROM incidents ORDER BY created_at_ms DESC, id DESC";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);

  auto                         res = TX(t).Work().exec(sql);
  std::vector<model::Incident> out;
  for (const auto& row : res) {
    out.push_back({Text(row[0]), Text(row[1]), Text(row[2]), Text(row[3]), row[4].as<uint64_t>()});
  }
  return out;
}

Result PgRepository::UpsertAnnotation(Transaction& t, const model::Annotation& a) {
  try {
    if (!GetRecord(t, a.record_id)) return Result::Err(ErrorCode::NotFound, a.record_id);
    TX(t).Work().exec_params(
        "INSERT INTO annotations(record_id,agent,json,updated_at_ms) VALUES($1,$2,$3::jsonb,$4)"
        " ON CONFLICT(record_id,agent) DO UPDATE SET json=EXCLUDED.json, updated_at_ms=EXCLUDED.updated_at_ms;",
        a.record_id, a.agent, a.json, a.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Annotation> PgRepository::ListAnnotations(Transaction& t, const std::string& record_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT record_id,agent,json::text,updated_at_ms FROM annotations WHERE record_id=$1 ORDER BY agent;", record_id);
  std::vector<model::Annotation> out;
  for (const auto& row : res) out.push_back({Text(row[0]), Text(row[1]), Text(row[2]), row[3].as<uint64_t>()});
  return out;
}

// ------------------------------------------------------------------
// Samples
// ------------------------------------------------------------------

Result PgRepository::InsertSamples(Transaction& t, const std::vector<model::PerformanceSample>& samples) {
  try {
    auto& w = TX(t).Work();
    for (const auto& s : samples) {
      w.exec_params(
          "INSERT INTO performance_samples(signature,mode,domain,strategy,latency_ms,rows,partial,created_at_ms)"
          " VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
          s.signature, static_cast<int>(s.mode), s.domain, static_cast<int>(s.strategy), s.latency_ms, s.rows, s.partial,
          s.created_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PerformanceSample> PgRepository::ListSamples(Transaction& t, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT signature,mode,domain,strategy,latency_ms,rows,partial,created_at_ms FROM performance_samples"
      " WHERE created_at_ms >= $1 ORDER BY seq;",
      since_ms);
  std::vector<model::PerformanceSample> out;
  for (const auto& row : res) {
    model::PerformanceSample s;
    s.signature     = Text(row[0]);
    s.mode          = static_cast<v1::QueryMode>(row[1].as<int>());
    s.domain        = Text(row[2]);
    s.strategy      = static_cast<v1::Strategy>(row[3].as<int>());
    s.latency_ms    = row[4].as<double>();
    s.rows          = row[5].as<uint64_t>();
    s.partial       = row[6].as<bool>();
    s.created_at_ms = row[7].as<uint64_t>();
    out.push_back(std::move(s));
  }
  return out;
}

Result PgRepository::DeleteSamplesBefore(Transaction& t, uint64_t cutoff_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM performance_samples WHERE created_at_ms < $1;", cutoff_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Recommendations
// ------------------------------------------------------------------

Result PgRepository::InsertRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO recommendations(id,type,target,description,from_strategy,to_strategy,estimated_improvement_pct,confidence,"
        "status,detail,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) ON CONFLICT DO NOTHING;",
        r.id, static_cast<int>(r.type), r.target, r.description, static_cast<int>(r.from_strategy), static_cast<int>(r.to_strategy),
        r.estimated_improvement_pct, r.confidence, static_cast<int>(r.status), r.detail, r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RecommendationRecord> PgRepository::GetRecommendation(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRecommendationColumns + " FROM recommendations WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadRecommendation(res[0]);
}

std::vector<model::RecommendationRecord> PgRepository::ListRecommendations(Transaction& t, v1::RecommendationStatus status) {
  std::string sql = std::string("SELECT ") + kRecommendationColumns + " FROM recommendations";
  if (status != v1::RECOMMENDATION_STATUS_UNSPECIFIED) sql += " WHERE status=" + std::to_string(static_cast<int>(status));
  sql += " ORDER BY created_at_ms, id;";

  auto                                     res = TX(t).Work().exec(sql);
  std::vector<model::RecommendationRecord> out;
  for (const auto& row : res) out.push_back(ReadRecommendation(row));
  return out;
}

Result PgRepository::UpdateRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE recommendations SET status=$2, detail=$3, confidence=$4, updated_at_ms=$5 WHERE id=$1;", r.id,
        static_cast<int>(r.status), r.detail, r.confidence, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRecommendationsBefore(Transaction& t, v1::RecommendationStatus status, uint64_t cutoff_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM recommendations WHERE status=$1 AND updated_at_ms < $2;", static_cast<int>(status),
                             cutoff_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RecommendationRecord> PgRepository::FindPendingRecommendation(Transaction& t, v1::RecommendationType type,
                                                                                   const std::string& target) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRecommendationColumns + " FROM recommendations WHERE type=$1 AND target=$2 AND status=$3;",
      static_cast<int>(type), target, static_cast<int>(v1::RECOMMENDATION_STATUS_PENDING));
  if (res.empty()) return std::nullopt;
  return ReadRecommendation(res[0]);
}

} // namespace strata::db::postgres
