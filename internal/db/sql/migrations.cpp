#include "internal/db/sql/migrations.hpp"

namespace strata::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS content_records ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " id TEXT NOT NULL UNIQUE,"
    " source_locator TEXT NOT NULL UNIQUE,"
    " title TEXT NOT NULL DEFAULT '', author TEXT NOT NULL DEFAULT '',"
    " domain TEXT NOT NULL, content_type TEXT NOT NULL,"
    " declared_size INTEGER NOT NULL, text_size INTEGER NOT NULL, content_hash TEXT NOT NULL,"
    " semantic_complexity REAL NOT NULL, topic_coherence REAL NOT NULL,"
    " information_density REAL NOT NULL, query_potential REAL NOT NULL,"
    " strategy INTEGER NOT NULL, policy_version INTEGER NOT NULL, confidence REAL NOT NULL, reasoning TEXT NOT NULL DEFAULT '[]',"
    " status INTEGER NOT NULL, needs_review INTEGER NOT NULL DEFAULT 0,"
    " blob_hash TEXT NOT NULL DEFAULT '', vector_batch_id TEXT NOT NULL DEFAULT '', vector_collection TEXT NOT NULL DEFAULT '',"
    " chunk_count INTEGER NOT NULL DEFAULT 0, table_name TEXT NOT NULL DEFAULT '', table_row_id TEXT NOT NULL DEFAULT '',"
    " preview TEXT NOT NULL DEFAULT '', metadata_json TEXT NOT NULL DEFAULT '', tags TEXT NOT NULL DEFAULT '[]',"
    " query_count INTEGER NOT NULL DEFAULT 0, last_queried_at_ms INTEGER NOT NULL DEFAULT 0, access_frequency REAL NOT NULL DEFAULT 0,"
    " scrape_count INTEGER NOT NULL DEFAULT 1, version INTEGER NOT NULL DEFAULT 1,"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS content_records_domain ON content_records(domain);",
    "CREATE INDEX IF NOT EXISTS content_records_content_type ON content_records(content_type);",
    "CREATE INDEX IF NOT EXISTS content_records_created ON content_records(created_at_ms);",
    "CREATE INDEX IF NOT EXISTS content_records_strategy ON content_records(strategy, status);",

    // external-content FTS5 index over title + preview, kept in sync by triggers
    "CREATE VIRTUAL TABLE IF NOT EXISTS content_search USING fts5(title, preview, content='content_records', content_rowid='seq');",
    "CREATE TRIGGER IF NOT EXISTS content_records_ai AFTER INSERT ON content_records BEGIN"
    " INSERT INTO content_search(rowid, title, preview) VALUES (new.seq, new.title, new.preview); END;",
    "CREATE TRIGGER IF NOT EXISTS content_records_ad AFTER DELETE ON content_records BEGIN"
    " INSERT INTO content_search(content_search, rowid, title, preview) VALUES ('delete', old.seq, old.title, old.preview); END;",
    "CREATE TRIGGER IF NOT EXISTS content_records_au AFTER UPDATE OF title, preview ON content_records BEGIN"
    " INSERT INTO content_search(content_search, rowid, title, preview) VALUES ('delete', old.seq, old.title, old.preview);"
    " INSERT INTO content_search(rowid, title, preview) VALUES (new.seq, new.title, new.preview); END;",

    "CREATE TABLE IF NOT EXISTS content_blobs ("
    " owner_record_id TEXT NOT NULL, content_hash TEXT NOT NULL, body TEXT NOT NULL, size_bytes INTEGER NOT NULL,"
    " chunks_json TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (owner_record_id, content_hash));",

    "CREATE TABLE IF NOT EXISTS staged_batches ("
    " batch_id TEXT PRIMARY KEY, record_id TEXT NOT NULL, collection TEXT NOT NULL, expected_chunks INTEGER NOT NULL,"
    " state INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS staged_batches_pending ON staged_batches(state, created_at_ms);",

    "CREATE TABLE IF NOT EXISTS vector_mappings ("
    " batch_id TEXT NOT NULL REFERENCES staged_batches(batch_id) ON DELETE CASCADE,"
    " chunk_sequence INTEGER NOT NULL, point_id TEXT NOT NULL, record_id TEXT NOT NULL, collection TEXT NOT NULL,"
    " dimension INTEGER NOT NULL, model TEXT NOT NULL,"
    " PRIMARY KEY (batch_id, chunk_sequence));",

    "CREATE TABLE IF NOT EXISTS table_descriptors ("
    " name TEXT PRIMARY KEY, version INTEGER NOT NULL, domain TEXT NOT NULL, content_type TEXT NOT NULL,"
    " columns_json TEXT NOT NULL, indexes_json TEXT NOT NULL, ddl_json TEXT NOT NULL, state INTEGER NOT NULL,"
    " row_count INTEGER NOT NULL DEFAULT 0, query_count INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS repair_tasks ("
    " record_id TEXT PRIMARY KEY, missing_legs INTEGER NOT NULL, content TEXT NOT NULL, attempts INTEGER NOT NULL,"
    " next_attempt_at_ms INTEGER NOT NULL, state INTEGER NOT NULL, last_error TEXT NOT NULL DEFAULT '',"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS garbage_entries ("
    " id TEXT PRIMARY KEY, record_id TEXT NOT NULL, leg INTEGER NOT NULL, ref TEXT NOT NULL, collection TEXT NOT NULL,"
    " eligible_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS incidents ("
    " id TEXT PRIMARY KEY, record_id TEXT NOT NULL, kind TEXT NOT NULL, detail TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS annotations ("
    " record_id TEXT NOT NULL REFERENCES content_records(id) ON DELETE CASCADE, agent TEXT NOT NULL, json TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL, PRIMARY KEY (record_id, agent));",

    "CREATE TABLE IF NOT EXISTS performance_samples ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, signature TEXT NOT NULL, mode INTEGER NOT NULL, domain TEXT NOT NULL,"
    " strategy INTEGER NOT NULL, latency_ms REAL NOT NULL, rows INTEGER NOT NULL, partial INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS performance_samples_created ON performance_samples(created_at_ms);",

    "CREATE TABLE IF NOT EXISTS recommendations ("
    " id TEXT PRIMARY KEY, type INTEGER NOT NULL, target TEXT NOT NULL, description TEXT NOT NULL,"
    " from_strategy INTEGER NOT NULL, to_strategy INTEGER NOT NULL, estimated_improvement_pct REAL NOT NULL,"
    " confidence REAL NOT NULL, status INTEGER NOT NULL, detail TEXT NOT NULL DEFAULT '',"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE UNIQUE INDEX IF NOT EXISTS recommendations_one_pending ON recommendations(type, target) WHERE status = 1;",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS content_records ("
    " id TEXT PRIMARY KEY,"
    " source_locator TEXT NOT NULL UNIQUE,"
    " title TEXT NOT NULL DEFAULT '', author TEXT NOT NULL DEFAULT '',"
    " domain TEXT NOT NULL, content_type TEXT NOT NULL,"
    " declared_size BIGINT NOT NULL, text_size BIGINT NOT NULL, content_hash TEXT NOT NULL,"
    " semantic_complexity DOUBLE PRECISION NOT NULL, topic_coherence DOUBLE PRECISION NOT NULL,"
    " information_density DOUBLE PRECISION NOT NULL, query_potential DOUBLE PRECISION NOT NULL,"
    " strategy SMALLINT NOT NULL, policy_version INTEGER NOT NULL, confidence DOUBLE PRECISION NOT NULL,"
    " reasoning JSONB NOT NULL DEFAULT '[]',"
    " status SMALLINT NOT NULL, needs_review BOOLEAN NOT NULL DEFAULT FALSE,"
    " blob_hash TEXT NOT NULL DEFAULT '', vector_batch_id TEXT NOT NULL DEFAULT '', vector_collection TEXT NOT NULL DEFAULT '',"
    " chunk_count INTEGER NOT NULL DEFAULT 0, table_name TEXT NOT NULL DEFAULT '', table_row_id TEXT NOT NULL DEFAULT '',"
    " preview TEXT NOT NULL DEFAULT '', metadata_json TEXT NOT NULL DEFAULT '', tags JSONB NOT NULL DEFAULT '[]',"
    " query_count BIGINT NOT NULL DEFAULT 0, last_queried_at_ms BIGINT NOT NULL DEFAULT 0,"
    " access_frequency DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " scrape_count BIGINT NOT NULL DEFAULT 1, version BIGINT NOT NULL DEFAULT 1,"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL,"
    " search_vector tsvector GENERATED ALWAYS AS (to_tsvector('english', title || ' ' || preview)) STORED);",
    "CREATE INDEX IF NOT EXISTS content_records_domain ON content_records(domain);",
    "CREATE INDEX IF NOT EXISTS content_records_content_type ON content_records(content_type);",
    "CREATE INDEX IF NOT EXISTS content_records_created ON content_records(created_at_ms);",
    "CREATE INDEX IF NOT EXISTS content_records_strategy ON content_records(strategy, status);",
    "CREATE INDEX IF NOT EXISTS content_records_search ON content_records USING GIN (search_vector);",

    "CREATE TABLE IF NOT EXISTS content_blobs ("
    " owner_record_id TEXT NOT NULL, content_hash TEXT NOT NULL, body TEXT NOT NULL, size_bytes BIGINT NOT NULL,"
    " chunks_json TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (owner_record_id, content_hash));",

    "CREATE TABLE IF NOT EXISTS staged_batches ("
    " batch_id TEXT PRIMARY KEY, record_id TEXT NOT NULL, collection TEXT NOT NULL, expected_chunks INTEGER NOT NULL,"
    " state SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS staged_batches_pending ON staged_batches(state, created_at_ms);",

    "CREATE TABLE IF NOT EXISTS vector_mappings ("
    " batch_id TEXT NOT NULL REFERENCES staged_batches(batch_id) ON DELETE CASCADE,"
    " chunk_sequence INTEGER NOT NULL, point_id TEXT NOT NULL, record_id TEXT NOT NULL, collection TEXT NOT NULL,"
    " dimension INTEGER NOT NULL, model TEXT NOT NULL,"
    " PRIMARY KEY (batch_id, chunk_sequence));",

    "CREATE TABLE IF NOT EXISTS table_descriptors ("
    " name TEXT PRIMARY KEY, version INTEGER NOT NULL, domain TEXT NOT NULL, content_type TEXT NOT NULL,"
    " columns_json JSONB NOT NULL, indexes_json JSONB NOT NULL, ddl_json JSONB NOT NULL, state SMALLINT NOT NULL,"
    " row_count BIGINT NOT NULL DEFAULT 0, query_count BIGINT NOT NULL DEFAULT 0,"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS repair_tasks ("
    " record_id TEXT PRIMARY KEY, missing_legs INTEGER NOT NULL, content TEXT NOT NULL, attempts INTEGER NOT NULL,"
    " next_attempt_at_ms BIGINT NOT NULL, state SMALLINT NOT NULL, last_error TEXT NOT NULL DEFAULT '',"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS garbage_entries ("
    " id TEXT PRIMARY KEY, record_id TEXT NOT NULL, leg INTEGER NOT NULL, ref TEXT NOT NULL, collection TEXT NOT NULL,"
    " eligible_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS incidents ("
    " id TEXT PRIMARY KEY, record_id TEXT NOT NULL, kind TEXT NOT NULL, detail TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS annotations ("
    " record_id TEXT NOT NULL REFERENCES content_records(id) ON DELETE CASCADE, agent TEXT NOT NULL, json JSONB NOT NULL,"
    " updated_at_ms BIGINT NOT NULL, PRIMARY KEY (record_id, agent));",

    "CREATE TABLE IF NOT EXISTS performance_samples ("
    " seq BIGSERIAL PRIMARY KEY, signature TEXT NOT NULL, mode SMALLINT NOT NULL, domain TEXT NOT NULL,"
    " strategy SMALLINT NOT NULL, latency_ms DOUBLE PRECISION NOT NULL, rows BIGINT NOT NULL, partial BOOLEAN NOT NULL,"
    " created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS performance_samples_created ON performance_samples(created_at_ms);",

    "CREATE TABLE IF NOT EXISTS recommendations ("
    " id TEXT PRIMARY KEY, type SMALLINT NOT NULL, target TEXT NOT NULL, description TEXT NOT NULL,"
    " from_strategy SMALLINT NOT NULL, to_strategy SMALLINT NOT NULL, estimated_improvement_pct DOUBLE PRECISION NOT NULL,"
    " confidence DOUBLE PRECISION NOT NULL, status SMALLINT NOT NULL, detail TEXT NOT NULL DEFAULT '',"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
    "CREATE UNIQUE INDEX IF NOT EXISTS recommendations_one_pending ON recommendations(type, target) WHERE status = 1;",
};

} // namespace

const std::vector<std::string>& CoreSchema(Dialect dialect) {
  return dialect == Dialect::kPostgres ? kPostgresSchema : kSqliteSchema;
}

void RunMigrations(const std::function<void(const std::string&)>& execute, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    execute(statement);
  }
}

} // namespace strata::db::sql
