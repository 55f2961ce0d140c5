#include "pg_pool.hpp"

namespace strata::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    // a broken idle connection is dropped and replaced
    if (conn->is_open()) return Wrap(conn.release());
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kRecordSelect =
      "SELECT id,source_locator,title,author,domain,content_type,declared_size,text_size,content_hash,"
      "semantic_complexity,topic_coherence,information_density,query_potential,"
      "strategy,policy_version,confidence,reasoning::text,status,needs_review,"
      "blob_hash,vector_batch_id,vector_collection,chunk_count,table_name,table_row_id,"
      "preview,metadata_json,tags::text,query_count,last_queried_at_ms,access_frequency,"
      "scrape_count,version,created_at_ms,updated_at_ms FROM content_records ";

  conn.prepare("get_record", std::string(kRecordSelect) + "WHERE id=$1");
  conn.prepare("get_record_by_locator", std::string(kRecordSelect) + "WHERE source_locator=$1");

  conn.prepare("get_blob",
               "SELECT owner_record_id,content_hash,body,size_bytes,chunks_json,created_at_ms "
               "FROM content_blobs WHERE owner_record_id=$1 AND content_hash=$2");

  conn.prepare("complete_batch", "UPDATE staged_batches SET state=$2, completed_at_ms=$3 WHERE batch_id=$1 AND state=$4");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace strata::db::postgres
