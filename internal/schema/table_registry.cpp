#include "table_registry.hpp"

#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"

namespace strata::schema {

TableRegistry::TableRegistry(db::Repository& repo, SchemaBuilder builder) : repo_(repo), builder_(std::move(builder)) {
}

db::model::TableDescriptor TableRegistry::EnsureTable(const std::string& domain, const std::string& content_type,
                                                      uint64_t now_ms) {
  const auto name = builder_.TableName(domain, content_type);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = applied_.find(name);
    if (it != applied_.end()) return it->second;
  }
  return Apply(builder_.ForContent(domain, content_type, now_ms), now_ms);
}

db::model::TableDescriptor TableRegistry::Apply(db::model::TableDescriptor d, uint64_t now_ms) {
  auto tx       = repo_.Begin();
  auto existing = repo_.GetTableDescriptor(*tx, d.name);

  if (existing && existing->state == db::model::DescriptorState::kApplied && SameShape(*existing, d)) {
    tx->Rollback();
    std::lock_guard<std::mutex> lock(mutex_);
    applied_[d.name] = *existing;
    return *existing;
  }

  if (existing) {
    d.version       = SameShape(*existing, d) ? existing->version : existing->version + 1;
    d.row_count     = existing->row_count;
    d.query_count   = existing->query_count;
    d.created_at_ms = existing->created_at_ms;
  }
  d.state         = db::model::DescriptorState::kApplied;
  d.updated_at_ms = now_ms;

  db::ThrowIfDbError(repo_.ApplyTableSchema(*tx, d), "apply schema " + d.name);
  db::ThrowIfDbError(repo_.UpsertTableDescriptor(*tx, d), "upsert descriptor " + d.name);
  tx->Commit();

  STRATA_LOG_INFO("table descriptor applied", {observability::StringField("table", d.name),
                                               observability::IntField("version", d.version),
                                               observability::IntField("indexes", static_cast<int64_t>(d.indexes.size()))});

  std::lock_guard<std::mutex> lock(mutex_);
  applied_[d.name] = d;
  return d;
}

std::size_t TableRegistry::DynamicTableCount() {
  auto        tx    = repo_.Begin();
  std::size_t count = 0;
  for (const auto& d : repo_.ListTableDescriptors(*tx)) {
    if (!d.columns.empty() && d.row_count > 0) ++count;
  }
  tx->Rollback();
  return count;
}

} // namespace strata::schema
