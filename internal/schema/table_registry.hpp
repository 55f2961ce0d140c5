#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/schema/schema_builder.hpp"

namespace strata::schema {

/*
  Registry of applied dynamic-table descriptors.

  Injected into the coordinator and optimizer; there is one per engine
  instance, not per process. The in-memory cache only short-circuits
  repeated ensures; the table_descriptors rows are authoritative.
*/
class TableRegistry {
 public:
  TableRegistry(db::Repository& repo, SchemaBuilder builder);

  // Creates or upgrades the table for (domain, content_type).
  db::model::TableDescriptor EnsureTable(const std::string& domain, const std::string& content_type, uint64_t now_ms);

  // Applies an arbitrary descriptor. A changed shape bumps the version.
  db::model::TableDescriptor Apply(db::model::TableDescriptor descriptor, uint64_t now_ms);

  // Dynamic tables holding at least one row.
  std::size_t DynamicTableCount();

  const SchemaBuilder& Builder() const {
    return builder_;
  }

 private:
  db::Repository& repo_;
  SchemaBuilder   builder_;

  std::mutex                                        mutex_;
  std::map<std::string, db::model::TableDescriptor> applied_;
};

} // namespace strata::schema
