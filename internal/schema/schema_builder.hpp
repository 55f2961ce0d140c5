#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/table_descriptor.hpp"
#include "internal/db/sql/migrations.hpp"

namespace strata::schema {

/*
  Emits declarative TableDescriptors with dialect-specific, idempotent DDL.

  Dynamic tables are named <prefix>_<domain>_<content_type>_<hash8>,
  where hash8 is derived from the unsanitized (domain, content_type)
  pair so distinct inputs that sanitize alike still get distinct tables.
*/
class SchemaBuilder {
 public:
  SchemaBuilder(db::sql::Dialect dialect, std::string prefix);

  std::string TableName(const std::string& domain, const std::string& content_type) const;

  // Specialized table for a (domain, content_type) pair.
  db::model::TableDescriptor ForContent(const std::string& domain, const std::string& content_type, uint64_t now_ms) const;

  // Index-only descriptor on content_records for one domain.
  db::model::TableDescriptor ForDomainIndex(const std::string& domain, uint64_t now_ms) const;

  // Lower-case [a-z0-9_], at most max_len characters, never empty.
  static std::string Sanitize(const std::string& name, std::size_t max_len);

 private:
  db::sql::Dialect dialect_;
  std::string      prefix_;
};

// True when columns and indexes are identical.
bool SameShape(const db::model::TableDescriptor& a, const db::model::TableDescriptor& b);

} // namespace strata::schema
