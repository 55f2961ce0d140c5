#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace strata::db::model {

struct ColumnDef {
  std::string name;
  std::string type;
  bool        nullable = true;
};

struct IndexDef {
  std::string name;
  std::string definition; // dialect-specific DDL
};

enum class DescriptorState : int {
  kPending = 1,
  kApplied = 2,
};

/*
  Declarative schema for a dynamic table (or an index migration on a
  core table when columns is empty).

  Versioned independently of records: a new version is emitted whenever
  columns or indexes change. ddl holds the ordered, idempotent statements
  that realize this version.
*/
struct TableDescriptor {
  std::string name;
  uint32_t    version = 1;

  std::string domain;
  std::string content_type;

  std::vector<ColumnDef>   columns;
  std::vector<IndexDef>    indexes;
  std::vector<std::string> ddl;

  DescriptorState state = DescriptorState::kPending;

  uint64_t row_count   = 0;
  uint64_t query_count = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

/*
  Row in a dynamic table.
*/
struct TableRow {
  std::string row_id;
  std::string record_id;
  std::string title;
  std::string body;
  uint64_t    word_count    = 0;
  uint64_t    created_at_ms = 0;
};

} // namespace strata::db::model
