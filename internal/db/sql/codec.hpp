#pragma once

#include <string>
#include <vector>

#include "internal/db/model/table_descriptor.hpp"

namespace strata::db::sql {

/*
  JSON encodings for list-valued columns.

  Both backends store these as JSON text (JSONB on Postgres). Encoding
  goes through google.protobuf.ListValue so the format matches what the
  config loader and operator surface emit.
*/

std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

std::string                   EncodeColumns(const std::vector<model::ColumnDef>& columns);
std::vector<model::ColumnDef> DecodeColumns(const std::string& json);

std::string                  EncodeIndexes(const std::vector<model::IndexDef>& indexes);
std::vector<model::IndexDef> DecodeIndexes(const std::string& json);

// Identifiers interpolated into SQL (dynamic table names) must match
// [a-z_][a-z0-9_]{0,62}.
bool IsSafeIdentifier(const std::string& name);

} // namespace strata::db::sql
