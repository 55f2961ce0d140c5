#pragma once

#include <functional>
#include <string>
#include <vector>

namespace strata::db::sql {

/*
  Core schema bootstrap.

  Statements are idempotent (IF NOT EXISTS) and run in order at startup.
  Dynamic tables are created later through ApplyTableSchema.
*/

enum class Dialect { kSqlite, kPostgres };

const std::vector<std::string>& CoreSchema(Dialect dialect);

// Runs statements in order through the backend's executor.
void RunMigrations(const std::function<void(const std::string&)>& execute, const std::vector<std::string>& ordered_sql);

} // namespace strata::db::sql
