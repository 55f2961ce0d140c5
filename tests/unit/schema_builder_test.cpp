#include "internal/schema/schema_builder.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/schema/table_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using strata::db::sql::Dialect;
using strata::schema::SameShape;
using strata::schema::SchemaBuilder;
using strata::schema::TableRegistry;

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool AnyContains(const std::vector<std::string>& items, const std::string& needle) {
  for (const auto& i : items) {
    if (i.find(needle) != std::string::npos) return true;
  }
  return false;
}

void TestSanitizeKeepsIdentifiersSafe() {
  assert(SchemaBuilder::Sanitize("Hello World!", 16) == "hello_world");
  assert(SchemaBuilder::Sanitize("123abc", 16) == "t123abc");
  assert(SchemaBuilder::Sanitize("", 16) == "x");
  assert(SchemaBuilder::Sanitize("--", 16) == "x");
  assert(SchemaBuilder::Sanitize("a-very-long-domain-name-here", 16).size() <= 16);
}

void TestTableNamesAreDistinctPerUnsanitizedPair() {
  const SchemaBuilder builder(Dialect::kSqlite, "dyn");

  const auto a = builder.TableName("history", "book");
  const auto b = builder.TableName("History", "book");
  assert(StartsWith(a, "dyn_history_book_"));
  assert(StartsWith(b, "dyn_history_book_"));
  assert(a != b);
  assert(a == builder.TableName("history", "book"));
}

void TestBookTablesGetFullTextIndex() {
  const SchemaBuilder sqlite(Dialect::kSqlite, "dyn");
  const SchemaBuilder pg(Dialect::kPostgres, "dyn");

  const auto small = sqlite.ForContent("history", "small_document", 1);
  assert(small.columns.size() == 6);
  assert(small.indexes.size() == 2);
  assert(small.ddl.size() == 3);
  assert(StartsWith(small.ddl[0], "CREATE TABLE IF NOT EXISTS " + small.name));

  const auto book_sqlite = sqlite.ForContent("history", "book", 1);
  assert(book_sqlite.indexes.size() == 3);
  assert(AnyContains(book_sqlite.ddl, "COLLATE NOCASE"));

  const auto book_pg = pg.ForContent("history", "book", 1);
  assert(book_pg.indexes.size() == 3);
  assert(AnyContains(book_pg.ddl, "USING GIN"));
  assert(AnyContains(book_pg.ddl, "BIGINT"));

  for (const auto& stmt : book_pg.ddl) {
    assert(stmt.find("IF NOT EXISTS") != std::string::npos);
  }
}

void TestDomainIndexIsPartialOnRecords() {
  const SchemaBuilder builder(Dialect::kSqlite, "dyn");

  const auto d = builder.ForDomainIndex("science", 5);
  assert(d.columns.empty());
  assert(d.ddl.size() == 1);
  assert(d.ddl[0].find("ON content_records") != std::string::npos);
  assert(d.ddl[0].find("WHERE domain = 'science'") != std::string::npos);

  bool threw = false;
  try {
    (void)builder.ForDomainIndex("x'; DROP TABLE content_records; --", 5);
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestSameShapeComparesColumnsAndIndexes() {
  const SchemaBuilder builder(Dialect::kSqlite, "dyn");

  const auto a = builder.ForContent("history", "book", 1);
  auto       b = builder.ForContent("history", "book", 99);
  assert(SameShape(a, b));

  b.indexes.pop_back();
  assert(!SameShape(a, b));
}

void TestRegistryAppliesOnceAndVersionsChanges() {
  strata::db::memory::MemoryRepository repo;
  TableRegistry                        registry(repo, SchemaBuilder(Dialect::kSqlite, "dyn"));

  const auto first  = registry.EnsureTable("history", "book", 10);
  const auto second = registry.EnsureTable("history", "book", 20);
  assert(first.name == second.name);
  assert(first.version == 1);
  assert(second.version == 1);
  assert(first.state == strata::db::model::DescriptorState::kApplied);

  auto changed = registry.Builder().ForContent("history", "book", 30);
  changed.indexes.push_back({changed.name + "_extra_idx", "CREATE INDEX IF NOT EXISTS " + changed.name + "_extra_idx ON " +
                                                              changed.name + "(word_count)"});
  changed.ddl.push_back(changed.indexes.back().definition);
  const auto upgraded = registry.Apply(changed, 30);
  assert(upgraded.version == 2);
  assert(upgraded.created_at_ms == 10);

  // empty tables do not count as live
  assert(registry.DynamicTableCount() == 0);
  {
    auto tx = repo.Begin();
    const auto res = repo.BumpTableUsage(*tx, first.name, 1, 0);
    assert(res);
    tx->Commit();
  }
  assert(registry.DynamicTableCount() == 1);
}

} // namespace

int main() {
  TestSanitizeKeepsIdentifiersSafe();
  TestTableNamesAreDistinctPerUnsanitizedPair();
  TestBookTablesGetFullTextIndex();
  TestDomainIndexIsPartialOnRecords();
  TestSameShapeComparesColumnsAndIndexes();
  TestRegistryAppliesOnceAndVersionsChanges();

  std::cout << "strata_unit_schema_builder: pass\n";
  return 0;
}
