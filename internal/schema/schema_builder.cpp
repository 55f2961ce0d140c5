#include "schema_builder.hpp"

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace strata::schema {

namespace {

constexpr std::size_t kPartLength = 16;

bool IsFullTextType(const std::string& content_type) {
  return content_type == "book" || content_type == "large_document";
}

} // namespace

SchemaBuilder::SchemaBuilder(db::sql::Dialect dialect, std::string prefix)
    : dialect_(dialect), prefix_(Sanitize(prefix, kPartLength)) {
}

std::string SchemaBuilder::Sanitize(const std::string& name, std::size_t max_len) {
  std::string out;
  for (char c : name) {
    if (out.size() >= max_len) break;
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
      out.push_back(static_cast<char>(std::tolower(u)));
    } else if (!out.empty() && out.back() != '_') {
      out.push_back('_');
    }
  }
  while (!out.empty() && out.back() == '_') out.pop_back();
  if (out.empty()) out = "x";
  if (std::isdigit(static_cast<unsigned char>(out.front()))) out.insert(out.begin(), 't');
  return out.substr(0, max_len);
}

std::string SchemaBuilder::TableName(const std::string& domain, const std::string& content_type) const {
  const auto hash8 = util::ToHex(util::Fnv1a64(domain + "/" + content_type)).substr(0, 8);
  return prefix_ + "_" + Sanitize(domain, kPartLength) + "_" + Sanitize(content_type, kPartLength) + "_" + hash8;
}

db::model::TableDescriptor SchemaBuilder::ForContent(const std::string& domain, const std::string& content_type,
                                                     uint64_t now_ms) const {
  db::model::TableDescriptor d;
  d.name          = TableName(domain, content_type);
  d.domain        = domain;
  d.content_type  = content_type;
  d.created_at_ms = now_ms;
  d.updated_at_ms = now_ms;

  const bool        pg      = dialect_ == db::sql::Dialect::kPostgres;
  const std::string integer = pg ? "BIGINT" : "INTEGER";

  d.columns = {
      {"row_id", "TEXT", false},     {"record_id", "TEXT", false}, {"title", "TEXT", true},
      {"body", "TEXT", true},        {"word_count", integer, false}, {"created_at_ms", integer, false},
  };

  d.indexes.push_back({d.name + "_record_idx", "CREATE INDEX IF NOT EXISTS " + d.name + "_record_idx ON " + d.name + "(record_id)"});
  d.indexes.push_back({d.name + "_time_idx", "CREATE INDEX IF NOT EXISTS " + d.name + "_time_idx ON " + d.name + "(created_at_ms)"});
  if (IsFullTextType(content_type)) {
    if (pg) {
      d.indexes.push_back({d.name + "_fts_idx", "CREATE INDEX IF NOT EXISTS " + d.name + "_fts_idx ON " + d.name +
                                                    " USING GIN (to_tsvector('english', coalesce(title,'') || ' ' || coalesce(body,'')))"});
    } else {
      d.indexes.push_back({d.name + "_title_idx", "CREATE INDEX IF NOT EXISTS " + d.name + "_title_idx ON " + d.name +
                                                      "(title COLLATE NOCASE)"});
    }
  }

  std::string create = "CREATE TABLE IF NOT EXISTS " + d.name + " (";
  for (std::size_t i = 0; i < d.columns.size(); ++i) {
    const auto& c = d.columns[i];
    if (i > 0) create += ", ";
    create += c.name + " " + c.type;
    if (c.name == "row_id") create += " PRIMARY KEY";
    else if (!c.nullable) create += " NOT NULL";
  }
  create += ")";

  d.ddl.push_back(create);
  for (const auto& idx : d.indexes) d.ddl.push_back(idx.definition);
  return d;
}

db::model::TableDescriptor SchemaBuilder::ForDomainIndex(const std::string& domain, uint64_t now_ms) const {
  const auto safe = Sanitize(domain, kPartLength);

  db::model::TableDescriptor d;
  d.name          = "content_records_" + safe + "_domain_idx";
  d.domain        = domain;
  d.created_at_ms = now_ms;
  d.updated_at_ms = now_ms;

  // The sanitized name is quoted as a literal, so only domains that
  // survive sanitizing unchanged get a partial index.
  if (safe != domain) {
    throw util::ValidationError("domain not indexable: " + domain);
  }
  const std::string ddl = "CREATE INDEX IF NOT EXISTS " + d.name + " ON content_records(created_at_ms, id) WHERE domain = '" +
                          safe + "'";
  d.indexes.push_back({d.name, ddl});
  d.ddl.push_back(ddl);
  return d;
}

bool SameShape(const db::model::TableDescriptor& a, const db::model::TableDescriptor& b) {
  if (a.columns.size() != b.columns.size() || a.indexes.size() != b.indexes.size()) return false;
  for (std::size_t i = 0; i < a.columns.size(); ++i) {
    const auto& x = a.columns[i];
    const auto& y = b.columns[i];
    if (x.name != y.name || x.type != y.type || x.nullable != y.nullable) return false;
  }
  for (std::size_t i = 0; i < a.indexes.size(); ++i) {
    if (a.indexes[i].name != b.indexes[i].name || a.indexes[i].definition != b.indexes[i].definition) return false;
  }
  return true;
}

} // namespace strata::schema
