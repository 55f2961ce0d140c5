#include "memory_repository.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "internal/util/text.hpp"
#include "memory_tx.hpp"

namespace strata::db::memory {

namespace v1 = strata::engine::v1;

namespace {

bool Matches(const model::ContentRecord& r, const model::RecordFilter& f) {
  if (!f.domain.empty() && r.domain != f.domain) return false;
  if (!f.content_type.empty() && r.content_type != f.content_type) return false;
  if (f.created_after_ms != 0 && r.created_at_ms < f.created_after_ms) return false;
  if (f.created_before_ms != 0 && r.created_at_ms >= f.created_before_ms) return false;
  if (f.strategy != v1::STRATEGY_UNSPECIFIED && r.strategy != f.strategy) return false;
  if (f.status != v1::RECORD_STATUS_UNSPECIFIED && r.status != f.status) return false;
  if (f.policy_version_below != 0 && r.policy_version >= f.policy_version_below) return false;
  if (!f.table_name.empty() && r.table_name != f.table_name) return false;
  if (f.needs_review_only && !r.needs_review) return false;
  return true;
}

// Okapi BM25 parameters, same defaults as SQLite FTS5.
constexpr double kK1 = 1.2;
constexpr double kB  = 0.75;

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Content records
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertRecord(Transaction& t, const model::ContentRecord& r) {
  const auto& view = TX(t).View();
  if (view.records->contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "record id exists");
  if (view.locator_index->contains(r.source_locator)) return Result::Err(ErrorCode::AlreadyExists, "source_locator exists");

  auto& s = TX(t).Mutable();
  s.records.Edit()[r.id]                    = r;
  s.locator_index.Edit()[r.source_locator] = r.id;
  return Result::Ok();
}

std::optional<model::ContentRecord> MemoryRepository::GetRecord(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.records->find(id);
  if (it == s.records->end()) return std::nullopt;
  return it->second;
}

std::optional<model::ContentRecord> MemoryRepository::GetRecordByLocator(Transaction& t, const std::string& source_locator) {
  const auto& s  = TX(t).View();
  auto        it = s.locator_index->find(source_locator);
  if (it == s.locator_index->end()) return std::nullopt;
  return s.records->at(it->second);
}

std::vector<model::ContentRecord> MemoryRepository::ListRecords(Transaction& t, const model::RecordFilter& filter) {
  std::vector<model::ContentRecord> out;
  for (const auto& [_, record] : *TX(t).View().records) {
    if (Matches(record, filter)) out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountRecords(Transaction& t, const model::RecordFilter& filter) {
  uint64_t n = 0;
  for (const auto& [_, record] : *TX(t).View().records) {
    if (Matches(record, filter)) ++n;
  }
  return n;
}

Result MemoryRepository::UpdateRecord(Transaction& t, const model::ContentRecord& r, uint64_t expected_version) {
  const auto& view = TX(t).View();
  auto        it   = view.records->find(r.id);
  if (it == view.records->end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "version mismatch");
  if (it->second.source_locator != r.source_locator) {
    auto other = view.locator_index->find(r.source_locator);
    if (other != view.locator_index->end() && other->second != r.id) return Result::Err(ErrorCode::AlreadyExists, "source_locator exists");
  }

  auto&       s   = TX(t).Mutable();
  const auto& old = s.records.Edit().at(r.id);
  s.locator_index.Edit().erase(old.source_locator);
  s.locator_index.Edit()[r.source_locator] = r.id;
  s.records.Edit()[r.id]                   = r;
  return Result::Ok();
}

Result MemoryRepository::MergeAccessStats(Transaction& t, const std::string& id, uint64_t query_delta, uint64_t last_queried_at_ms,
                                          double access_frequency) {
  if (!TX(t).View().records->contains(id)) return Result::Err(ErrorCode::NotFound, id);
  auto& r = TX(t).Mutable().records.Edit().at(id);
  r.query_count += query_delta;
  r.last_queried_at_ms = std::max(r.last_queried_at_ms, last_queried_at_ms);
  r.access_frequency   = access_frequency;
  return Result::Ok();
}

std::vector<model::TextHit> MemoryRepository::SearchText(Transaction& t, const std::string& query, const model::RecordFilter& filter,
                                                         std::size_t limit) {
  auto terms = util::Tokenize(query);
  std::sort(terms.begin(), terms.end());
  terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
  if (terms.empty() || limit == 0) return {};

  // Corpus statistics over all indexed rows, matching FTS5 which ranks
  // against the whole index rather than the filtered subset.
  struct Doc {
    const model::ContentRecord*                  record;
    std::unordered_map<std::string, std::size_t> tf;
    std::size_t                                  length = 0;
  };

  std::vector<Doc>                             docs;
  std::unordered_map<std::string, std::size_t> df;
  double                                       total_length = 0.0;

  for (const auto& [_, record] : *TX(t).View().records) {
    Doc doc{&record, {}, 0};
    for (auto& token : util::Tokenize(record.title + " " + record.preview)) {
      ++doc.tf[token];
      ++doc.length;
    }
    total_length += static_cast<double>(doc.length);
    for (const auto& term : terms) {
      if (doc.tf.contains(term)) ++df[term];
    }
    docs.push_back(std::move(doc));
  }
  if (docs.empty()) return {};

  const double n      = static_cast<double>(docs.size());
  const double avg_dl = std::max(1.0, total_length / n);

  std::vector<model::TextHit> hits;
  for (const auto& doc : docs) {
    if (!Matches(*doc.record, filter)) continue;

    double score = 0.0;
    bool   all   = true;
    for (const auto& term : terms) {
      auto it = doc.tf.find(term);
      if (it == doc.tf.end()) {
        all = false;
        break;
      }
      const double f   = static_cast<double>(it->second);
      const double nq  = static_cast<double>(df[term]);
      const double idf = std::log((n - nq + 0.5) / (nq + 0.5) + 1.0);
      score += idf * (f * (kK1 + 1.0)) / (f + kK1 * (1.0 - kB + kB * static_cast<double>(doc.length) / avg_dl));
    }
    if (all) hits.push_back({doc.record->id, score});
  }

  std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
    if (a.rank != b.rank) return a.rank > b.rank;
    return a.record_id < b.record_id;
  });
  if (hits.size() > limit) hits.resize(limit);
  return hits;
}

// ---------------------------------------------------------------------------
// Blobs
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertBlob(Transaction& t, const model::BlobRecord& b) {
  const auto key = std::make_pair(b.owner_record_id, b.content_hash);
  if (TX(t).View().blobs->contains(key)) return Result::Ok();
  TX(t).Mutable().blobs.Edit()[key] = b;
  return Result::Ok();
}

std::optional<model::BlobRecord> MemoryRepository::GetBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  const auto& s  = TX(t).View();
  auto        it = s.blobs->find({owner_record_id, content_hash});
  if (it == s.blobs->end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::CountBlobs(Transaction& t, const std::string& owner_record_id) {
  uint64_t n = 0;
  for (const auto& [key, _] : *TX(t).View().blobs) {
    if (key.first == owner_record_id) ++n;
  }
  return n;
}

Result MemoryRepository::DeleteBlob(Transaction& t, const std::string& owner_record_id, const std::string& content_hash) {
  const auto key = std::make_pair(owner_record_id, content_hash);
  if (!TX(t).View().blobs->contains(key)) return Result::Ok();
  TX(t).Mutable().blobs.Edit().erase(key);
  return Result::Ok();
}

uint64_t MemoryRepository::DeleteOrphanBlobs(Transaction& t, uint64_t cutoff_ms) {
  std::vector<std::pair<std::string, std::string>> doomed;
  const auto&                                      view = TX(t).View();
  for (const auto& [key, blob] : *view.blobs) {
    if (blob.created_at_ms < cutoff_ms && !view.records->contains(key.first)) doomed.push_back(key);
  }
  if (doomed.empty()) return 0;
  auto& s = TX(t).Mutable();
  for (const auto& key : doomed) s.blobs.Edit().erase(key);
  return doomed.size();
}

// ---------------------------------------------------------------------------
// Batches + mappings
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::StagedBatch& b) {
  if (TX(t).View().batches->contains(b.batch_id)) return Result::Err(ErrorCode::AlreadyExists, b.batch_id);
  TX(t).Mutable().batches.Edit()[b.batch_id] = b;
  return Result::Ok();
}

std::optional<model::StagedBatch> MemoryRepository::GetBatch(Transaction& t, const std::string& batch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.batches->find(batch_id);
  if (it == s.batches->end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompleteBatch(Transaction& t, const std::string& batch_id, uint64_t completed_at_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.batches->find(batch_id);
  if (it == view.batches->end()) return Result::Err(ErrorCode::NotFound, batch_id);
  if (it->second.state != v1::BATCH_STATE_PENDING) return Result::Err(ErrorCode::Conflict, "batch not pending");

  auto& b           = TX(t).Mutable().batches.Edit().at(batch_id);
  b.state           = v1::BATCH_STATE_COMPLETE;
  b.completed_at_ms = completed_at_ms;
  return Result::Ok();
}

std::vector<model::StagedBatch> MemoryRepository::ListPendingBatches(Transaction& t, uint64_t created_before_ms) {
  std::vector<model::StagedBatch> out;
  for (const auto& [_, b] : *TX(t).View().batches) {
    if (b.state == v1::BATCH_STATE_PENDING && b.created_at_ms < created_before_ms) out.push_back(b);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.batch_id < b.batch_id; });
  return out;
}

Result MemoryRepository::DeleteBatch(Transaction& t, const std::string& batch_id) {
  auto& s = TX(t).Mutable();
  s.batches.Edit().erase(batch_id);
  s.mappings.Edit().erase(batch_id);
  return Result::Ok();
}

Result MemoryRepository::InsertVectorMappings(Transaction& t, const std::vector<model::VectorMapping>& mappings) {
  if (mappings.empty()) return Result::Ok();
  auto& s = TX(t).Mutable();
  for (const auto& m : mappings) {
    if (!s.batches->contains(m.batch_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown batch " + m.batch_id);
    s.mappings.Edit()[m.batch_id].push_back(m);
  }
  return Result::Ok();
}

std::vector<model::VectorMapping> MemoryRepository::ListVectorMappings(Transaction& t, const std::string& batch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.mappings->find(batch_id);
  if (it == s.mappings->end()) return {};
  auto out = it->second;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.chunk_sequence < b.chunk_sequence; });
  return out;
}

// ---------------------------------------------------------------------------
// Dynamic tables
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertTableDescriptor(Transaction& t, const model::TableDescriptor& d) {
  TX(t).Mutable().descriptors.Edit()[d.name] = d;
  return Result::Ok();
}

std::optional<model::TableDescriptor> MemoryRepository::GetTableDescriptor(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.descriptors->find(name);
  if (it == s.descriptors->end()) return std::nullopt;
  return it->second;
}

std::vector<model::TableDescriptor> MemoryRepository::ListTableDescriptors(Transaction& t) {
  std::vector<model::TableDescriptor> out;
  for (const auto& [_, d] : *TX(t).View().descriptors) out.push_back(d);
  return out;
}

Result MemoryRepository::ApplyTableSchema(Transaction& t, const model::TableDescriptor& d) {
  // Index-only descriptors target core tables, which have no memory counterpart.
  if (d.columns.empty()) return Result::Ok();
  auto& s = TX(t).Mutable();
  s.tables.Edit().try_emplace(d.name);
  return Result::Ok();
}

Result MemoryRepository::InsertTableRow(Transaction& t, const std::string& table, const model::TableRow& row) {
  const auto& view = TX(t).View();
  auto        it   = view.tables->find(table);
  if (it == view.tables->end()) return Result::Err(ErrorCode::NotFound, "no such table: " + table);
  if (it->second.contains(row.row_id)) return Result::Err(ErrorCode::AlreadyExists, row.row_id);
  TX(t).Mutable().tables.Edit()[table][row.row_id] = row;
  return Result::Ok();
}

std::optional<model::TableRow> MemoryRepository::GetTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tables->find(table);
  if (it == s.tables->end()) return std::nullopt;
  auto row = it->second.find(row_id);
  if (row == it->second.end()) return std::nullopt;
  return row->second;
}

Result MemoryRepository::DeleteTableRow(Transaction& t, const std::string& table, const std::string& row_id) {
  const auto& view = TX(t).View();
  auto        it   = view.tables->find(table);
  if (it == view.tables->end() || !it->second.contains(row_id)) return Result::Ok();
  TX(t).Mutable().tables.Edit()[table].erase(row_id);
  return Result::Ok();
}

Result MemoryRepository::BumpTableUsage(Transaction& t, const std::string& name, int64_t rows_delta, uint64_t queries_delta) {
  if (!TX(t).View().descriptors->contains(name)) return Result::Err(ErrorCode::NotFound, name);
  auto&         d    = TX(t).Mutable().descriptors.Edit().at(name);
  const int64_t rows = static_cast<int64_t>(d.row_count) + rows_delta;
  d.row_count        = rows < 0 ? 0 : static_cast<uint64_t>(rows);
  d.query_count += queries_delta;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Repair, garbage, incidents, annotations
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertRepairTask(Transaction& t, const model::RepairTask& task) {
  TX(t).Mutable().repairs.Edit()[task.record_id] = task;
  return Result::Ok();
}

std::optional<model::RepairTask> MemoryRepository::GetRepairTask(Transaction& t, const std::string& record_id) {
  const auto& s  = TX(t).View();
  auto        it = s.repairs->find(record_id);
  if (it == s.repairs->end()) return std::nullopt;
  return it->second;
}

std::vector<model::RepairTask> MemoryRepository::ListRepairTasks(Transaction& t, v1::RepairState state, uint64_t due_before_ms) {
  std::vector<model::RepairTask> out;
  for (const auto& [_, task] : *TX(t).View().repairs) {
    if (state != v1::REPAIR_STATE_UNSPECIFIED && task.state != state) continue;
    if (due_before_ms != 0 && task.next_attempt_at_ms > due_before_ms) continue;
    out.push_back(task);
  }
  return out;
}

Result MemoryRepository::DeleteRepairTask(Transaction& t, const std::string& record_id) {
  if (!TX(t).View().repairs->contains(record_id)) return Result::Ok();
  TX(t).Mutable().repairs.Edit().erase(record_id);
  return Result::Ok();
}

Result MemoryRepository::InsertGarbage(Transaction& t, const model::GarbageEntry& g) {
  if (TX(t).View().garbage->contains(g.id)) return Result::Err(ErrorCode::AlreadyExists, g.id);
  TX(t).Mutable().garbage.Edit()[g.id] = g;
  return Result::Ok();
}

std::vector<model::GarbageEntry> MemoryRepository::ListGarbage(Transaction& t, uint64_t eligible_before_ms) {
  std::vector<model::GarbageEntry> out;
  for (const auto& [_, g] : *TX(t).View().garbage) {
    if (eligible_before_ms == 0 || g.eligible_at_ms <= eligible_before_ms) out.push_back(g);
  }
  return out;
}

Result MemoryRepository::DeleteGarbage(Transaction& t, const std::string& id) {
  if (!TX(t).View().garbage->contains(id)) return Result::Ok();
  TX(t).Mutable().garbage.Edit().erase(id);
  return Result::Ok();
}

Result MemoryRepository::InsertIncident(Transaction& t, const model::Incident& incident) {
  TX(t).Mutable().incidents.Edit().push_back(incident);
  return Result::Ok();
}

std::vector<model::Incident> MemoryRepository::ListIncidents(Transaction& t, std::size_t limit) {
  const auto&                  all = *TX(t).View().incidents;
  std::vector<model::Incident> out(all.rbegin(), all.rend());
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms > b.created_at_ms; });
  if (limit != 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::UpsertAnnotation(Transaction& t, const model::Annotation& a) {
  if (!TX(t).View().records->contains(a.record_id)) return Result::Err(ErrorCode::NotFound, a.record_id);
  TX(t).Mutable().annotations.Edit()[{a.record_id, a.agent}] = a;
  return Result::Ok();
}

std::vector<model::Annotation> MemoryRepository::ListAnnotations(Transaction& t, const std::string& record_id) {
  std::vector<model::Annotation> out;
  for (const auto& [key, a] : *TX(t).View().annotations) {
    if (key.first == record_id) out.push_back(a);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Samples
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertSamples(Transaction& t, const std::vector<model::PerformanceSample>& samples) {
  if (samples.empty()) return Result::Ok();
  auto& s = TX(t).Mutable();
  auto& table = s.samples.Edit();
  table.insert(table.end(), samples.begin(), samples.end());
  return Result::Ok();
}

std::vector<model::PerformanceSample> MemoryRepository::ListSamples(Transaction& t, uint64_t since_ms) {
  std::vector<model::PerformanceSample> out;
  for (const auto& sample : *TX(t).View().samples) {
    if (sample.created_at_ms >= since_ms) out.push_back(sample);
  }
  return out;
}

Result MemoryRepository::DeleteSamplesBefore(Transaction& t, uint64_t cutoff_ms) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.samples.Edit(), [cutoff_ms](const auto& sample) { return sample.created_at_ms < cutoff_ms; });
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Recommendations
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  const auto& view = TX(t).View();
  if (view.recommendations->contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  if (r.status == v1::RECOMMENDATION_STATUS_PENDING) {
    for (const auto& [_, other] : *view.recommendations) {
      if (other.type == r.type && other.target == r.target && other.status == v1::RECOMMENDATION_STATUS_PENDING) {
        return Result::Err(ErrorCode::AlreadyExists, "pending recommendation exists for " + r.target);
      }
    }
  }
  TX(t).Mutable().recommendations.Edit()[r.id] = r;
  return Result::Ok();
}

std::optional<model::RecommendationRecord> MemoryRepository::GetRecommendation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.recommendations->find(id);
  if (it == s.recommendations->end()) return std::nullopt;
  return it->second;
}

std::vector<model::RecommendationRecord> MemoryRepository::ListRecommendations(Transaction& t, v1::RecommendationStatus status) {
  std::vector<model::RecommendationRecord> out;
  for (const auto& [_, r] : *TX(t).View().recommendations) {
    if (status == v1::RECOMMENDATION_STATUS_UNSPECIFIED || r.status == status) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateRecommendation(Transaction& t, const model::RecommendationRecord& r) {
  if (!TX(t).View().recommendations->contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  auto& stored         = TX(t).Mutable().recommendations.Edit().at(r.id);
  stored.status        = r.status;
  stored.detail        = r.detail;
  stored.confidence    = r.confidence;
  stored.updated_at_ms = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteRecommendationsBefore(Transaction& t, v1::RecommendationStatus status, uint64_t cutoff_ms) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.recommendations.Edit(), [status, cutoff_ms](const auto& entry) {
    return entry.second.status == status && entry.second.updated_at_ms < cutoff_ms;
  });
  return Result::Ok();
}

std::optional<model::RecommendationRecord> MemoryRepository::FindPendingRecommendation(Transaction& t, v1::RecommendationType type,
                                                                                       const std::string& target) {
  for (const auto& [_, r] : *TX(t).View().recommendations) {
    if (r.type == type && r.target == target && r.status == v1::RECOMMENDATION_STATUS_PENDING) return r;
  }
  return std::nullopt;
}

} // namespace strata::db::memory
