#include "storage_coordinator.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace strata::coordinator {

namespace v1 = strata::engine::v1;

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

void ValidateRequest(const v1::IngestRequest& request) {
  if (util::Trim(request.raw_text()).empty()) {
    throw util::ValidationError("raw_text is required");
  }
  if (util::Trim(request.source_locator()).empty()) {
    throw util::ValidationError("source_locator is required");
  }
  if (!request.metadata_json().empty()) {
    google::protobuf::Struct parsed;
    auto status = google::protobuf::util::JsonStringToMessage(request.metadata_json(), &parsed);
    if (!status.ok()) {
      throw util::ValidationError("metadata_json must be a JSON object: " + std::string(status.message()));
    }
  }
}

v1::IngestResponse ResponseFor(const db::model::ContentRecord& record, bool rescrape) {
  v1::IngestResponse response;
  response.set_record_id(record.id);
  response.set_strategy(record.strategy);
  response.set_confidence(record.confidence);
  response.set_status(record.status);
  response.set_rescrape(rescrape);
  for (const auto& r : record.reasoning) response.add_reasoning(r);
  return response;
}

} // namespace

StorageCoordinator::StorageCoordinator(db::Repository& repo, const classifier::ContentClassifier& classifier,
                                       const placement::PlacementPolicy& policy, legs::LegStore& legs,
                                       consistency::ConsistencyMapper& mapper, LocatorClaims& claims, CoordinatorOptions options)
    : repo_(repo),
      classifier_(classifier),
      policy_(policy),
      legs_(legs),
      mapper_(mapper),
      claims_(claims),
      options_(std::move(options)) {
}

v1::IngestResponse StorageCoordinator::Ingest(const v1::IngestRequest& request) {
  return Ingest(request, util::NowMillis());
}

v1::IngestResponse StorageCoordinator::Ingest(const v1::IngestRequest& request, uint64_t now_ms) {
  observability::SpanScope span("StorageCoordinator.Ingest");
  span.SetAttribute("source_locator", request.source_locator());

  ValidateRequest(request);

  const uint64_t size = request.declared_size() > 0 ? request.declared_size() : request.raw_text().size();

  classifier::ClassifierInput input;
  input.text                  = request.raw_text();
  input.declared_domain       = request.domain();
  input.declared_content_type = request.content_type();
  input.estimated_size        = size;
  input.source_locator        = request.source_locator();

  const auto classification = classifier_.Classify(input);
  const auto decision       = policy_.Decide(size, classification.profile, classification.domain);
  const auto content_hash   = util::Sha256Hex(request.raw_text());

  auto claim = claims_.Acquire(request.source_locator());

  {
    auto tx       = repo_.Begin();
    auto existing = repo_.GetRecordByLocator(*tx, request.source_locator());
    tx->Rollback();
    if (existing) return Rescrape(request, content_hash, now_ms);
  }

  db::model::ContentRecord record;
  record.id                  = util::NewId();
  record.source_locator      = request.source_locator();
  record.title               = request.title();
  record.author              = request.author();
  record.domain              = classification.domain;
  record.content_type        = classification.content_type;
  record.declared_size       = size;
  record.text_size           = request.raw_text().size();
  record.content_hash        = content_hash;
  record.semantic_complexity = classification.profile.semantic_complexity();
  record.topic_coherence     = classification.profile.topic_coherence();
  record.information_density = classification.profile.information_density();
  record.query_potential     = classification.profile.query_potential();
  record.strategy            = decision.strategy();
  record.policy_version      = decision.policy_version();
  record.confidence          = decision.confidence();
  record.reasoning.assign(decision.reasoning().begin(), decision.reasoning().end());
  record.preview       = util::Utf8Prefix(request.raw_text(), options_.preview_chars);
  record.metadata_json = request.metadata_json();
  record.tags.assign(request.tags().begin(), request.tags().end());
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;

  legs::LegContext ctx;
  ctx.record_id    = record.id;
  ctx.content      = request.raw_text();
  ctx.content_hash = content_hash;
  ctx.title        = record.title;
  ctx.domain       = record.domain;
  ctx.content_type = record.content_type;
  ctx.now_ms       = now_ms;

  const auto written   = legs_.Write(model::LegsFor(decision.strategy()), ctx);
  auto       published = mapper_.PublishIngest(std::move(record), written, request.raw_text(), now_ms);
  if (!published) return Rescrape(request, content_hash, now_ms);

  observability::Metrics::Instance().RecordIngest(model::ToString(published->strategy));
  span.SetAttribute("strategy", model::ToString(published->strategy));
  span.SetAttribute("confidence", published->confidence);

  STRATA_LOG_INFO("content ingested", {StringField("record_id", published->id), StringField("domain", published->domain),
                                       StringField("content_type", published->content_type),
                                       StringField("strategy", model::ToString(published->strategy)),
                                       DoubleField("confidence", published->confidence),
                                       StringField("status", model::ToString(published->status))});
  return ResponseFor(*published, false);
}

v1::IngestResponse StorageCoordinator::Rescrape(const v1::IngestRequest& request, const std::string& content_hash,
                                                uint64_t now_ms) {
  auto record = util::RetryTransient(util::RetryPolicy{}, [&] {
    auto tx  = repo_.Begin();
    auto rec = repo_.GetRecordByLocator(*tx, request.source_locator());
    if (!rec) throw util::NotFound("record for " + request.source_locator());

    const auto expected = rec->version;
    rec->scrape_count += 1;
    rec->updated_at_ms = now_ms;
    rec->version       = expected + 1;
    auto res = repo_.UpdateRecord(*tx, *rec, expected);
    // a concurrent stats merge or swap bumped the version; reread and retry
    if (res.code == db::ErrorCode::Conflict) throw util::TransientStoreError("rescrape raced with a record update");
    db::ThrowIfDbError(res, "merge rescrape");
    tx->Commit();
    return *rec;
  });

  const bool changed = record.content_hash != content_hash;
  if (changed) {
    STRATA_LOG_INFO("rescrape content differs; stored content kept",
                    {StringField("record_id", record.id), StringField("stored_hash", record.content_hash),
                     StringField("scraped_hash", content_hash)});
  }
  STRATA_LOG_DEBUG("rescrape merged", {StringField("record_id", record.id), IntField("scrape_count", static_cast<int64_t>(record.scrape_count)),
                                       BoolField("content_changed", changed)});
  return ResponseFor(record, true);
}

SweepReport StorageCoordinator::SweepOrphans(uint64_t now_ms) {
  SweepReport report;
  if (now_ms <= options_.orphan_grace_ms) return report;
  const uint64_t cutoff = now_ms - options_.orphan_grace_ms;

  std::vector<db::model::StagedBatch> stale;
  {
    auto tx = repo_.Begin();
    stale   = repo_.ListPendingBatches(*tx, cutoff);
    tx->Rollback();
  }

  for (const auto& batch : stale) {
    try {
      legs_.DeleteLeg(batch.record_id, model::kLegVectors, batch.batch_id, batch.collection);
      ++report.batches;
    } catch (const std::exception& e) {
      STRATA_LOG_WARN("orphan batch sweep failed", {StringField("batch_id", batch.batch_id), StringField("error", e.what())});
    }
  }

  {
    auto tx      = repo_.Begin();
    report.blobs = repo_.DeleteOrphanBlobs(*tx, cutoff);
    tx->Commit();
  }

  if (report.batches > 0 || report.blobs > 0) {
    STRATA_LOG_INFO("orphans swept", {IntField("batches", static_cast<int64_t>(report.batches)),
                                      IntField("blobs", static_cast<int64_t>(report.blobs))});
  }
  return report;
}

} // namespace strata::coordinator
