#include "operator_service.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <string>
#include <type_traits>

#include "internal/consistency/consistency_mapper.hpp"
#include "internal/coordinator/storage_coordinator.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/optimizer/optimizer.hpp"
#include "internal/optimizer/performance_tracker.hpp"
#include "internal/query/query_planner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace strata::service {

namespace v1 = strata::engine::v1;

namespace {

constexpr std::size_t kRecentIncidents = 10;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* record_id, Fn&& fn) {
  strata::observability::SpanScope span(route);
  if (record_id) {
    span.SetAttribute("record.id", *record_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      strata::observability::Metrics::Instance().RecordRequest(route, true);
      strata::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      strata::observability::Metrics::Instance().RecordRequest(route, true);
      strata::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    STRATA_LOG_ERROR("RPC failed", {strata::observability::StringField("route", route), strata::observability::StringField("error", ex.what()),
                                    strata::observability::StringField("record_id", record_id ? *record_id : std::string())});
    strata::observability::Metrics::Instance().RecordRequest(route, false);
    strata::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

v1::ContentRecordView ToView(const db::model::ContentRecord& r) {
  v1::ContentRecordView view;
  view.set_id(r.id);
  view.set_source_locator(r.source_locator);
  view.set_title(r.title);
  view.set_author(r.author);
  view.set_domain(r.domain);
  view.set_content_type(r.content_type);
  view.set_declared_size(r.declared_size);
  view.set_content_hash(r.content_hash);

  auto* profile = view.mutable_profile();
  profile->set_semantic_complexity(r.semantic_complexity);
  profile->set_topic_coherence(r.topic_coherence);
  profile->set_information_density(r.information_density);
  profile->set_query_potential(r.query_potential);

  auto* placement = view.mutable_placement();
  placement->set_strategy(r.strategy);
  placement->set_confidence(r.confidence);
  placement->set_policy_version(r.policy_version);
  for (const auto& line : r.reasoning) placement->add_reasoning(line);

  view.set_status(r.status);
  view.set_needs_review(r.needs_review);

  auto* location = view.mutable_location();
  location->set_blob_hash(r.blob_hash);
  location->set_vector_batch_id(r.vector_batch_id);
  location->set_vector_collection(r.vector_collection);
  location->set_chunk_count(r.chunk_count);
  location->set_table_name(r.table_name);
  location->set_table_row_id(r.table_row_id);

  view.set_query_count(r.query_count);
  view.set_last_queried_at_ms(r.last_queried_at_ms);
  view.set_scrape_count(r.scrape_count);
  view.set_created_at_ms(r.created_at_ms);
  view.set_updated_at_ms(r.updated_at_ms);
  for (const auto& tag : r.tags) view.add_tags(tag);
  return view;
}

OperatorService::OperatorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::IngestResponse OperatorService::Ingest(const v1::IngestRequest& req) {
  return ObserveRpc("OperatorService.Ingest", nullptr, [&] { return ctx_.coordinator->Ingest(req); });
}

v1::QueryResponse OperatorService::Query(const v1::QueryRequest& req) {
  return ObserveRpc("OperatorService.Query", nullptr, [&] { return ctx_.planner->Query(req); });
}

v1::ListRecommendationsResponse OperatorService::ListRecommendations(const v1::ListRecommendationsRequest& req) {
  return ObserveRpc("OperatorService.ListRecommendations", nullptr, [&] {
    v1::ListRecommendationsResponse resp;
    for (const auto& rec : ctx_.optimizer->List(req.status())) {
      *resp.add_recommendations() = optimizer::ToProto(rec);
    }
    return resp;
  });
}

v1::ApplyRecommendationResponse OperatorService::ApplyRecommendation(const v1::ApplyRecommendationRequest& req) {
  return ObserveRpc("OperatorService.ApplyRecommendation", nullptr, [&] {
    if (util::Trim(req.id()).empty()) {
      throw util::ValidationError("apply recommendation: id is required");
    }
    return ctx_.optimizer->Apply(req.id(), util::NowMillis());
  });
}

v1::HealthReport OperatorService::Health() {
  return ObserveRpc("OperatorService.Health", nullptr, [&] {
    v1::HealthReport report;
    auto&            repo = *ctx_.repository;
    auto             tx   = repo.Begin();

    db::model::RecordFilter all;
    report.set_total_records(repo.CountRecords(*tx, all));

    db::model::RecordFilter by_status;
    by_status.status = v1::RECORD_STATUS_READY;
    report.set_ready_records(repo.CountRecords(*tx, by_status));
    by_status.status = v1::RECORD_STATUS_DEGRADED;
    report.set_degraded_records(repo.CountRecords(*tx, by_status));
    by_status.status = v1::RECORD_STATUS_MIGRATING;
    report.set_migrating_records(repo.CountRecords(*tx, by_status));

    db::model::RecordFilter review;
    review.needs_review_only = true;
    report.set_needs_review_records(repo.CountRecords(*tx, review));

    report.set_pending_repairs(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_PENDING, 0).size());
    report.set_fatal_repairs(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_FATAL, 0).size());
    report.set_pending_garbage(repo.ListGarbage(*tx, 0).size());
    report.set_pending_recommendations(repo.ListRecommendations(*tx, v1::RECOMMENDATION_STATUS_PENDING).size());

    const auto incidents = repo.ListIncidents(*tx, 0);
    report.set_incidents(incidents.size());
    for (std::size_t i = 0; i < incidents.size() && i < kRecentIncidents; ++i) {
      const auto& inc = incidents[i];
      report.add_recent_incidents(inc.kind + " " + inc.record_id + ": " + inc.detail);
    }
    tx->Rollback();

    strata::observability::Metrics::Instance().SetDegradedRecords(report.degraded_records());
    return report;
  });
}

v1::RecordStatusResponse OperatorService::GetRecordStatus(const v1::RecordStatusRequest& req) {
  return ObserveRpc("OperatorService.GetRecordStatus", &req.record_id(), [&] {
    auto& repo   = *ctx_.repository;
    auto  tx     = repo.Begin();
    auto  record = repo.GetRecord(*tx, req.record_id());
    if (!record) {
      throw util::NotFound("record " + req.record_id());
    }
    auto task = repo.GetRepairTask(*tx, req.record_id());
    tx->Rollback();

    v1::RecordStatusResponse resp;
    *resp.mutable_record() = ToView(*record);
    if (task) {
      resp.set_repair_state(task->state);
      resp.set_repair_attempts(task->attempts);
      resp.set_last_error(task->last_error);
    }
    return resp;
  });
}

void OperatorService::Annotate(const v1::AnnotateRequest& req) {
  ObserveRpc("OperatorService.Annotate", &req.record_id(), [&] {
    if (util::Trim(req.record_id()).empty() || util::Trim(req.agent()).empty()) {
      throw util::ValidationError("annotate: record_id and agent are required");
    }
    google::protobuf::Struct parsed;
    auto                     status = google::protobuf::util::JsonStringToMessage(req.json(), &parsed);
    if (!status.ok()) {
      throw util::ValidationError("annotate: json must be a JSON object: " + std::string(status.message()));
    }

    db::model::Annotation annotation;
    annotation.record_id     = req.record_id();
    annotation.agent         = req.agent();
    annotation.json          = req.json();
    annotation.updated_at_ms = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertAnnotation(*tx, annotation), "annotate " + req.record_id());
    tx->Commit();
  });
}

v1::AnalysisView OperatorService::ReadForAnalysis(const v1::RecordStatusRequest& req) {
  return ObserveRpc("OperatorService.ReadForAnalysis", &req.record_id(), [&] {
    auto content = ctx_.mapper->ReadForAnalysis(req.record_id());

    v1::AnalysisView view;
    *view.mutable_record() = ToView(content.record);
    if (content.content) {
      view.set_content(*content.content);
      view.set_content_available(true);
    }
    for (const auto& [agent, json] : content.annotations) {
      (*view.mutable_annotations())[agent] = json;
    }
    return view;
  });
}

v1::StorageAnalytics OperatorService::StorageAnalytics() {
  return ObserveRpc("OperatorService.StorageAnalytics", nullptr, [&] { return ctx_.optimizer->Analytics(); });
}

v1::PerformanceReport OperatorService::PerformanceReport() {
  return ObserveRpc("OperatorService.PerformanceReport", nullptr, [&] { return ctx_.tracker->Report(util::NowMillis()); });
}

} // namespace strata::service
