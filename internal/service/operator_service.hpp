#pragma once

#include <cstddef>

#include "internal/db/model/content_record.hpp"
#include "service_context.hpp"
#include "strata/engine/v1.hpp"

namespace strata::service {

/*
  In-process operator surface.

  Every call is traced, counted and timed under "OperatorService.<Name>";
  failures are logged and rethrown unchanged.
*/
class OperatorService {
 public:
  explicit OperatorService(ServiceContext ctx);

  strata::engine::v1::IngestResponse Ingest(const strata::engine::v1::IngestRequest& req);

  strata::engine::v1::QueryResponse Query(const strata::engine::v1::QueryRequest& req);

  strata::engine::v1::ListRecommendationsResponse ListRecommendations(const strata::engine::v1::ListRecommendationsRequest& req);

  strata::engine::v1::ApplyRecommendationResponse ApplyRecommendation(const strata::engine::v1::ApplyRecommendationRequest& req);

  strata::engine::v1::HealthReport Health();

  strata::engine::v1::RecordStatusResponse GetRecordStatus(const strata::engine::v1::RecordStatusRequest& req);

  void Annotate(const strata::engine::v1::AnnotateRequest& req);

  strata::engine::v1::AnalysisView ReadForAnalysis(const strata::engine::v1::RecordStatusRequest& req);

  strata::engine::v1::StorageAnalytics StorageAnalytics();

  strata::engine::v1::PerformanceReport PerformanceReport();

 private:
  ServiceContext ctx_;
};

// Record row to its wire form.
strata::engine::v1::ContentRecordView ToView(const strata::db::model::ContentRecord& record);

} // namespace strata::service
