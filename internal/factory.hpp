#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/classifier/content_classifier.hpp"
#include "internal/consistency/consistency_mapper.hpp"
#include "internal/coordinator/locator_claims.hpp"
#include "internal/coordinator/storage_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedder.hpp"
#include "internal/legs/leg_store.hpp"
#include "internal/migration/migration_scheduler.hpp"
#include "internal/migration/migration_worker.hpp"
#include "internal/optimizer/optimizer.hpp"
#include "internal/optimizer/performance_tracker.hpp"
#include "internal/placement/placement_policy.hpp"
#include "internal/query/query_planner.hpp"
#include "internal/reconcile/maintenance_worker.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/schema/table_registry.hpp"
#include "internal/service/operator_service.hpp"
#include "internal/util/worker_pool.hpp"
#include "internal/vector/vector_store.hpp"

namespace strata::factory {

/*
  Engine

  Owns every long-lived component of one engine instance.

  NOTE:
  Members are declared in dependency order; destruction runs in reverse,
  so background threads and pools stop before the stores they use.
*/
struct Engine {
  std::shared_ptr<db::Repository>      repository;
  std::shared_ptr<vector::VectorStore> vectors;

  std::unique_ptr<embedding::Embedder>             embedder;
  std::unique_ptr<classifier::ContentClassifier>   classifier;
  std::unique_ptr<placement::PlacementPolicy>      policy;
  std::unique_ptr<schema::TableRegistry>           tables;
  std::unique_ptr<util::WorkerPool>                vector_pool;
  std::unique_ptr<util::WorkerPool>                query_pool;
  std::unique_ptr<legs::LegStore>                  legs;
  std::shared_ptr<consistency::ConsistencyMapper>  mapper;
  std::unique_ptr<coordinator::LocatorClaims>      claims;
  std::shared_ptr<coordinator::StorageCoordinator> coordinator;
  std::shared_ptr<optimizer::PerformanceTracker>   tracker;
  std::shared_ptr<query::QueryPlanner>             planner;
  std::unique_ptr<migration::MigrationScheduler>   migrations;
  std::shared_ptr<optimizer::Optimizer>            optimizer;
  std::unique_ptr<reconcile::Reconciler>           reconciler;
  std::unique_ptr<migration::MigrationWorker>      migration_worker;
  std::unique_ptr<reconcile::MaintenanceWorker>    maintenance;

  std::shared_ptr<service::OperatorService> service;

  Engine() = default;
  ~Engine();

  Engine(const Engine&)            = delete;
  Engine& operator=(const Engine&) = delete;

  // Starts the tracker flush thread, migration workers and maintenance jobs.
  void Start();
  void Stop();
};

/*
  Build

  Constructs the entire engine based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
std::unique_ptr<Engine> Build(const strata::runtime::config::RuntimeConfig& config);

} // namespace strata::factory
