#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/vector/memory_vector_store.hpp"
#if STRATA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/vector/sqlite_vector_store.hpp"
#endif
#if STRATA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace strata::factory {

using observability::IntField;
using observability::StringField;

namespace {

struct BuiltRepository {
  std::shared_ptr<db::Repository> repository;
  db::sql::Dialect                dialect = db::sql::Dialect::kSqlite;
};

BuiltRepository BuildRepository(const strata::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STRATA_DB_SQLITE
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->Bootstrap();
    return {std::move(repository), db::sql::Dialect::kSqlite};
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STRATA_DB_POSTGRES
    auto pool       = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->Bootstrap();
    return {std::move(repository), db::sql::Dialect::kPostgres};
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return {std::make_shared<db::memory::MemoryRepository>(), db::sql::Dialect::kSqlite};
}

std::shared_ptr<vector::VectorStore> BuildVectorStore(const strata::runtime::config::RuntimeConfig& config) {
  const auto& vectors = config.vector_store();
  if (vectors.has_sqlite()) {
#if STRATA_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(vectors.sqlite().path());
    auto store     = std::make_shared<vector::SqliteVectorStore>(std::move(sqlite_db));
    store->Bootstrap();
    return store;
#else
    throw std::runtime_error("sqlite vector store requested but not enabled at build time");
#endif
  }
  return std::make_shared<vector::MemoryVectorStore>();
}

util::RetryPolicy ToRetryPolicy(const strata::runtime::config::RetryConfig& retry) {
  util::RetryPolicy policy;
  policy.max_attempts       = retry.max_attempts();
  policy.initial_backoff_ms = config::DurationMs(retry.initial_backoff());
  policy.multiplier         = retry.multiplier();
  policy.max_backoff_ms     = config::DurationMs(retry.max_backoff());
  return policy;
}

} // namespace

Engine::~Engine() {
  Stop();
}

void Engine::Start() {
  tracker->Start();
  migration_worker->Start();
  maintenance->Start();
}

void Engine::Stop() {
  if (maintenance) maintenance->Stop();
  if (migration_worker) migration_worker->Stop();
  if (tracker) tracker->Stop();
}

/*
    Build full engine dependency graph
*/
std::unique_ptr<Engine> Build(const strata::runtime::config::RuntimeConfig& config) {
  auto engine = std::make_unique<Engine>();

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto built         = BuildRepository(config);
  engine->repository = built.repository;
  engine->vectors    = BuildVectorStore(config);

  // ------------------------------------------------------------------
  // Pure components
  // ------------------------------------------------------------------
  engine->embedder   = std::make_unique<embedding::HashingEmbedder>(config.embedding().dimension());
  engine->classifier = std::make_unique<classifier::ContentClassifier>(config.classifier());
  engine->policy     = std::make_unique<placement::PlacementPolicy>(config.placement());

  const auto& coord = config.coordinator();
  engine->tables    = std::make_unique<schema::TableRegistry>(*engine->repository, schema::SchemaBuilder(built.dialect, coord.table_prefix()));

  engine->vector_pool = std::make_unique<util::WorkerPool>(coord.vector_workers());
  engine->query_pool  = std::make_unique<util::WorkerPool>(config.query().workers());

  // ------------------------------------------------------------------
  // Write path
  // ------------------------------------------------------------------
  const auto retry = ToRetryPolicy(coord.transient_retry());

  legs::LegStoreOptions leg_options;
  leg_options.collection    = config.vector_store().collection_prefix() + "_chunks";
  leg_options.chunk_size    = coord.chunk_size();
  leg_options.chunk_overlap = coord.chunk_overlap();
  leg_options.retry         = retry;
  engine->legs = std::make_unique<legs::LegStore>(*engine->repository, *engine->vectors, *engine->embedder, *engine->tables,
                                                  *engine->vector_pool, leg_options);

  consistency::ConsistencyOptions consistency_options;
  consistency_options.gc_grace_ms = config::DurationMs(config.consistency().gc_grace());
  consistency_options.retry       = retry;
  engine->mapper = std::make_shared<consistency::ConsistencyMapper>(*engine->repository, *engine->legs, consistency_options);

  engine->claims = std::make_unique<coordinator::LocatorClaims>();

  coordinator::CoordinatorOptions coordinator_options;
  coordinator_options.orphan_grace_ms = config::DurationMs(coord.orphan_grace());
  coordinator_options.preview_chars   = coord.preview_chars();
  engine->coordinator = std::make_shared<coordinator::StorageCoordinator>(*engine->repository, *engine->classifier, *engine->policy,
                                                                          *engine->legs, *engine->mapper, *engine->claims,
                                                                          coordinator_options);

  // ------------------------------------------------------------------
  // Read path and feedback loop
  // ------------------------------------------------------------------
  const auto& opt = config.optimizer();

  optimizer::TrackerOptions tracker_options;
  tracker_options.flush_interval_ms    = config::DurationMs(opt.flush_interval());
  tracker_options.sample_retention_ms  = config::DurationMs(opt.sample_retention());
  tracker_options.window_ms            = config::DurationMs(opt.window());
  tracker_options.latency_threshold_ms = opt.latency_threshold_ms();
  tracker_options.max_buffered_samples = opt.max_buffered_samples();
  engine->tracker = std::make_shared<optimizer::PerformanceTracker>(*engine->repository, tracker_options);

  const auto&         q = config.query();
  query::QueryOptions query_options;
  query_options.collection            = leg_options.collection;
  query_options.alpha                 = q.alpha();
  query_options.vector_top_k          = q.vector_top_k();
  query_options.min_vector_similarity = q.min_vector_similarity();
  query_options.subquery_timeout_ms   = config::DurationMs(q.subquery_timeout());
  query_options.default_deadline_ms   = config::DurationMs(q.default_deadline());
  query_options.default_limit         = q.default_limit();
  engine->planner = std::make_shared<query::QueryPlanner>(*engine->repository, *engine->vectors, *engine->embedder,
                                                          *engine->query_pool, engine->tracker.get(), query_options);

  engine->migrations = std::make_unique<migration::MigrationScheduler>(config.migration().max_per_second());

  optimizer::OptimizerOptions optimizer_options;
  optimizer_options.window_ms             = config::DurationMs(opt.window());
  optimizer_options.min_samples           = opt.min_samples();
  optimizer_options.latency_threshold_ms  = opt.latency_threshold_ms();
  optimizer_options.recommendation_ttl_ms = config::DurationMs(opt.recommendation_ttl());
  optimizer_options.max_dynamic_tables    = opt.max_dynamic_tables();
  engine->optimizer = std::make_shared<optimizer::Optimizer>(*engine->repository, *engine->policy, *engine->tables,
                                                             *engine->migrations, optimizer_options);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  const auto&                  rec = config.reconciliation();
  reconcile::ReconcilerOptions reconciler_options;
  reconciler_options.max_attempts       = rec.max_attempts();
  reconciler_options.initial_backoff_ms = config::DurationMs(rec.initial_backoff());
  reconciler_options.max_backoff_ms     = config::DurationMs(rec.max_backoff());
  engine->reconciler = std::make_unique<reconcile::Reconciler>(*engine->repository, *engine->legs, *engine->mapper, reconciler_options);

  engine->migration_worker = std::make_unique<migration::MigrationWorker>(*engine->migrations, *engine->mapper, config.migration().workers());

  engine->maintenance = std::make_unique<reconcile::MaintenanceWorker>();
  auto* e             = engine.get();
  const auto interval = config::DurationMs(rec.interval());
  e->maintenance->AddJob("reconcile", interval, [e](uint64_t now) { e->reconciler->RunOnce(now); });
  e->maintenance->AddJob("orphan_sweep", coordinator_options.orphan_grace_ms, [e](uint64_t now) { e->coordinator->SweepOrphans(now); });
  e->maintenance->AddJob("garbage_collect", interval, [e](uint64_t now) { e->mapper->CollectGarbage(now); });
  e->maintenance->AddJob("optimizer_evaluate", config::DurationMs(opt.evaluate_interval()), [e](uint64_t now) {
    e->optimizer->ExpireStale(now);
    e->optimizer->Evaluate(now);
  });
  e->maintenance->AddJob("sample_retention", config::DurationMs(opt.evaluate_interval()),
                         [e](uint64_t now) { e->tracker->SweepRetention(now); });

  // ------------------------------------------------------------------
  // Operator surface
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = engine->repository;
  ctx.coordinator = engine->coordinator;
  ctx.mapper      = engine->mapper;
  ctx.planner     = engine->planner;
  ctx.tracker     = engine->tracker;
  ctx.optimizer   = engine->optimizer;
  engine->service = std::make_shared<service::OperatorService>(ctx);

  STRATA_LOG_INFO("engine built", {StringField("database", config.database().has_sqlite()     ? "sqlite"
                                                           : config.database().has_postgres() ? "postgres"
                                                                                              : "memory"),
                                   StringField("vector_store", config.vector_store().has_sqlite() ? "sqlite" : "memory"),
                                   IntField("policy_version", engine->policy->LatestVersion())});
  return engine;
}

} // namespace strata::factory
