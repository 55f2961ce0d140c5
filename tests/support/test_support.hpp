#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "internal/classifier/content_classifier.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/consistency/consistency_mapper.hpp"
#include "internal/coordinator/locator_claims.hpp"
#include "internal/coordinator/storage_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/legs/leg_store.hpp"
#include "internal/placement/placement_policy.hpp"
#include "internal/schema/table_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/worker_pool.hpp"
#include "internal/vector/memory_vector_store.hpp"

namespace strata::testing {

inline strata::runtime::config::RuntimeConfig DefaultConfig() {
  strata::runtime::config::RuntimeConfig cfg;
  config::ConfigLoader::ApplyDefaults(cfg);
  return cfg;
}

// Short backoffs so retry exhaustion stays fast.
inline util::RetryPolicy FastRetry() {
  return util::RetryPolicy{3, 1, 2.0, 4};
}

// Vector store whose upserts fail with a transient error while enabled.
class FailingVectorStore final : public vector::VectorStore {
 public:
  std::atomic<bool>     fail_upserts{true};
  std::atomic<uint32_t> upsert_calls{0};

  void EnsureCollection(const std::string& collection, uint32_t dimension) override {
    inner_.EnsureCollection(collection, dimension);
  }
  void Upsert(const std::string& collection, const std::vector<vector::VectorPoint>& points) override {
    ++upsert_calls;
    if (fail_upserts) throw util::TransientStoreError("vector store unavailable");
    inner_.Upsert(collection, points);
  }
  std::vector<vector::ScoredPoint> Search(const std::string& collection, const std::vector<float>& query,
                                          const vector::VectorFilter& filter, std::size_t top_k) override {
    return inner_.Search(collection, query, filter, top_k);
  }
  std::vector<vector::VectorPoint> Retrieve(const std::string& collection, const std::vector<std::string>& ids) override {
    return inner_.Retrieve(collection, ids);
  }
  uint64_t DeletePoints(const std::string& collection, const std::vector<std::string>& ids) override {
    return inner_.DeletePoints(collection, ids);
  }
  uint64_t DeleteByBatch(const std::string& collection, const std::string& batch_id) override {
    return inner_.DeleteByBatch(collection, batch_id);
  }
  uint64_t Count(const std::string& collection) override {
    return inner_.Count(collection);
  }

 private:
  vector::MemoryVectorStore inner_;
};

// Vector store whose searches stall for a fixed delay.
class SlowVectorStore final : public vector::VectorStore {
 public:
  explicit SlowVectorStore(std::chrono::milliseconds delay) : delay_(delay) {
  }

  void EnsureCollection(const std::string& collection, uint32_t dimension) override {
    inner_.EnsureCollection(collection, dimension);
  }
  void Upsert(const std::string& collection, const std::vector<vector::VectorPoint>& points) override {
    inner_.Upsert(collection, points);
  }
  std::vector<vector::ScoredPoint> Search(const std::string& collection, const std::vector<float>& query,
                                          const vector::VectorFilter& filter, std::size_t top_k) override {
    std::this_thread::sleep_for(delay_);
    return inner_.Search(collection, query, filter, top_k);
  }
  std::vector<vector::VectorPoint> Retrieve(const std::string& collection, const std::vector<std::string>& ids) override {
    return inner_.Retrieve(collection, ids);
  }
  uint64_t DeletePoints(const std::string& collection, const std::vector<std::string>& ids) override {
    return inner_.DeletePoints(collection, ids);
  }
  uint64_t DeleteByBatch(const std::string& collection, const std::string& batch_id) override {
    return inner_.DeleteByBatch(collection, batch_id);
  }
  uint64_t Count(const std::string& collection) override {
    return inner_.Count(collection);
  }

 private:
  std::chrono::milliseconds delay_;
  vector::MemoryVectorStore inner_;
};

// First rule whose keyword occurs in the text picks the vector.
class StubEmbedder final : public embedding::Embedder {
 public:
  using Rule = std::pair<std::string, std::vector<float>>;

  StubEmbedder(std::vector<Rule> rules, std::vector<float> fallback) : rules_(std::move(rules)), fallback_(std::move(fallback)) {
  }

  std::vector<float> Embed(std::string_view text) const override {
    for (const auto& [keyword, vec] : rules_) {
      if (text.find(keyword) != std::string_view::npos) return vec;
    }
    return fallback_;
  }
  uint32_t Dimension() const override {
    return static_cast<uint32_t>(fallback_.size());
  }
  std::string Model() const override {
    return "stub";
  }

 private:
  std::vector<Rule>  rules_;
  std::vector<float> fallback_;
};

/*
  Write path over the memory repository, wired the way the factory
  wires it. Members are ordered so the pool drains before the stores go.
*/
struct Harness {
  explicit Harness(std::shared_ptr<vector::VectorStore> vector_store = std::make_shared<vector::MemoryVectorStore>(),
                   std::shared_ptr<embedding::Embedder> embed     = std::make_shared<embedding::HashingEmbedder>(64),
                   strata::runtime::config::RuntimeConfig runtime = DefaultConfig())
      : cfg(std::move(runtime)),
        repo(std::make_shared<db::memory::MemoryRepository>()),
        vectors(std::move(vector_store)),
        embedder(std::move(embed)),
        classifier(cfg.classifier()),
        policy(cfg.placement()),
        tables(*repo, schema::SchemaBuilder(db::sql::Dialect::kSqlite, "dyn")),
        pool(4),
        legs(*repo, *vectors, *embedder, tables, pool, LegOptions()),
        mapper(*repo, legs, consistency::ConsistencyOptions{60 * 1000, FastRetry()}),
        coordinator(*repo, classifier, policy, legs, mapper, claims, coordinator::CoordinatorOptions{60 * 1000, 2000}) {
  }

  static legs::LegStoreOptions LegOptions() {
    legs::LegStoreOptions options;
    options.collection    = "test_chunks";
    options.chunk_size    = 1000;
    options.chunk_overlap = 200;
    options.retry         = FastRetry();
    return options;
  }

  std::optional<db::model::ContentRecord> Get(const std::string& id) {
    auto tx  = repo->Begin();
    auto rec = repo->GetRecord(*tx, id);
    tx->Rollback();
    return rec;
  }

  strata::runtime::config::RuntimeConfig       cfg;
  std::shared_ptr<db::memory::MemoryRepository> repo;
  std::shared_ptr<vector::VectorStore>          vectors;
  std::shared_ptr<embedding::Embedder>          embedder;
  classifier::ContentClassifier                 classifier;
  placement::PlacementPolicy                    policy;
  schema::TableRegistry                         tables;
  util::WorkerPool                              pool;
  legs::LegStore                                legs;
  consistency::ConsistencyMapper                mapper;
  coordinator::LocatorClaims                    claims;
  coordinator::StorageCoordinator               coordinator;
};

inline strata::engine::v1::IngestRequest MakeRequest(const std::string& locator, const std::string& text, const std::string& domain,
                                                     uint64_t declared_size = 0) {
  strata::engine::v1::IngestRequest req;
  req.set_source_locator(locator);
  req.set_raw_text(text);
  req.set_domain(domain);
  req.set_declared_size(declared_size);
  req.set_title(locator);
  return req;
}

// Prose with a low share of distinct informative words.
inline std::string RepetitiveText(std::size_t sentences) {
  std::string out;
  for (std::size_t i = 0; i < sentences; ++i) {
    out += "The market report shows that the market grew and the report was shared with the team. ";
  }
  return out;
}

// Technology prose of exactly `bytes` bytes.
inline std::string TechArticle(std::size_t bytes) {
  static const char* kSentences[] = {
      "Software engineers write programs that run on every computer. ",
      "A good algorithm keeps the digital pipeline fast and predictable. ",
      "Programming languages shape how teams reason about technology. ",
      "Compilers translate source code into instructions for the processor. ",
  };
  std::string out;
  for (std::size_t i = 0; out.size() < bytes; ++i) out += kSentences[i % 4];
  out.resize(bytes);
  return out;
}

// Every token distinct and informative.
inline std::string DistinctWords(std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) out += ' ';
    out += "term" + std::to_string(1000 + i);
  }
  return out;
}

} // namespace strata::testing
