#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/vector/memory_vector_store.hpp"
#include "internal/vector/vector_store.hpp"

#if STRATA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/vector/sqlite_vector_store.hpp"
#endif

namespace {

using strata::vector::MemoryVectorStore;
using strata::vector::VectorFilter;
using strata::vector::VectorPoint;
using strata::vector::VectorStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                    name;
  std::function<std::shared_ptr<VectorStore>()>  make_store;
  std::function<bool()>                          supports_restart;
  std::function<void()>                          cleanup;
};

VectorPoint Point(const std::string& id, std::vector<float> v, const std::string& batch, uint32_t seq, const std::string& domain,
                  uint64_t ingested_at_ms) {
  VectorPoint p;
  p.id                     = id;
  p.vector                 = std::move(v);
  p.payload.record_id      = "record-" + batch;
  p.payload.batch_id       = batch;
  p.payload.chunk_sequence = seq;
  p.payload.word_count     = 3;
  p.payload.start_offset   = seq * 800;
  p.payload.domain         = domain;
  p.payload.content_type   = "book";
  p.payload.ingested_at_ms = ingested_at_ms;
  p.payload.text           = "chunk " + std::to_string(seq) + " of " + batch;
  return p;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void VerifyCollections(VectorStore& store) {
  assert(Throws<strata::util::NotFound>([&] { (void)store.Count("absent"); }));
  assert(Throws<strata::util::NotFound>([&] { (void)store.Search("absent", {1, 0, 0}, VectorFilter{}, 5); }));

  store.EnsureCollection("dims", 3);
  store.EnsureCollection("dims", 3);
  assert(store.Count("dims") == 0);
  assert(Throws<strata::util::InvalidState>([&] { store.EnsureCollection("dims", 4); }));

  assert(Throws<strata::util::ValidationError>([&] { store.Upsert("dims", {Point("bad", {1, 0}, "b", 0, "science", 1)}); }));
  assert(store.Count("dims") == 0);
}

void VerifySearchOrderingAndFilters(VectorStore& store) {
  store.EnsureCollection("chunks", 3);
  store.Upsert("chunks", {
                             Point("a0", {1, 0, 0}, "batch-a", 0, "science", 100),
                             Point("a1", {0.8f, 0.6f, 0}, "batch-a", 1, "science", 100),
                             Point("b0", {0, 1, 0}, "batch-b", 0, "poetry", 200),
                             Point("c0", {1, 0, 0}, "batch-c", 0, "science", 300),
                         });
  assert(store.Count("chunks") == 4);

  auto hits = store.Search("chunks", {1, 0, 0}, VectorFilter{}, 10);
  assert(hits.size() == 4);
  // equal scores break ties by id
  assert(hits[0].id == "a0" && hits[1].id == "c0");
  assert(hits[2].id == "a1");
  assert(hits[3].id == "b0");
  assert(hits[0].score > 0.999 && hits[0].score <= 1.0 + 1e-9);
  assert(hits[2].score > 0.79 && hits[2].score < 0.81);
  assert(hits[0].payload.record_id == "record-batch-a");
  assert(hits[0].payload.text == "chunk 0 of batch-a");

  hits = store.Search("chunks", {1, 0, 0}, VectorFilter{}, 2);
  assert(hits.size() == 2 && hits[1].id == "c0");

  VectorFilter poetry;
  poetry.domain = "poetry";
  hits          = store.Search("chunks", {1, 0, 0}, poetry, 10);
  assert(hits.size() == 1 && hits[0].id == "b0");

  VectorFilter window;
  window.created_after_ms  = 150;
  window.created_before_ms = 300;
  hits                     = store.Search("chunks", {0, 1, 0}, window, 10);
  assert(hits.size() == 1 && hits[0].id == "b0");

  // upsert is idempotent on point id
  store.Upsert("chunks", {Point("b0", {0, 0, 1}, "batch-b", 0, "poetry", 200)});
  assert(store.Count("chunks") == 4);
  assert(store.Retrieve("chunks", {"b0"})[0].vector[2] == 1.0f);
}

void VerifyRetrieveAndDelete(VectorStore& store) {
  store.EnsureCollection("legs", 2);
  store.Upsert("legs", {
                           Point("x0", {1, 0}, "batch-x", 0, "science", 1),
                           Point("x1", {0, 1}, "batch-x", 1, "science", 1),
                           Point("y0", {1, 1}, "batch-y", 0, "science", 1),
                       });

  auto got = store.Retrieve("legs", {"x1", "missing", "x0"});
  assert(got.size() == 2);
  assert(got[0].id == "x1" && got[1].id == "x0");
  assert(got[0].payload.start_offset == 800);
  assert(got[0].vector.size() == 2 && got[0].vector[1] == 1.0f);

  assert(store.DeleteByBatch("legs", "batch-x") == 2);
  assert(store.DeleteByBatch("legs", "batch-x") == 0);
  assert(store.Count("legs") == 1);
  assert(store.DeletePoints("legs", {"y0", "missing"}) == 1);
  assert(store.Count("legs") == 0);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }
  {
    auto store = backend.make_store();
    store->EnsureCollection("durable", 2);
    store->Upsert("durable", {Point("d0", {0.6f, 0.8f}, "batch-d", 0, "history", 7)});
  }
  auto store = backend.make_store();
  assert(store->Count("durable") == 1);
  auto got = store->Retrieve("durable", {"d0"});
  assert(got.size() == 1);
  assert(got[0].payload.domain == "history");
  assert(got[0].vector[1] == 0.8f);
  assert(Throws<strata::util::InvalidState>([&] { store->EnsureCollection("durable", 3); }));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<MemoryVectorStore>(); },
      .supports_restart = []() { return false; },
      .cleanup          = []() {},
  };
}

#if STRATA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("strata_integration_vectors_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::shared_ptr<VectorStore> {
    auto db    = std::make_shared<strata::db::sqlite::SqliteDB>(db_path);
    auto store = std::make_shared<strata::vector::SqliteVectorStore>(std::move(db));
    store->Bootstrap();
    return store;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running vector store suite: " << backend.name << "\n";
  {
    auto store = backend.make_store();
    VerifyCollections(*store);
    VerifySearchOrderingAndFilters(*store);
    VerifyRetrieveAndDelete(*store);
  }
  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STRATA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "strata_integration_vector_store_parity: pass\n";
  return 0;
}
