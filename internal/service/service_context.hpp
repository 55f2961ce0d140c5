#pragma once

#include <memory>

namespace strata::db {
class Repository;
}
namespace strata::coordinator {
class StorageCoordinator;
}
namespace strata::consistency {
class ConsistencyMapper;
}
namespace strata::query {
class QueryPlanner;
}
namespace strata::optimizer {
class PerformanceTracker;
class Optimizer;
}

namespace strata::service {

/*
  Dependency container shared by the operator surface.
*/
struct ServiceContext {
  std::shared_ptr<strata::db::Repository>                 repository;
  std::shared_ptr<strata::coordinator::StorageCoordinator> coordinator;
  std::shared_ptr<strata::consistency::ConsistencyMapper>  mapper;
  std::shared_ptr<strata::query::QueryPlanner>             planner;
  std::shared_ptr<strata::optimizer::PerformanceTracker>   tracker;
  std::shared_ptr<strata::optimizer::Optimizer>            optimizer;
};

} // namespace strata::service
