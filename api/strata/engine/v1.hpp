#pragma once

#include "strata/engine/core/v1/types.pb.h"
#include "strata/engine/core/v1/ingest.pb.h"
#include "strata/engine/core/v1/query.pb.h"
#include "strata/engine/core/v1/optimization.pb.h"

namespace strata::engine::v1 {
using namespace ::strata::engine::core::v1;
}
