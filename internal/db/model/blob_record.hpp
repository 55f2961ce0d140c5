#pragma once

#include <cstdint>
#include <string>

namespace strata::db::model {

/*
  Full content body.

  Keyed by (owner_record_id, content_hash); inserting an existing key is
  a no-op so retried writes never create a second blob.
*/

struct BlobRecord {
  std::string owner_record_id;
  std::string content_hash;

  std::string body;
  uint64_t    size_bytes = 0;

  // optional structured chunks, JSON array of {seq, start, length}
  std::string chunks_json;

  uint64_t created_at_ms = 0;
};

} // namespace strata::db::model
