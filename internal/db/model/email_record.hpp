#pragma once

#include <cstdint>
#include <string>

namespace dedup::db::model {

struct EmailRecord {
  int64_t     row_id = 0; // assigned by the store; insertion order
  std::string contact_id;
  std::string email;
};

} // namespace dedup::db::model
