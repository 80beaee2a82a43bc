#pragma once

#include <cstdint>
#include <string>

namespace dedup::db::model {

struct PhoneRecord {
  int64_t     row_id = 0; // assigned by the store; insertion order
  std::string contact_id;
  std::string phone_number;
  std::string label;
};

} // namespace dedup::db::model
