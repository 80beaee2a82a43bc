#pragma once

#include <cstdint>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace dedup::sync {

struct ContactPage {
  uint64_t                               total = 0; // upstream total at fetch time
  std::vector<google::protobuf::Struct> contacts;
};

/*
  Paged upstream of contact records.

  FetchPage may be called from several threads at once and reports
  failures by throwing.
*/
class ContactSource {
 public:
  virtual ~ContactSource() = default;

  virtual ContactPage FetchPage(uint64_t offset, uint64_t limit) = 0;
};

} // namespace dedup::sync
