#pragma once

#include <string>

#include "internal/sync/contact_source.hpp"

namespace dedup::sync {

/*
  Serves contacts from a JSON export.

  Accepts either a top-level array of contact objects or an object with a
  "contacts" array (and optional "total"). A total above the number of
  listed contacts is clamped; a negative or fractional one is rejected.
  The file is read once.
*/
class JsonFileSource final : public ContactSource {
 public:
  explicit JsonFileSource(const std::string& path);

  ContactPage FetchPage(uint64_t offset, uint64_t limit) override;

 private:
  std::vector<google::protobuf::Struct> contacts_;
  uint64_t                              total_ = 0;
};

// Parses the same document shapes from a string.
std::vector<google::protobuf::Struct> ParseContactDocument(const std::string& json, uint64_t* total);

} // namespace dedup::sync
