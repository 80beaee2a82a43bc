#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/contact_record.hpp"

namespace dedup::sync {

/*
  Upstream record <-> ContactRecord.

  Upstream records arrive as JSON objects held in protobuf Struct. The
  canonical form (sorted keys, compact separators, integral numbers without
  a fraction) is what gets hashed and stored as full_data, so two payloads
  that differ only in key order hash the same.
*/

std::string CanonicalJson(const google::protobuf::Struct& record);
std::string CanonicalJson(const google::protobuf::Value& value);

// Lowercase hex SHA-256 of CanonicalJson(record).
std::string RecordHash(const google::protobuf::Struct& record);

// "id" as text; integral numbers are accepted. nullopt when missing or empty.
std::optional<std::string> RecordId(const google::protobuf::Struct& record);

// Scalar fields, emails[].email, phones[].phone_number/label, birthday,
// full_data and record_hash. Throws util::InvalidArgument without an id.
db::model::ContactRecord DecodeContact(const google::protobuf::Struct& record, const std::string& synced_at);

} // namespace dedup::sync
