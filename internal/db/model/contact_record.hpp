#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/duplicate_group.hpp"
#include "internal/db/model/email_record.hpp"
#include "internal/db/model/phone_record.hpp"

namespace dedup::db::model {

/*
  Persistent contact row plus its child rows.

  IMPORTANT:
  - id is the stable upstream id and the only key.
  - record_hash is always the digest of full_data; the pair moves together.
  - duplicate is owned by the flag/review workflow, never by sync.
*/

struct ContactRecord {
  std::string id;

  std::optional<std::string> first_name;
  std::optional<std::string> last_name;
  std::optional<std::string> job_title;
  std::optional<std::string> linkedin;
  std::optional<std::string> website;
  std::optional<std::string> birthday; // YYYY-MM-DD

  std::string full_data; // canonical JSON snapshot of the source payload
  std::string record_hash;
  std::string last_synced_at;

  DuplicateGroup duplicate;

  // Ordered by row id. Populated on reads; UpsertContact ignores them.
  std::vector<EmailRecord> emails;
  std::vector<PhoneRecord> phones;
};

// Fields a sync pass needs before deciding whether to write.
struct SyncState {
  std::string    record_hash;
  DuplicateGroup duplicate;
};

} // namespace dedup::db::model
