#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/contact_record.hpp"
#include "internal/resolution/match_signal.hpp"

namespace dedup::db {
class Repository;
class Transaction;
} // namespace dedup::db

namespace dedup::resolution {

// Child tables moved to the surviving contact during a merge.
enum class ChildRelation { kEmails, kPhones };

/*
  Collapses one duplicate cluster into a single contact.

  The whole merge runs in one transaction:
    1. pick the primary (explicit, or most complete; ties -> smallest id)
    2. fill the primary's empty fields from the other members
    3. move email/phone rows to the primary and drop duplicates,
       keeping the earliest row per key
    4. delete the other members

  Throws util::InvalidArgument for an empty cluster, a cluster with no
  stored members, or an explicit primary that is not a stored member.
*/
class Merger {
 public:
  explicit Merger(std::shared_ptr<db::Repository> repo);

  // Returns the surviving contact id.
  std::string Merge(const Cluster& contact_ids, const std::optional<std::string>& primary_id = std::nullopt);

 private:
  void Consolidate(db::Transaction& tx, ChildRelation relation, const std::string& primary_id, const std::vector<std::string>& others);
  void ConsolidateEmails(db::Transaction& tx, const std::string& primary_id, const std::vector<std::string>& others);
  void ConsolidatePhones(db::Transaction& tx, const std::string& primary_id, const std::vector<std::string>& others);

  std::shared_ptr<db::Repository> repo_;
};

// Number of non-empty scalar fields; used to pick the primary.
int CompletenessScore(const db::model::ContactRecord& contact);

} // namespace dedup::resolution
