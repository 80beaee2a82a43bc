#include "merger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace dedup::resolution {

namespace {

using db::model::ContactRecord;

bool NonEmpty(const std::optional<std::string>& value) {
  return value && !value->empty();
}

void CoalesceNonEmpty(std::optional<std::string>& target, const std::optional<std::string>& donor) {
  if (!NonEmpty(target) && NonEmpty(donor)) target = donor;
}

void Check(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + result.message);
  }
}

} // namespace

int CompletenessScore(const ContactRecord& contact) {
  int score = 0;
  for (const auto* field : {&contact.first_name, &contact.last_name, &contact.job_title, &contact.linkedin, &contact.website, &contact.birthday}) {
    if (NonEmpty(*field)) ++score;
  }
  if (!contact.full_data.empty()) ++score;
  return score;
}

Merger::Merger(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

std::string Merger::Merge(const Cluster& contact_ids, const std::optional<std::string>& primary_id) {
  if (contact_ids.empty()) {
    throw util::InvalidArgument("No contact IDs provided");
  }

  auto tx = repo_->Begin();

  std::vector<ContactRecord> members;
  std::set<std::string>      seen;
  for (const auto& id : contact_ids) {
    if (!seen.insert(id).second) continue;
    if (auto contact = repo_->GetContact(*tx, id)) members.push_back(std::move(*contact));
  }
  if (members.empty()) {
    throw util::InvalidArgument("Contacts not found in storage");
  }

  // most complete first, ties by id
  std::stable_sort(members.begin(), members.end(), [](const ContactRecord& a, const ContactRecord& b) {
    const int sa = CompletenessScore(a);
    const int sb = CompletenessScore(b);
    return sa != sb ? sa > sb : a.id < b.id;
  });

  if (primary_id) {
    auto it = std::find_if(members.begin(), members.end(), [&](const ContactRecord& c) { return c.id == *primary_id; });
    if (it == members.end()) {
      throw util::InvalidArgument("Primary ID " + *primary_id + " not found in contact cluster");
    }
    std::rotate(members.begin(), it, it + 1);
  }

  ContactRecord merged = members.front();
  for (size_t i = 1; i < members.size(); ++i) {
    const auto& donor = members[i];
    CoalesceNonEmpty(merged.first_name, donor.first_name);
    CoalesceNonEmpty(merged.last_name, donor.last_name);
    CoalesceNonEmpty(merged.job_title, donor.job_title);
    CoalesceNonEmpty(merged.linkedin, donor.linkedin);
    CoalesceNonEmpty(merged.website, donor.website);
    CoalesceNonEmpty(merged.birthday, donor.birthday);
    // the snapshot and its hash travel together
    if (merged.full_data.empty() && !donor.full_data.empty()) {
      merged.full_data   = donor.full_data;
      merged.record_hash = donor.record_hash;
    }
  }
  Check(repo_->UpsertContact(*tx, merged), "update primary " + merged.id);

  std::vector<std::string> others;
  for (size_t i = 1; i < members.size(); ++i) others.push_back(members[i].id);

  Consolidate(*tx, ChildRelation::kEmails, merged.id, others);
  Consolidate(*tx, ChildRelation::kPhones, merged.id, others);

  for (const auto& id : others) {
    Check(repo_->DeleteContact(*tx, id), "delete merged contact " + id);
  }

  tx->Commit();

  DEDUP_LOG_DEBUG("Merged cluster", {dedup::observability::StringField("primary_id", merged.id),
                                     dedup::observability::IntField("merged", static_cast<int64_t>(others.size()))});
  return merged.id;
}

void Merger::Consolidate(db::Transaction& tx, ChildRelation relation, const std::string& primary_id, const std::vector<std::string>& others) {
  switch (relation) {
    case ChildRelation::kEmails:
      ConsolidateEmails(tx, primary_id, others);
      return;
    case ChildRelation::kPhones:
      ConsolidatePhones(tx, primary_id, others);
      return;
  }
}

void Merger::ConsolidateEmails(db::Transaction& tx, const std::string& primary_id, const std::vector<std::string>& others) {
  for (const auto& id : others) {
    Check(repo_->ReassignEmails(tx, id, primary_id), "reassign emails of " + id);
  }

  // rows come back in row_id order, so the first row per key is the earliest
  std::set<std::string> keys;
  for (const auto& row : repo_->ListEmails(tx, primary_id)) {
    if (!keys.insert(util::AsciiLower(row.email)).second) {
      Check(repo_->DeleteEmail(tx, row.row_id), "delete duplicate email " + row.email);
    }
  }
}

void Merger::ConsolidatePhones(db::Transaction& tx, const std::string& primary_id, const std::vector<std::string>& others) {
  for (const auto& id : others) {
    Check(repo_->ReassignPhones(tx, id, primary_id), "reassign phones of " + id);
  }

  // exact string match; differently formatted equal numbers both survive
  std::set<std::string> keys;
  for (const auto& row : repo_->ListPhones(tx, primary_id)) {
    if (!keys.insert(row.phone_number).second) {
      Check(repo_->DeletePhone(tx, row.row_id), "delete duplicate phone " + row.phone_number);
    }
  }
}

} // namespace dedup::resolution
