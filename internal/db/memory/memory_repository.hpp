#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace dedup::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertContact(Transaction&, const model::ContactRecord&) override;
  std::optional<model::ContactRecord> GetContact(Transaction&, const std::string& id) override;
  std::vector<model::ContactRecord> ListContacts(Transaction&) override;
  Result DeleteContact(Transaction&, const std::string& id) override;
  uint64_t CountContacts(Transaction&) override;
  std::optional<model::SyncState> GetSyncState(Transaction&, const std::string& id) override;

  Result ReplaceEmails(Transaction&, const std::string& contact_id, const std::vector<std::string>& emails) override;
  Result ReplacePhones(Transaction&, const std::string& contact_id, const std::vector<model::PhoneRecord>& phones) override;
  std::vector<model::EmailRecord> ListEmails(Transaction&, const std::string& contact_id) override;
  std::vector<model::PhoneRecord> ListPhones(Transaction&, const std::string& contact_id) override;
  Result ReassignEmails(Transaction&, const std::string& from_contact_id, const std::string& to_contact_id) override;
  Result ReassignPhones(Transaction&, const std::string& from_contact_id, const std::string& to_contact_id) override;
  Result DeleteEmail(Transaction&, int64_t row_id) override;
  Result DeletePhone(Transaction&, int64_t row_id) override;

  Result ClearUnresolvedGroups(Transaction&) override;
  Result SetDuplicateGroup(Transaction&, const std::string& contact_id, const model::DuplicateGroup&) override;
  std::vector<std::string> ListGroupIds(Transaction&, model::DuplicateResolution) override;
  std::vector<model::ContactRecord> ListGroupMembers(Transaction&, const std::string& group_id) override;

private:
  friend class MemoryTransaction;

  // Child rows are keyed by row id so iteration follows insertion order.
  struct State {
    std::map<std::string, model::ContactRecord> contacts; // without child rows
    std::map<int64_t, model::EmailRecord> emails;
    std::map<int64_t, model::PhoneRecord> phones;
    int64_t next_email_id = 1;
    int64_t next_phone_id = 1;
  };

  static MemoryTransaction& TX(Transaction& t);
  static model::ContactRecord WithChildren(const State& state, const model::ContactRecord& contact);

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
