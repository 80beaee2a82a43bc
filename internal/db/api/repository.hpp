#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/contact_record.hpp"

namespace dedup::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a contact deletes its email/phone rows
  - Child rows keep insertion order (row_id ascending)

  The DB is the source of truth for:
    contacts and their sync hash
    email / phone rows
    duplicate review state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Contacts
  // ---------------------------------------------------------------------

  // Insert or overwrite scalar, sync and duplicate columns. Child rows are
  // left alone; use ReplaceEmails/ReplacePhones for those.
  virtual Result UpsertContact(Transaction&, const model::ContactRecord&) = 0;

  // Loads the contact with its child rows.
  virtual std::optional<model::ContactRecord> GetContact(Transaction&, const std::string& id) = 0;

  // All contacts ordered by id, with child rows.
  virtual std::vector<model::ContactRecord> ListContacts(Transaction&) = 0;

  virtual Result DeleteContact(Transaction&, const std::string& id) = 0;

  virtual uint64_t CountContacts(Transaction&) = 0;

  virtual std::optional<model::SyncState> GetSyncState(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Child relations
  // ---------------------------------------------------------------------

  virtual Result ReplaceEmails(Transaction&, const std::string& contact_id, const std::vector<std::string>& emails) = 0;

  virtual Result ReplacePhones(Transaction&, const std::string& contact_id, const std::vector<model::PhoneRecord>& phones) = 0;

  virtual std::vector<model::EmailRecord> ListEmails(Transaction&, const std::string& contact_id) = 0;

  virtual std::vector<model::PhoneRecord> ListPhones(Transaction&, const std::string& contact_id) = 0;

  // Repoint every row owned by from_contact_id to to_contact_id.
  virtual Result ReassignEmails(Transaction&, const std::string& from_contact_id, const std::string& to_contact_id) = 0;

  virtual Result ReassignPhones(Transaction&, const std::string& from_contact_id, const std::string& to_contact_id) = 0;

  virtual Result DeleteEmail(Transaction&, int64_t row_id) = 0;

  virtual Result DeletePhone(Transaction&, int64_t row_id) = 0;

  // ---------------------------------------------------------------------
  // Duplicate groups
  // ---------------------------------------------------------------------

  // Drops group id and primary from every contact without a resolution.
  virtual Result ClearUnresolvedGroups(Transaction&) = 0;

  virtual Result SetDuplicateGroup(Transaction&, const std::string& contact_id, const model::DuplicateGroup&) = 0;

  // Distinct group ids whose members carry the given resolution, sorted.
  virtual std::vector<std::string> ListGroupIds(Transaction&, model::DuplicateResolution) = 0;

  // Members ordered by id, with child rows.
  virtual std::vector<model::ContactRecord> ListGroupMembers(Transaction&, const std::string& group_id) = 0;
};

} // namespace dedup::db
