#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dedup::db::sqlite {

/*
  SQLite-backed repository.

  Expects the contacts/emails/phones schema created by the composition
  root; see factory BootstrapSqliteSchema.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::ContactRecord> QueryContacts(Transaction& t, const char* where_sql, const std::string* bind_value);

  std::shared_ptr<SqliteDB> db_;
};

}
