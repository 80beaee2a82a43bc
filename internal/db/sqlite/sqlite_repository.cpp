#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <map>
#include <stdexcept>

namespace dedup::db::sqlite {

using dedup::db::ErrorCode;
using dedup::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

constexpr const char* kContactColumns =
    "id,first_name,last_name,job_title,linkedin,website,birthday,full_data,record_hash,last_synced_at,"
    "duplicate_group_id,duplicate_resolution,primary_contact_id";

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Stmt(st);
}

// Reads have no Result channel; a statement that cannot be prepared is a schema bug.
Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  auto st = Prepare(db, sql);
  if (!st) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::ContactRecord ReadContact(sqlite3_stmt* st) {
  model::ContactRecord r;
  r.id                           = ColText(st, 0);
  r.first_name                   = ColOptText(st, 1);
  r.last_name                    = ColOptText(st, 2);
  r.job_title                    = ColOptText(st, 3);
  r.linkedin                     = ColOptText(st, 4);
  r.website                      = ColOptText(st, 5);
  r.birthday                     = ColOptText(st, 6);
  r.full_data                    = ColText(st, 7);
  r.record_hash                  = ColText(st, 8);
  r.last_synced_at               = ColText(st, 9);
  r.duplicate.group_id           = ColOptText(st, 10);
  r.duplicate.resolution         = model::ParseResolution(ColText(st, 11));
  r.duplicate.primary_contact_id = ColOptText(st, 12);
  return r;
}

std::optional<std::string> ResolutionColumn(model::DuplicateResolution resolution) {
  if (resolution == model::DuplicateResolution::kUnset) return std::nullopt;
  return std::string(model::ToString(resolution));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertContact(Transaction& t, const model::ContactRecord& r) {
  auto* db = TX(t).Handle();

  // DO UPDATE keeps the row (and its child rows) in place; REPLACE would cascade.
  const std::string sql = std::string("INSERT INTO contacts(") + kContactColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) "
                          "ON CONFLICT(id) DO UPDATE SET first_name=excluded.first_name,last_name=excluded.last_name,"
                          "job_title=excluded.job_title,linkedin=excluded.linkedin,website=excluded.website,"
                          "birthday=excluded.birthday,full_data=excluded.full_data,record_hash=excluded.record_hash,"
                          "last_synced_at=excluded.last_synced_at,duplicate_group_id=excluded.duplicate_group_id,"
                          "duplicate_resolution=excluded.duplicate_resolution,primary_contact_id=excluded.primary_contact_id;";

  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindOptText(st.get(), 2, r.first_name);
  BindOptText(st.get(), 3, r.last_name);
  BindOptText(st.get(), 4, r.job_title);
  BindOptText(st.get(), 5, r.linkedin);
  BindOptText(st.get(), 6, r.website);
  BindOptText(st.get(), 7, r.birthday);
  BindText(st.get(), 8, r.full_data);
  BindText(st.get(), 9, r.record_hash);
  BindText(st.get(), 10, r.last_synced_at);
  BindOptText(st.get(), 11, r.duplicate.group_id);
  BindOptText(st.get(), 12, ResolutionColumn(r.duplicate.resolution));
  BindOptText(st.get(), 13, r.duplicate.primary_contact_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ContactRecord> SqliteRepository::QueryContacts(Transaction& t, const char* where_sql, const std::string* bind_value) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, std::string("SELECT ") + kContactColumns + " FROM contacts " + where_sql + " ORDER BY id;");
  if (bind_value) BindText(st.get(), 1, *bind_value);

  std::vector<model::ContactRecord> out;
  std::map<std::string, size_t>     index;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    index[ColText(st.get(), 0)] = out.size();
    out.push_back(ReadContact(st.get()));
  }
  if (out.empty()) return out;

  // child rows for the whole result set, in row order
  auto emails = PrepareOrThrow(db, "SELECT id,contact_id,email FROM emails ORDER BY id;");
  while (sqlite3_step(emails.get()) == SQLITE_ROW) {
    auto it = index.find(ColText(emails.get(), 1));
    if (it == index.end()) continue;
    out[it->second].emails.push_back({ColI64(emails.get(), 0), it->first, ColText(emails.get(), 2)});
  }

  auto phones = PrepareOrThrow(db, "SELECT id,contact_id,phone_number,label FROM phones ORDER BY id;");
  while (sqlite3_step(phones.get()) == SQLITE_ROW) {
    auto it = index.find(ColText(phones.get(), 1));
    if (it == index.end()) continue;
    out[it->second].phones.push_back({ColI64(phones.get(), 0), it->first, ColText(phones.get(), 2), ColText(phones.get(), 3)});
  }
  return out;
}

std::optional<model::ContactRecord> SqliteRepository::GetContact(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, std::string("SELECT ") + kContactColumns + " FROM contacts WHERE id=?;");
  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  auto r   = ReadContact(st.get());
  r.emails = ListEmails(t, id);
  r.phones = ListPhones(t, id);
  return r;
}

std::vector<model::ContactRecord> SqliteRepository::ListContacts(Transaction& t) {
  return QueryContacts(t, "", nullptr);
}

Result SqliteRepository::DeleteContact(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM contacts WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "contact not found: " + id);
  return Result::Ok();
}

uint64_t SqliteRepository::CountContacts(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT COUNT(*) FROM contacts;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error("sqlite count: " + std::string(sqlite3_errmsg(db)));
  }
  return static_cast<uint64_t>(ColI64(st.get(), 0));
}

std::optional<model::SyncState> SqliteRepository::GetSyncState(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT record_hash,duplicate_group_id,duplicate_resolution,primary_contact_id FROM contacts WHERE id=?;");
  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::SyncState state;
  state.record_hash                  = ColText(st.get(), 0);
  state.duplicate.group_id           = ColOptText(st.get(), 1);
  state.duplicate.resolution         = model::ParseResolution(ColText(st.get(), 2));
  state.duplicate.primary_contact_id = ColOptText(st.get(), 3);
  return state;
}

// ------------------------------------------------------------------
// Child relations
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceEmails(Transaction& t, const std::string& contact_id, const std::vector<std::string>& emails) {
  auto* db = TX(t).Handle();

  auto del = Prepare(db, "DELETE FROM emails WHERE contact_id=?;");
  if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(del.get(), 1, contact_id);
  if (auto r = Translate(db, sqlite3_step(del.get())); !r) return r;

  auto ins = Prepare(db, "INSERT INTO emails(contact_id,email) VALUES(?,?);");
  if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  for (const auto& email : emails) {
    sqlite3_reset(ins.get());
    BindText(ins.get(), 1, contact_id);
    BindText(ins.get(), 2, email);
    if (auto r = Translate(db, sqlite3_step(ins.get())); !r) return r;
  }
  return Result::Ok();
}

Result SqliteRepository::ReplacePhones(Transaction& t, const std::string& contact_id, const std::vector<model::PhoneRecord>& phones) {
  auto* db = TX(t).Handle();

  auto del = Prepare(db, "DELETE FROM phones WHERE contact_id=?;");
  if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(del.get(), 1, contact_id);
  if (auto r = Translate(db, sqlite3_step(del.get())); !r) return r;

  auto ins = Prepare(db, "INSERT INTO phones(contact_id,phone_number,label) VALUES(?,?,?);");
  if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  for (const auto& phone : phones) {
    sqlite3_reset(ins.get());
    BindText(ins.get(), 1, contact_id);
    BindText(ins.get(), 2, phone.phone_number);
    BindText(ins.get(), 3, phone.label);
    if (auto r = Translate(db, sqlite3_step(ins.get())); !r) return r;
  }
  return Result::Ok();
}

std::vector<model::EmailRecord> SqliteRepository::ListEmails(Transaction& t, const std::string& contact_id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT id,contact_id,email FROM emails WHERE contact_id=? ORDER BY id;");
  BindText(st.get(), 1, contact_id);

  std::vector<model::EmailRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColI64(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
  }
  return out;
}

std::vector<model::PhoneRecord> SqliteRepository::ListPhones(Transaction& t, const std::string& contact_id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT id,contact_id,phone_number,label FROM phones WHERE contact_id=? ORDER BY id;");
  BindText(st.get(), 1, contact_id);

  std::vector<model::PhoneRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColI64(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColText(st.get(), 3)});
  }
  return out;
}

Result SqliteRepository::ReassignEmails(Transaction& t, const std::string& from_contact_id, const std::string& to_contact_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE emails SET contact_id=? WHERE contact_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, to_contact_id);
  BindText(st.get(), 2, from_contact_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::ReassignPhones(Transaction& t, const std::string& from_contact_id, const std::string& to_contact_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE phones SET contact_id=? WHERE contact_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, to_contact_id);
  BindText(st.get(), 2, from_contact_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteEmail(Transaction& t, int64_t row_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM emails WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, row_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "email row not found: " + std::to_string(row_id));
  return Result::Ok();
}

Result SqliteRepository::DeletePhone(Transaction& t, int64_t row_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM phones WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, row_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "phone row not found: " + std::to_string(row_id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Duplicate groups
// ------------------------------------------------------------------

Result SqliteRepository::ClearUnresolvedGroups(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE contacts SET duplicate_group_id=NULL,primary_contact_id=NULL "
                    "WHERE duplicate_resolution IS NULL OR duplicate_resolution='';");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SetDuplicateGroup(Transaction& t, const std::string& contact_id, const model::DuplicateGroup& group) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE contacts SET duplicate_group_id=?,duplicate_resolution=?,primary_contact_id=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindOptText(st.get(), 1, group.group_id);
  BindOptText(st.get(), 2, ResolutionColumn(group.resolution));
  BindOptText(st.get(), 3, group.primary_contact_id);
  BindText(st.get(), 4, contact_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "contact not found: " + contact_id);
  return Result::Ok();
}

std::vector<std::string> SqliteRepository::ListGroupIds(Transaction& t, model::DuplicateResolution resolution) {
  auto* db = TX(t).Handle();

  Stmt st;
  if (resolution == model::DuplicateResolution::kUnset) {
    st = PrepareOrThrow(db,
                        "SELECT DISTINCT duplicate_group_id FROM contacts WHERE duplicate_group_id IS NOT NULL AND duplicate_group_id<>'' "
                        "AND (duplicate_resolution IS NULL OR duplicate_resolution='') ORDER BY duplicate_group_id;");
  } else {
    st = PrepareOrThrow(db,
                        "SELECT DISTINCT duplicate_group_id FROM contacts WHERE duplicate_group_id IS NOT NULL AND duplicate_group_id<>'' "
                        "AND duplicate_resolution=? ORDER BY duplicate_group_id;");
    BindText(st.get(), 1, std::string(model::ToString(resolution)));
  }

  std::vector<std::string> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

std::vector<model::ContactRecord> SqliteRepository::ListGroupMembers(Transaction& t, const std::string& group_id) {
  return QueryContacts(t, "WHERE duplicate_group_id=?", &group_id);
}

} // namespace dedup::db::sqlite
