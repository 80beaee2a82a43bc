#include "factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace dedup::factory {

namespace {

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS contacts (id TEXT PRIMARY KEY, first_name TEXT, last_name TEXT, job_title TEXT, linkedin TEXT, website TEXT, birthday TEXT, full_data TEXT NOT NULL DEFAULT '', record_hash TEXT NOT NULL DEFAULT '', last_synced_at TEXT NOT NULL DEFAULT '', duplicate_group_id TEXT, duplicate_resolution TEXT, primary_contact_id TEXT);",
      "CREATE TABLE IF NOT EXISTS emails (id INTEGER PRIMARY KEY AUTOINCREMENT, contact_id TEXT NOT NULL REFERENCES contacts(id) ON DELETE CASCADE, email TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS phones (id INTEGER PRIMARY KEY AUTOINCREMENT, contact_id TEXT NOT NULL REFERENCES contacts(id) ON DELETE CASCADE, phone_number TEXT NOT NULL, label TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_emails_contact_id ON emails(contact_id);",
      "CREATE INDEX IF NOT EXISTS idx_phones_contact_id ON phones(contact_id);",
      "CREATE INDEX IF NOT EXISTS idx_contacts_duplicate_group_id ON contacts(duplicate_group_id);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,first_name,last_name,job_title,linkedin,website,birthday,full_data,record_hash,last_synced_at,"
                  "duplicate_group_id,duplicate_resolution,primary_contact_id FROM contacts LIMIT 1;");
  sqlite_db->Exec("SELECT id,contact_id,email FROM emails LIMIT 1;");
  sqlite_db->Exec("SELECT id,contact_id,phone_number,label FROM phones LIMIT 1;");
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const dedup::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite    = database.sqlite();
    const int   busy_ms   = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms()) : 5000;
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_ms);
    BootstrapSqliteSchema(sqlite_db);

    DEDUP_LOG_INFO("Opened contact store", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  DEDUP_LOG_INFO("Opened contact store", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const dedup::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);

  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.config     = config;

  app.dedup_service = std::make_shared<service::DedupService>(std::move(ctx));
  return app;
}

} // namespace dedup::factory
