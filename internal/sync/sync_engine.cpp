#include "sync_engine.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <stdexcept>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/fetch_limiter.hpp"
#include "internal/sync/record_codec.hpp"
#include "internal/util/time.hpp"

namespace dedup::sync {

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + result.message);
  }
}

bool StopRequested(const std::function<bool()>& stop_requested) {
  return stop_requested && stop_requested();
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<db::Repository> repo, std::shared_ptr<ContactSource> source, SyncOptions options)
    : repo_(std::move(repo)), source_(std::move(source)), options_(options) {
  if (!repo_) throw std::invalid_argument("SyncEngine: repository is null");
  if (!source_) throw std::invalid_argument("SyncEngine: source is null");
  if (options_.page_size == 0) options_.page_size = 100;
  if (options_.max_concurrency == 0) options_.max_concurrency = 5;
  if (options_.chunk_multiplier == 0) options_.chunk_multiplier = 2;
}

SyncStats SyncEngine::Run(const std::function<bool()>& stop_requested) {
  SyncStats stats;

  // probe for the upstream total
  const auto probe = source_->FetchPage(0, 1);
  const auto total = probe.total;

  DEDUP_LOG_INFO("Sync started", {observability::IntField("total", static_cast<int64_t>(total)),
                                  observability::IntField("page_size", static_cast<int64_t>(options_.page_size))});

  if (total == 0) {
    // upstream did not report a total; keep whatever the probe returned
    if (!probe.contacts.empty()) ApplyGuarded(probe, 0, stats);
  } else {
    FetchLimiter limiter(options_.max_concurrency);
    const uint64_t pages = total / options_.page_size + (total % options_.page_size != 0 ? 1 : 0);
    const uint64_t chunk = static_cast<uint64_t>(options_.max_concurrency) * options_.chunk_multiplier;

    for (uint64_t begin = 0; begin < pages; begin += chunk) {
      if (StopRequested(stop_requested)) {
        stats.cancelled = true;
        break;
      }

      const uint64_t end = std::min(pages, begin + chunk);

      std::vector<std::future<std::optional<ContactPage>>> fetches;
      fetches.reserve(static_cast<size_t>(end - begin));
      for (uint64_t page = begin; page < end; ++page) {
        const uint64_t offset = page * options_.page_size;
        fetches.push_back(std::async(std::launch::async, [this, &limiter, &stop_requested, offset]() -> std::optional<ContactPage> {
          FetchPermit permit(limiter);
          if (StopRequested(stop_requested)) return std::nullopt;
          return source_->FetchPage(offset, options_.page_size);
        }));
      }

      // fan in, in page order
      bool exhausted = true;
      for (size_t i = 0; i < fetches.size(); ++i) {
        const uint64_t offset = (begin + i) * options_.page_size;
        std::optional<ContactPage> page;
        try {
          page = fetches[i].get();
        } catch (const std::exception& e) {
          exhausted = false;
          ++stats.failed;
          DEDUP_LOG_WARN("Failed to sync page", {observability::IntField("offset", static_cast<int64_t>(offset)),
                                                  observability::StringField("error", e.what())});
          continue;
        }
        if (!page) {
          stats.cancelled = true;
          continue;
        }
        if (!page->contacts.empty()) exhausted = false;
        ApplyGuarded(*page, offset, stats);
      }

      if (stats.cancelled) break;
      if (exhausted) {
        // the declared total overstated what upstream holds
        DEDUP_LOG_WARN("Upstream exhausted before declared total", {observability::IntField("total", static_cast<int64_t>(total)),
                                                                    observability::IntField("offset", static_cast<int64_t>(begin * options_.page_size))});
        break;
      }
    }
  }

  DEDUP_LOG_INFO("Sync finished", {observability::IntField("added", static_cast<int64_t>(stats.added)),
                                   observability::IntField("updated", static_cast<int64_t>(stats.updated)),
                                   observability::IntField("unchanged", static_cast<int64_t>(stats.unchanged)),
                                   observability::IntField("failed", static_cast<int64_t>(stats.failed)),
                                   observability::IntField("skipped", static_cast<int64_t>(stats.skipped)),
                                   observability::BoolField("cancelled", stats.cancelled)});
  return stats;
}

void SyncEngine::ApplyGuarded(const ContactPage& page, uint64_t offset, SyncStats& stats) {
  try {
    ApplyPage(page, stats);
  } catch (const std::exception& e) {
    ++stats.failed;
    DEDUP_LOG_WARN("Failed to sync page", {observability::IntField("offset", static_cast<int64_t>(offset)),
                                            observability::StringField("error", e.what())});
  }
}

void SyncEngine::ApplyPage(const ContactPage& page, SyncStats& stats) {
  const auto synced_at = util::ToIso8601(util::Now());

  SyncStats delta;
  auto      tx = repo_->Begin();

  for (const auto& record : page.contacts) {
    if (!RecordId(record)) {
      ++delta.skipped;
      continue;
    }

    auto contact = DecodeContact(record, synced_at);
    auto state   = repo_->GetSyncState(*tx, contact.id);

    if (state && state->record_hash == contact.record_hash) {
      ++delta.unchanged;
      continue;
    }

    if (state) {
      contact.duplicate = state->duplicate;
      ++delta.updated;
    } else {
      ++delta.added;
    }

    Check(repo_->UpsertContact(*tx, contact), "upsert contact " + contact.id);

    std::vector<std::string> emails;
    emails.reserve(contact.emails.size());
    for (const auto& email : contact.emails) {
      if (!email.email.empty()) emails.push_back(email.email);
    }
    Check(repo_->ReplaceEmails(*tx, contact.id, emails), "replace emails of " + contact.id);

    std::vector<db::model::PhoneRecord> phones;
    for (const auto& phone : contact.phones) {
      if (!phone.phone_number.empty()) phones.push_back(phone);
    }
    Check(repo_->ReplacePhones(*tx, contact.id, phones), "replace phones of " + contact.id);
  }

  tx->Commit();

  // counted only once the page is durable
  stats.added += delta.added;
  stats.updated += delta.updated;
  stats.unchanged += delta.unchanged;
  stats.skipped += delta.skipped;
}

} // namespace dedup::sync
