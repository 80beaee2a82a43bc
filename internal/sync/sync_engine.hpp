#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "internal/sync/contact_source.hpp"

namespace dedup::db {
class Repository;
}

namespace dedup::sync {

struct SyncOptions {
  uint64_t page_size        = 100;
  uint32_t max_concurrency  = 5;
  uint32_t chunk_multiplier = 2; // pages per chunk = max_concurrency * chunk_multiplier
};

struct SyncStats {
  uint64_t added     = 0;
  uint64_t updated   = 0;
  uint64_t unchanged = 0;
  uint64_t failed    = 0; // pages whose fetch or write failed
  uint64_t skipped   = 0; // records without an id
  bool     cancelled = false;
};

/*
  Pulls every upstream page into the repository.

  Fetches run concurrently, bounded by max_concurrency. Writes happen on the
  calling thread, one transaction per page, in page order. A record whose
  canonical hash matches the stored one is not touched. Updated records keep
  their duplicate review state. A page that fails to fetch or to write is
  counted under failed and leaves no rows behind. The run ends early once a
  whole chunk of pages comes back empty.
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<db::Repository> repo, std::shared_ptr<ContactSource> source, SyncOptions options = {});

  // stop_requested is polled before each fetch, from the fetch threads, and
  // between chunks; it must be safe to call concurrently.
  SyncStats Run(const std::function<bool()>& stop_requested = {});

 private:
  // Counts a failed page instead of throwing.
  void ApplyGuarded(const ContactPage& page, uint64_t offset, SyncStats& stats);

  void ApplyPage(const ContactPage& page, SyncStats& stats);

  std::shared_ptr<db::Repository> repo_;
  std::shared_ptr<ContactSource>  source_;
  SyncOptions                     options_;
};

} // namespace dedup::sync
