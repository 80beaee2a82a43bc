#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/contact_record.hpp"
#include "internal/resolution/match_signal.hpp"
#include "internal/resolution/report.hpp"
#include "internal/sync/sync_engine.hpp"
#include "service_context.hpp"

namespace dedup::service {

struct FlagResult {
  std::vector<resolution::MatchSignal> signals;
  std::vector<resolution::Cluster>     clusters;
  uint64_t                             flagged_contacts = 0;
  uint64_t                             groups           = 0;
};

struct ResolveResult {
  uint64_t contacts_before = 0;
  uint64_t contacts_after  = 0;
  uint64_t merged_clusters = 0;
  uint64_t failed_clusters = 0;
};

struct PendingGroup {
  std::string                           group_id;
  std::vector<db::model::ContactRecord> members;
};

/*
  Workflow entry points: sync, analyze, flag, review and resolve.

  Every operation opens its own transactions; callers serialize passes.
*/
class DedupService {
 public:
  explicit DedupService(ServiceContext ctx);

  sync::SyncStats Sync(std::shared_ptr<sync::ContactSource> source, const std::function<bool()>& stop_requested = {});

  // Builds the report and writes it to dedup.report_path when set.
  resolution::DuplicateReport Analyze();

  // Re-assigns group ids to every unresolved contact in a current cluster.
  FlagResult Flag();

  // Merges every detected cluster.
  ResolveResult Resolve();

  // Merges every confirmed group into its recorded primary.
  ResolveResult ResolveConfirmed();

  std::vector<PendingGroup> ListPendingGroups();

  void ConfirmGroup(const std::string& group_id, const std::string& primary_contact_id);

  void RejectGroup(const std::string& group_id);

 private:
  uint64_t CountContacts();

  ServiceContext ctx_;
};

} // namespace dedup::service
