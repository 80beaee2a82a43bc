#include "dedup_service.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolution/detectors.hpp"
#include "internal/resolution/merger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dedup::service {

using db::model::DuplicateGroup;
using db::model::DuplicateResolution;
using observability::IntField;
using observability::StringField;

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (!result) {
    throw std::runtime_error(what + ": " + std::string(db::ToString(result.code)) + ": " + result.message);
  }
}

constexpr double kDefaultFlagThreshold = 0.98;

double FuzzyThreshold(const runtime::config::RuntimeConfig& config) {
  const auto threshold = config.dedup().fuzzy_threshold();
  return threshold > 0 ? threshold : kDefaultFlagThreshold;
}

} // namespace

DedupService::DedupService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) throw std::invalid_argument("DedupService: repository is null");
}

uint64_t DedupService::CountContacts() {
  auto       tx    = ctx_.repository->Begin();
  const auto count = ctx_.repository->CountContacts(*tx);
  tx->Commit();
  return count;
}

sync::SyncStats DedupService::Sync(std::shared_ptr<sync::ContactSource> source, const std::function<bool()>& stop_requested) {
  const auto&       cfg = ctx_.config.sync();
  sync::SyncOptions options;
  if (cfg.page_size() > 0) options.page_size = cfg.page_size();
  if (cfg.max_concurrency() > 0) options.max_concurrency = cfg.max_concurrency();
  if (cfg.chunk_multiplier() > 0) options.chunk_multiplier = cfg.chunk_multiplier();

  sync::SyncEngine engine(ctx_.repository, std::move(source), options);
  return engine.Run(stop_requested);
}

resolution::DuplicateReport DedupService::Analyze() {
  const auto& cfg = ctx_.config.dedup();

  resolution::ReportOptions options;
  if (ctx_.config.database().has_sqlite()) options.source_label = ctx_.config.database().sqlite().path();
  if (cfg.report_fuzzy_threshold() > 0) options.fuzzy_threshold = cfg.report_fuzzy_threshold();
  if (!cfg.placeholder_birthday().empty()) options.placeholder_birthday = cfg.placeholder_birthday();

  const auto contacts = resolution::LoadSnapshot(*ctx_.repository);
  auto       report   = resolution::BuildDuplicateReport(contacts, options);

  if (!cfg.report_path().empty()) {
    std::ofstream out(cfg.report_path(), std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to open report file: " + cfg.report_path());
    }
    out << report.markdown;
    if (!out) {
      throw std::runtime_error("Failed to write report file: " + cfg.report_path());
    }
  }

  DEDUP_LOG_INFO("Duplicate analysis complete", {IntField("contacts", static_cast<int64_t>(contacts.size())),
                                                 IntField("signals", static_cast<int64_t>(report.signal_count)),
                                                 IntField("flagged", static_cast<int64_t>(report.flagged_contacts)),
                                                 StringField("report", cfg.report_path())});
  return report;
}

FlagResult DedupService::Flag() {
  const auto contacts = resolution::LoadSnapshot(*ctx_.repository);
  auto       scan     = resolution::FindAllDuplicates(contacts, FuzzyThreshold(ctx_.config));

  std::map<std::string, DuplicateResolution> resolutions;
  for (const auto& contact : contacts) resolutions[contact.id] = contact.duplicate.resolution;

  FlagResult result;

  auto tx = ctx_.repository->Begin();
  Check(ctx_.repository->ClearUnresolvedGroups(*tx), "clear unresolved groups");

  for (const auto& cluster : scan.clusters) {
    std::vector<std::string> unresolved;
    for (const auto& id : cluster) {
      auto it = resolutions.find(id);
      if (it != resolutions.end() && it->second == DuplicateResolution::kUnset) unresolved.push_back(id);
    }
    // reviewed contacts keep their decision
    if (unresolved.empty()) continue;

    DuplicateGroup group;
    group.group_id = util::ShortId();
    for (const auto& id : unresolved) {
      Check(ctx_.repository->SetDuplicateGroup(*tx, id, group), "flag contact " + id);
    }
    result.flagged_contacts += unresolved.size();
    ++result.groups;
  }
  tx->Commit();

  result.signals  = std::move(scan.signals);
  result.clusters = std::move(scan.clusters);

  DEDUP_LOG_INFO("Flagged duplicates", {observability::DoubleField("threshold", FuzzyThreshold(ctx_.config)),
                                        IntField("signals", static_cast<int64_t>(result.signals.size())),
                                        IntField("clusters", static_cast<int64_t>(result.clusters.size())),
                                        IntField("groups", static_cast<int64_t>(result.groups)),
                                        IntField("contacts", static_cast<int64_t>(result.flagged_contacts))});
  return result;
}

ResolveResult DedupService::Resolve() {
  ResolveResult result;
  result.contacts_before = CountContacts();

  const auto contacts = resolution::LoadSnapshot(*ctx_.repository);
  const auto scan     = resolution::FindAllDuplicates(contacts, FuzzyThreshold(ctx_.config));

  DEDUP_LOG_INFO("Resolving duplicates", {observability::DoubleField("threshold", FuzzyThreshold(ctx_.config)),
                                          IntField("signals", static_cast<int64_t>(scan.signals.size())),
                                          IntField("clusters", static_cast<int64_t>(scan.clusters.size()))});

  resolution::Merger merger(ctx_.repository);
  for (const auto& cluster : scan.clusters) {
    try {
      merger.Merge(cluster);
      ++result.merged_clusters;
    } catch (const std::exception& e) {
      ++result.failed_clusters;
      DEDUP_LOG_ERROR("Merge failed", {StringField("first_id", cluster.front()), IntField("size", static_cast<int64_t>(cluster.size())),
                                       StringField("error", e.what())});
    }
  }

  result.contacts_after = CountContacts();
  DEDUP_LOG_INFO("Resolve finished", {IntField("before", static_cast<int64_t>(result.contacts_before)),
                                      IntField("after", static_cast<int64_t>(result.contacts_after)),
                                      IntField("merged", static_cast<int64_t>(result.merged_clusters)),
                                      IntField("failed", static_cast<int64_t>(result.failed_clusters))});
  return result;
}

ResolveResult DedupService::ResolveConfirmed() {
  ResolveResult result;
  result.contacts_before = CountContacts();

  std::vector<std::pair<resolution::Cluster, std::optional<std::string>>> groups;
  {
    auto tx = ctx_.repository->Begin();
    for (const auto& group_id : ctx_.repository->ListGroupIds(*tx, DuplicateResolution::kConfirmed)) {
      const auto members = ctx_.repository->ListGroupMembers(*tx, group_id);
      if (members.size() < 2) continue;

      resolution::Cluster ids;
      for (const auto& member : members) ids.push_back(member.id);
      groups.emplace_back(std::move(ids), members.front().duplicate.primary_contact_id);
    }
    tx->Commit();
  }

  resolution::Merger merger(ctx_.repository);
  for (const auto& [ids, primary] : groups) {
    try {
      merger.Merge(ids, primary);
      ++result.merged_clusters;
    } catch (const std::exception& e) {
      ++result.failed_clusters;
      DEDUP_LOG_ERROR("Merge failed", {StringField("first_id", ids.front()), StringField("primary", primary.value_or("")),
                                       StringField("error", e.what())});
    }
  }

  result.contacts_after = CountContacts();
  DEDUP_LOG_INFO("Resolve confirmed finished", {IntField("before", static_cast<int64_t>(result.contacts_before)),
                                                IntField("after", static_cast<int64_t>(result.contacts_after)),
                                                IntField("merged", static_cast<int64_t>(result.merged_clusters)),
                                                IntField("failed", static_cast<int64_t>(result.failed_clusters))});
  return result;
}

std::vector<PendingGroup> DedupService::ListPendingGroups() {
  std::vector<PendingGroup> groups;

  auto tx = ctx_.repository->Begin();
  for (auto& group_id : ctx_.repository->ListGroupIds(*tx, DuplicateResolution::kUnset)) {
    auto members = ctx_.repository->ListGroupMembers(*tx, group_id);
    groups.push_back({std::move(group_id), std::move(members)});
  }
  tx->Commit();
  return groups;
}

void DedupService::ConfirmGroup(const std::string& group_id, const std::string& primary_contact_id) {
  auto       tx      = ctx_.repository->Begin();
  const auto members = ctx_.repository->ListGroupMembers(*tx, group_id);
  if (members.empty()) {
    throw util::NotFound("Unknown duplicate group " + group_id);
  }

  bool primary_is_member = false;
  for (const auto& member : members) primary_is_member = primary_is_member || member.id == primary_contact_id;
  if (!primary_is_member) {
    throw util::InvalidArgument("Primary ID " + primary_contact_id + " is not a member of group " + group_id);
  }

  DuplicateGroup decision{group_id, DuplicateResolution::kConfirmed, primary_contact_id};
  for (const auto& member : members) {
    Check(ctx_.repository->SetDuplicateGroup(*tx, member.id, decision), "confirm contact " + member.id);
  }
  tx->Commit();

  DEDUP_LOG_INFO("Group confirmed", {StringField("group", group_id), StringField("primary", primary_contact_id),
                                     IntField("members", static_cast<int64_t>(members.size()))});
}

void DedupService::RejectGroup(const std::string& group_id) {
  auto       tx      = ctx_.repository->Begin();
  const auto members = ctx_.repository->ListGroupMembers(*tx, group_id);
  if (members.empty()) {
    throw util::NotFound("Unknown duplicate group " + group_id);
  }

  DuplicateGroup decision{group_id, DuplicateResolution::kFalsePositive, std::nullopt};
  for (const auto& member : members) {
    Check(ctx_.repository->SetDuplicateGroup(*tx, member.id, decision), "reject contact " + member.id);
  }
  tx->Commit();

  DEDUP_LOG_INFO("Group marked false positive", {StringField("group", group_id), IntField("members", static_cast<int64_t>(members.size()))});
}

} // namespace dedup::service
