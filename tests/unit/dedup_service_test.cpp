#include "internal/service/dedup_service.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/sync/json_file_source.hpp"
#include "internal/util/errors.hpp"

namespace {

using dedup::db::Repository;
using dedup::db::model::ContactRecord;
using dedup::db::model::DuplicateResolution;
using dedup::service::DedupService;
using dedup::service::ServiceContext;

std::filesystem::path TempDir() {
  const auto dir = std::filesystem::temp_directory_path() / "contact_dedup_service_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

struct Fixture {
  std::shared_ptr<Repository>   repo;
  std::unique_ptr<DedupService> service;
};

Fixture MakeFixture(const std::string& report_name = "report.md") {
  Fixture fixture;
  fixture.repo = std::make_shared<dedup::db::memory::MemoryRepository>();

  ServiceContext ctx;
  ctx.repository = fixture.repo;
  ctx.config.mutable_dedup()->set_report_path((TempDir() / report_name).string());
  dedup::config::ConfigLoader::ApplyDefaults(ctx.config);

  fixture.service = std::make_unique<DedupService>(std::move(ctx));
  return fixture;
}

void Seed(Repository& repo, const std::string& id, const std::string& first, const std::string& last, const std::string& title,
          const std::vector<std::string>& emails) {
  ContactRecord contact;
  contact.id         = id;
  contact.first_name = first;
  contact.last_name  = last;
  if (!title.empty()) contact.job_title = title;

  auto tx = repo.Begin();
  assert(repo.UpsertContact(*tx, contact));
  assert(repo.ReplaceEmails(*tx, id, emails));
  tx->Commit();
}

// c1/c2 share an email, c3/c4 share name and title, c5 stands alone.
void SeedDefault(Repository& repo) {
  Seed(repo, "c1", "John", "Doe", "", {"john@x.com"});
  Seed(repo, "c2", "Johnny", "Doe-Smith", "", {"JOHN@x.com"});
  Seed(repo, "c3", "Ann", "Lee", "CTO", {});
  Seed(repo, "c4", "Ann", "Lee", "CTO", {"ann@x.com"});
  Seed(repo, "c5", "Zed", "Zulu", "", {"zed@x.com"});
}

std::optional<ContactRecord> Load(Repository& repo, const std::string& id) {
  auto tx      = repo.Begin();
  auto contact = repo.GetContact(*tx, id);
  tx->Commit();
  return contact;
}

std::set<std::string> MemberIds(const dedup::service::PendingGroup& group) {
  std::set<std::string> ids;
  for (const auto& member : group.members) ids.insert(member.id);
  return ids;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestFlagAssignsOneGroupPerCluster() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);

  const auto result = fixture.service->Flag();
  assert(result.clusters.size() == 2);
  assert(result.groups == 2);
  assert(result.flagged_contacts == 4);

  const auto pending = fixture.service->ListPendingGroups();
  assert(pending.size() == 2);

  std::set<std::set<std::string>> partitions;
  for (const auto& group : pending) {
    assert(group.group_id.size() == 8);
    for (const auto& member : group.members) assert(member.duplicate.group_id == group.group_id);
    partitions.insert(MemberIds(group));
  }
  assert(partitions.contains({"c1", "c2"}));
  assert(partitions.contains({"c3", "c4"}));

  assert(!Load(*fixture.repo, "c5")->duplicate.group_id.has_value());
}

void TestReflagReplacesUnresolvedGroups() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);

  fixture.service->Flag();
  const auto before = Load(*fixture.repo, "c1")->duplicate.group_id;

  fixture.service->Flag();
  const auto after = Load(*fixture.repo, "c1")->duplicate.group_id;
  assert(before.has_value() && after.has_value());
  assert(fixture.service->ListPendingGroups().size() == 2);
}

void TestConfirmValidatesInput() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);
  fixture.service->Flag();

  const auto group = *Load(*fixture.repo, "c1")->duplicate.group_id;
  assert(Throws<dedup::util::NotFound>([&] { fixture.service->ConfirmGroup("missing", "c1"); }));
  assert(Throws<dedup::util::InvalidArgument>([&] { fixture.service->ConfirmGroup(group, "c5"); }));
  assert(Throws<dedup::util::NotFound>([&] { fixture.service->RejectGroup("missing"); }));
}

void TestConfirmedGroupsSurviveReflag() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);
  fixture.service->Flag();

  const auto group = *Load(*fixture.repo, "c1")->duplicate.group_id;
  fixture.service->ConfirmGroup(group, "c2");

  for (const auto* id : {"c1", "c2"}) {
    const auto contact = Load(*fixture.repo, id);
    assert(contact->duplicate.resolution == DuplicateResolution::kConfirmed);
    assert(contact->duplicate.primary_contact_id == std::optional<std::string>("c2"));
    assert(contact->duplicate.group_id == std::optional<std::string>(group));
  }

  const auto pending = fixture.service->ListPendingGroups();
  assert(pending.size() == 1);
  assert(MemberIds(pending[0]) == std::set<std::string>({"c3", "c4"}));

  const auto reflag = fixture.service->Flag();
  assert(reflag.groups == 1);
  assert(Load(*fixture.repo, "c1")->duplicate.group_id == std::optional<std::string>(group));
}

void TestRejectMarksFalsePositive() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);
  fixture.service->Flag();

  const auto group = *Load(*fixture.repo, "c3")->duplicate.group_id;
  fixture.service->RejectGroup(group);

  const auto contact = Load(*fixture.repo, "c4");
  assert(contact->duplicate.resolution == DuplicateResolution::kFalsePositive);
  assert(!contact->duplicate.primary_contact_id.has_value());
  assert(fixture.service->ListPendingGroups().size() == 1);
}

void TestResolveConfirmedMergesIntoChosenPrimary() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);
  fixture.service->Flag();

  const auto group = *Load(*fixture.repo, "c1")->duplicate.group_id;
  fixture.service->ConfirmGroup(group, "c2");

  const auto result = fixture.service->ResolveConfirmed();
  assert(result.contacts_before == 5);
  assert(result.contacts_after == 4);
  assert(result.merged_clusters == 1);
  assert(result.failed_clusters == 0);

  assert(!Load(*fixture.repo, "c1").has_value());
  const auto primary = Load(*fixture.repo, "c2");
  assert(primary.has_value());
  assert(primary->emails.size() == 1);

  // the surviving contact is alone in its group now
  assert(fixture.service->ResolveConfirmed().merged_clusters == 0);
}

void TestResolveMergesEveryCluster() {
  auto fixture = MakeFixture();
  SeedDefault(*fixture.repo);

  const auto result = fixture.service->Resolve();
  assert(result.contacts_before == 5);
  assert(result.contacts_after == 3);
  assert(result.merged_clusters == 2);

  // equally complete members keep the smallest id
  assert(Load(*fixture.repo, "c1").has_value());
  assert(Load(*fixture.repo, "c3").has_value());
  assert(!Load(*fixture.repo, "c4").has_value());
  assert(Load(*fixture.repo, "c3")->emails.size() == 1);

  const auto again = fixture.service->Resolve();
  assert(again.contacts_before == again.contacts_after);
}

void TestAnalyzeWritesReport() {
  auto fixture = MakeFixture("analyze.md");
  SeedDefault(*fixture.repo);

  const auto report = fixture.service->Analyze();
  assert(report.flagged_contacts == 4);
  assert(report.markdown.find("# Comprehensive Duplicate Contact Report") == 0);
  assert(report.markdown.find("**Total Flagged Contacts:** 4") != std::string::npos);
  assert(report.markdown.find("### Email: `john@x.com`") != std::string::npos);
  assert(report.markdown.find("| `c3` | Ann Lee | CTO |") != std::string::npos);
  assert(report.markdown.find("_No shared phone numbers found._") != std::string::npos);

  std::ifstream      in(TempDir() / "analyze.md");
  std::ostringstream written;
  written << in.rdbuf();
  assert(written.str() == report.markdown);
}

void TestSyncThroughService() {
  const auto path = TempDir() / "contacts.json";
  {
    std::ofstream out(path);
    out << R"({"contacts": [
      {"id": "s1", "first_name": "Tom", "last_name": "Cruise", "emails": [{"email": "tom@x.com"}]},
      {"id": "s2", "first_name": "Cruise", "last_name": "Tom", "emails": [{"email": "TOM@x.com"}]},
      {"first_name": "No", "last_name": "Id"}
    ]})";
  }

  auto fixture = MakeFixture();
  auto source  = std::make_shared<dedup::sync::JsonFileSource>(path.string());

  const auto first = fixture.service->Sync(source);
  assert(first.added == 2);
  assert(first.skipped == 1);

  const auto second = fixture.service->Sync(source);
  assert(second.unchanged == 2);

  const auto flagged = fixture.service->Flag();
  assert(flagged.groups == 1);
  assert(flagged.flagged_contacts == 2);
}

} // namespace

int main() {
  TestFlagAssignsOneGroupPerCluster();
  TestReflagReplacesUnresolvedGroups();
  TestConfirmValidatesInput();
  TestConfirmedGroupsSurviveReflag();
  TestRejectMarksFalsePositive();
  TestResolveConfirmedMergesIntoChosenPrimary();
  TestResolveMergesEveryCluster();
  TestAnalyzeWritesReport();
  TestSyncThroughService();

  std::cout << "dedup_unit_dedup_service: pass\n";
  return 0;
}
