#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/fingerprint/phone_number.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/json_file_source.hpp"

// read from sync fetch threads as well as the main thread
static std::atomic<bool> g_running{true};
static_assert(std::atomic<bool>::is_always_lock_free);

void HandleSignal(int) {
  g_running.store(false);
}

namespace {

void PrintUsage() {
  std::cerr << "Usage: contact-dedup --config <config.yaml> <command>\n"
               "Commands:\n"
               "  sync                              pull contacts from sync.source_path\n"
               "  analyze                           write the duplicate report\n"
               "  flag                              assign duplicate groups for review\n"
               "  review-list                       show unresolved groups\n"
               "  review-confirm <group> <primary>  confirm a group with its primary contact\n"
               "  review-reject <group>             mark a group as false positive\n"
               "  resolve [--confirmed]             merge detected clusters, or confirmed groups only\n";
}

std::string DisplayName(const dedup::db::model::ContactRecord& contact) {
  std::string name = contact.first_name.value_or("");
  if (contact.last_name && !contact.last_name->empty()) {
    if (!name.empty()) name += " ";
    name += *contact.last_name;
  }
  return name.empty() ? "(no name)" : name;
}

void PrintGroups(const std::vector<dedup::service::PendingGroup>& groups, const std::string& region) {
  if (groups.empty()) {
    std::cout << "No duplicate groups pending review." << std::endl;
    return;
  }

  for (const auto& group : groups) {
    std::cout << "Group " << group.group_id << " (" << group.members.size() << " contacts)" << std::endl;
    for (const auto& member : group.members) {
      std::cout << "  " << member.id << "  " << DisplayName(member);
      if (member.job_title && !member.job_title->empty()) std::cout << " | " << *member.job_title;
      std::cout << std::endl;
      for (const auto& email : member.emails) std::cout << "      email: " << email.email << std::endl;
      for (const auto& phone : member.phones) {
        std::cout << "      phone: " << dedup::fingerprint::FormatPhone(phone.phone_number, "INTERNATIONAL", region);
        if (!phone.label.empty()) std::cout << " (" << phone.label << ")";
        std::cout << std::endl;
      }
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      args.push_back(std::move(arg));
    }
  }

  if (config_path.empty() || args.empty()) {
    PrintUsage();
    return 1;
  }

  const auto& command = args[0];

  try {
    auto config = dedup::config::ConfigLoader::LoadFromYaml(config_path);
    dedup::observability::InitializeLogging(config);

    auto  app     = dedup::factory::Build(config);
    auto& service = *app.dedup_service;

    if (command == "sync" && args.size() == 1) {
      if (config.sync().source_path().empty()) {
        throw std::runtime_error("sync.source_path is not configured");
      }
      auto source = std::make_shared<dedup::sync::JsonFileSource>(config.sync().source_path());

      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);

      const auto stats = service.Sync(source, [] { return !g_running.load(); });
      std::cout << "added=" << stats.added << " updated=" << stats.updated << " unchanged=" << stats.unchanged
                << " failed=" << stats.failed << " skipped=" << stats.skipped << (stats.cancelled ? " (cancelled)" : "") << std::endl;
    } else if (command == "analyze" && args.size() == 1) {
      const auto report = service.Analyze();
      std::cout << "Flagged " << report.flagged_contacts << " contacts across " << report.signal_count << " signals; report written to "
                << config.dedup().report_path() << std::endl;
    } else if (command == "flag" && args.size() == 1) {
      const auto result = service.Flag();
      std::cout << "Flagged " << result.flagged_contacts << " contacts in " << result.groups << " groups" << std::endl;
    } else if (command == "review-list" && args.size() == 1) {
      PrintGroups(service.ListPendingGroups(), config.dedup().default_phone_region());
    } else if (command == "review-confirm" && args.size() == 3) {
      service.ConfirmGroup(args[1], args[2]);
      std::cout << "Confirmed group " << args[1] << " with primary " << args[2] << std::endl;
    } else if (command == "review-reject" && args.size() == 2) {
      service.RejectGroup(args[1]);
      std::cout << "Marked group " << args[1] << " as false positive" << std::endl;
    } else if (command == "resolve" && (args.size() == 1 || (args.size() == 2 && args[1] == "--confirmed"))) {
      const auto result = args.size() == 2 ? service.ResolveConfirmed() : service.Resolve();
      std::cout << "Contacts before: " << result.contacts_before << ", after: " << result.contacts_after << " (merged "
                << result.merged_clusters << ", failed " << result.failed_clusters << ")" << std::endl;
    } else {
      PrintUsage();
      dedup::observability::ShutdownLogging();
      return 1;
    }

    dedup::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DEDUP_LOG_ERROR("Fatal error", {dedup::observability::StringField("error", e.what()), dedup::observability::StringField("command", command)});
    dedup::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
