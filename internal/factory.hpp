#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/dedup_service.hpp"

namespace dedup::factory {

/*
  Application

  Owns all long-lived objects used by the runner.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<service::DedupService>  dedup_service;
};

/*
  BuildRepository

  SQLite when configured (schema bootstrapped on open), memory otherwise.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const dedup::runtime::config::RuntimeConfig& config);

// Composition root.
Application Build(const dedup::runtime::config::RuntimeConfig& config);

} // namespace dedup::factory
