#pragma once

#include <memory>

#include "config/config.pb.h"

namespace dedup::db { class Repository; }

namespace dedup::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dedup::db::Repository> repository;
  dedup::runtime::config::RuntimeConfig  config;
};

}
