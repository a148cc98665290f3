#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/backup/backup_scheduler.hpp"
#include "internal/backup/backup_worker.hpp"
#include "internal/core/nutrition_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/backup_service.hpp"

namespace nutrition::factory {

/*
  Application

  Owns all long-lived objects of the process. The backup worker is
  stopped, after draining its queue, when the Application is destroyed.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<core::NutritionStore>    store;
  std::shared_ptr<backup::BackupScheduler> backup_scheduler;
  std::shared_ptr<service::BackupService>  backup_service;
  // last member: joined before the service its tasks point at goes away
  std::shared_ptr<backup::BackupWorker> backup_worker;
};

/*
  Build

  Constructs the whole backend from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const nutrition::runtime::config::RuntimeConfig& config);

// Exposed for tests that want a bare repository for a given config.
std::shared_ptr<db::Repository> BuildRepository(const nutrition::runtime::config::RuntimeConfig& config);

core::StoreOptions StoreOptionsFromConfig(const nutrition::runtime::config::RuntimeConfig& config);

} // namespace nutrition::factory
