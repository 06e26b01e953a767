#pragma once

#include <memory>

namespace artifact::versioning {
class VersionStore;
class MigrationReconciler;
} // namespace artifact::versioning
namespace artifact::jobs {
class JobRegistry;
class JobRunner;
} // namespace artifact::jobs
namespace artifact::generation {
class GeneratorRegistry;
}
namespace artifact::notify {
class NotificationHub;
}

namespace artifact::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<artifact::versioning::VersionStore>        store;
  std::shared_ptr<artifact::versioning::MigrationReconciler> reconciler;
  std::shared_ptr<artifact::jobs::JobRegistry>               registry;
  std::shared_ptr<artifact::jobs::JobRunner>                 runner;
  std::shared_ptr<artifact::generation::GeneratorRegistry>   generators;
  std::shared_ptr<artifact::notify::NotificationHub>         hub;
};

} // namespace artifact::service
