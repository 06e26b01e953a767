#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/jsondir/json_dir_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/generation/generator_registry.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/generation_server.hpp"
#include "internal/grpc/realtime_server.hpp"
#include "internal/jobs/job_registry.hpp"
#include "internal/jobs/job_runner.hpp"
#include "internal/notify/notification_hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/realtime_service.hpp"
#include "internal/versioning/migration_reconciler.hpp"
#include "internal/versioning/version_store.hpp"
#if ARTIFACT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if ARTIFACT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace artifact::factory {

using namespace artifact;
using artifact::observability::IntField;
using artifact::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const artifact::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ARTIFACT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    ARTIFACT_LOG_INFO("Using sqlite version store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ARTIFACT_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    db::postgres::BootstrapSchema(*pool);
    ARTIFACT_LOG_INFO("Using postgres version store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_json_dir()) {
    ARTIFACT_LOG_INFO("Using json directory version store", {StringField("path", database.json_dir().path())});
    return std::make_shared<db::jsondir::JsonDirRepository>(database.json_dir().path());
  }

  ARTIFACT_LOG_WARN("Using in-memory version store; versions are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const artifact::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Version store
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto store      = std::make_shared<versioning::VersionStore>(repository);
  store->Hydrate();

  auto reconciler = std::make_shared<versioning::MigrationReconciler>(store);
  if (config.migration().run_on_startup()) {
    const auto report = reconciler->Run();
    ARTIFACT_LOG_INFO("Startup migration finished",
                      {IntField("groups_migrated", static_cast<int64_t>(report.groups_migrated())),
                       IntField("versions_migrated", static_cast<int64_t>(report.versions_migrated())),
                       IntField("groups_skipped", static_cast<int64_t>(report.groups_skipped()))});
  }

  // ------------------------------------------------------------------
  // Jobs
  // ------------------------------------------------------------------
  auto registry   = std::make_shared<jobs::JobRegistry>();
  auto generators = generation::GeneratorRegistry::FromConfig(config.generation());
  auto hub        = std::make_shared<notify::NotificationHub>();

  jobs::JobRunnerOptions options;
  options.worker_threads    = config.jobs().worker_threads();
  options.max_request_bytes = config.jobs().max_request_bytes();

  auto runner = std::make_shared<jobs::JobRunner>(registry, store, generators, hub, options);
  runner->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store      = store;
  ctx.reconciler = reconciler;
  ctx.registry   = registry;
  ctx.runner     = runner;
  ctx.generators = generators;
  ctx.hub        = hub;

  auto generation_service = std::make_shared<service::GenerationService>(ctx);
  auto catalog_service    = std::make_shared<service::CatalogService>(ctx);
  auto realtime_service   = std::make_shared<service::RealtimeService>(ctx);
  auto admin_service      = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::GenerationServer>(generation_service));
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(catalog_service));
  app.grpc_services.push_back(std::make_unique<grpc::RealtimeServer>(realtime_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.context = std::move(ctx);
  return app;
}

} // namespace artifact::factory
