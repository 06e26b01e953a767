#include "admin_service.hpp"

#include "internal/jobs/job_registry.hpp"
#include "internal/jobs/job_runner.hpp"
#include "internal/notify/notification_hub.hpp"
#include "internal/versioning/migration_reconciler.hpp"
#include "internal/versioning/version_store.hpp"
#include "observe_rpc.hpp"

namespace artifact::service {

using namespace artifact::manager::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse AdminService::Health(const HealthRequest&) {
  HealthResponse resp;
  resp.set_status("ok");
  resp.set_ready(ctx_.runner && ctx_.runner->Accepting());
  return resp;
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("ArtifactAdminService.Stats", "", "", [&] {
    StatsResponse resp;

    uint64_t versions = 0;
    const auto heads  = ctx_.store->ListHeads();
    for (const auto& head : heads) {
      versions += head.version_count;
    }
    resp.set_artifacts(heads.size());
    resp.set_versions(versions);

    const auto counts = ctx_.registry->Counts();
    resp.set_jobs_queued(counts.queued);
    resp.set_jobs_running(counts.running);
    resp.set_jobs_completed(counts.completed);
    resp.set_jobs_failed(counts.failed);

    resp.set_realtime_subscribers(ctx_.hub->SubscriberCount());
    return resp;
  });
}

MigrationPreviewResponse AdminService::MigrationPreview(const MigrationPreviewRequest&) {
  return ObserveRpc("ArtifactAdminService.MigrationPreview", "", "", [&] { return ctx_.reconciler->Preview(); });
}

MigrateResponse AdminService::Migrate(const MigrateRequest&) {
  return ObserveRpc("ArtifactAdminService.Migrate", "", "", [&] { return ctx_.reconciler->Run(); });
}

} // namespace artifact::service
