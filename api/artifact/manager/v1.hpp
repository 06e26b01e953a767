#pragma once

#include "artifact/manager/core/v1/types.pb.h"
#include "artifact/manager/jobs/v1/job.pb.h"
#include "artifact/manager/realtime/v1/event.pb.h"
#include "artifact/manager/admin/v1/stats.pb.h"

#include "artifact/manager/services/v1/artifact_generation_service.pb.h"
#include "artifact/manager/services/v1/artifact_catalog_service.pb.h"
#include "artifact/manager/services/v1/artifact_realtime_service.pb.h"
#include "artifact/manager/services/v1/artifact_admin_service.pb.h"

#include "artifact/manager/services/v1/artifact_generation_service.grpc.pb.h"
#include "artifact/manager/services/v1/artifact_catalog_service.grpc.pb.h"
#include "artifact/manager/services/v1/artifact_realtime_service.grpc.pb.h"
#include "artifact/manager/services/v1/artifact_admin_service.grpc.pb.h"

namespace artifact::manager::v1 {
using namespace ::artifact::manager::core::v1;
using namespace ::artifact::manager::jobs::v1;
using namespace ::artifact::manager::realtime::v1;
using namespace ::artifact::manager::admin::v1;
using namespace ::artifact::manager::services::v1;
}
