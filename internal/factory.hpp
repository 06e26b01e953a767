#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace artifact::factory {

/*
  Application

  Everything the server needs for the lifetime of the process. The job
  runner is already started; call runner->Stop() after the transport is
  down so queued jobs finish.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  artifact::service::ServiceContext             context;
};

/*
  Composition root. The ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<artifact::db::Repository> BuildRepository(const artifact::runtime::config::RuntimeConfig& config);

Application Build(const artifact::runtime::config::RuntimeConfig& config);

} // namespace artifact::factory
