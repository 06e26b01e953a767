#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "artifact/manager/v1.hpp"
#include "internal/service/realtime_service.hpp"

namespace artifact::grpc {

constexpr const char* kChannelMetadataKey = "x-artifact-channel";

/*
  Bidirectional realtime stream.

  A reader thread answers client messages while the handler thread writes
  queued events. The stream ends when the client half-closes, the call is
  cancelled, or a write fails.
*/
class RealtimeServer final : public artifact::manager::v1::ArtifactRealtimeService::Service {
 public:
  explicit RealtimeServer(std::shared_ptr<artifact::service::RealtimeService> svc);

  ::grpc::Status Connect(::grpc::ServerContext* ctx,
                         ::grpc::ServerReaderWriter<artifact::manager::v1::Event, artifact::manager::v1::ClientMessage>* stream) override;

  static std::string ChannelFrom(const ::grpc::ServerContext& ctx);

 private:
  std::shared_ptr<artifact::service::RealtimeService> service_;
};

} // namespace artifact::grpc
