#include "realtime_service.hpp"

#include "internal/observability/logging.hpp"
#include "observe_rpc.hpp"

namespace artifact::service {

using artifact::notify::NotificationHub;
using artifact::observability::StringField;

RealtimeService::RealtimeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

NotificationHub::SubscriptionId RealtimeService::Open(const std::string& channel, NotificationHub::Listener listener) {
  return ObserveRpc("ArtifactRealtimeService.Connect", "channel", channel, [&] {
    const auto id = ctx_.hub->Subscribe(channel.empty() ? artifact::notify::kDefaultChannel : channel, std::move(listener));
    ARTIFACT_LOG_INFO("Realtime connection opened", {StringField("channel", channel)});
    return id;
  });
}

void RealtimeService::Close(NotificationHub::SubscriptionId id) {
  ctx_.hub->Unsubscribe(id);
}

artifact::manager::v1::Event RealtimeService::Handle(const std::string& channel, const artifact::manager::v1::ClientMessage& message) {
  auto reply = ctx_.hub->HandleClientMessage(channel, message);
  if (reply.type() == artifact::notify::events::kError) {
    ARTIFACT_LOG_WARN("Unsupported realtime message", {StringField("channel", channel), StringField("type", message.type())});
  }
  return reply;
}

std::size_t RealtimeService::Subscribers() const {
  return ctx_.hub->SubscriberCount();
}

} // namespace artifact::service
